/**
 * @copyright Copyright The DevMgr Contributors
 * @brief Device FSM implementation: etl::fsm state transition bodies
 */

#include "device_fsm.hpp"

#include "kernel_log.hpp"

// ─── StateDiscovered ─────────────────────────────────────────────────────────

auto StateDiscovered::on_event(const MsgResourcesGranted& /*msg*/)
    -> etl::fsm_state_id_t {
  return DeviceStateId::kResourceReserved;
}

auto StateDiscovered::on_event(const MsgResourcesDenied& msg)
    -> etl::fsm_state_id_t {
  klog::Debug("DeviceFsm: resources denied: %s\n",
              GetErrorMessage(msg.reason));
  return DeviceStateId::kFailed;
}

auto StateDiscovered::on_event_unknown(const etl::imessage& msg)
    -> etl::fsm_state_id_t {
  klog::Warn("DeviceFsm: Discovered received unexpected message id=%d\n",
             static_cast<int>(msg.get_message_id()));
  return STATE_ID;
}

// ─── StateResourceReserved ───────────────────────────────────────────────────

auto StateResourceReserved::on_event(const MsgInitStart& /*msg*/)
    -> etl::fsm_state_id_t {
  return DeviceStateId::kInitializing;
}

auto StateResourceReserved::on_event(const MsgInitFailed& msg)
    -> etl::fsm_state_id_t {
  klog::Debug("DeviceFsm: driver construction failed: %s\n",
              GetErrorMessage(msg.reason));
  return DeviceStateId::kFailed;
}

auto StateResourceReserved::on_event_unknown(const etl::imessage& msg)
    -> etl::fsm_state_id_t {
  klog::Warn(
      "DeviceFsm: ResourceReserved received unexpected message id=%d\n",
      static_cast<int>(msg.get_message_id()));
  return STATE_ID;
}

// ─── StateInitializing ───────────────────────────────────────────────────────

auto StateInitializing::on_event(const MsgInitDone& /*msg*/)
    -> etl::fsm_state_id_t {
  return DeviceStateId::kReady;
}

auto StateInitializing::on_event(const MsgInitFailed& msg)
    -> etl::fsm_state_id_t {
  klog::Debug("DeviceFsm: init failed: %s\n", GetErrorMessage(msg.reason));
  return DeviceStateId::kFailed;
}

auto StateInitializing::on_event_unknown(const etl::imessage& msg)
    -> etl::fsm_state_id_t {
  klog::Warn("DeviceFsm: Initializing received unexpected message id=%d\n",
             static_cast<int>(msg.get_message_id()));
  return STATE_ID;
}

// ─── StateReady ──────────────────────────────────────────────────────────────

auto StateReady::on_event(const MsgRemove& /*msg*/) -> etl::fsm_state_id_t {
  return DeviceStateId::kRemoving;
}

auto StateReady::on_event_unknown(const etl::imessage& msg)
    -> etl::fsm_state_id_t {
  klog::Warn("DeviceFsm: Ready received unexpected message id=%d\n",
             static_cast<int>(msg.get_message_id()));
  return STATE_ID;
}

// ─── StateFailed ─────────────────────────────────────────────────────────────

auto StateFailed::on_event(const MsgEvict& /*msg*/) -> etl::fsm_state_id_t {
  return STATE_ID;
}

auto StateFailed::on_event_unknown(const etl::imessage& msg)
    -> etl::fsm_state_id_t {
  klog::Warn("DeviceFsm: Failed received unexpected message id=%d\n",
             static_cast<int>(msg.get_message_id()));
  return STATE_ID;
}

// ─── StateRemoving ───────────────────────────────────────────────────────────

auto StateRemoving::on_event(const MsgShutdownDone& msg)
    -> etl::fsm_state_id_t {
  if (!msg.clean) {
    klog::Debug("DeviceFsm: shutdown reported failure\n");
  }
  return DeviceStateId::kDestroyed;
}

auto StateRemoving::on_event_unknown(const etl::imessage& msg)
    -> etl::fsm_state_id_t {
  klog::Warn("DeviceFsm: Removing received unexpected message id=%d\n",
             static_cast<int>(msg.get_message_id()));
  return STATE_ID;
}

// ─── StateDestroyed ──────────────────────────────────────────────────────────

auto StateDestroyed::on_event(const MsgEvict& /*msg*/) -> etl::fsm_state_id_t {
  return STATE_ID;
}

auto StateDestroyed::on_event_unknown(const etl::imessage& msg)
    -> etl::fsm_state_id_t {
  klog::Warn("DeviceFsm: Destroyed received unexpected message id=%d\n",
             static_cast<int>(msg.get_message_id()));
  return STATE_ID;
}

// ─── DeviceFsm ───────────────────────────────────────────────────────────────

DeviceFsm::DeviceFsm() : fsm_(router_id::kDeviceFsm) {
  state_list_[0] = &state_discovered_;
  state_list_[1] = &state_resource_reserved_;
  state_list_[2] = &state_initializing_;
  state_list_[3] = &state_ready_;
  state_list_[4] = &state_failed_;
  state_list_[5] = &state_removing_;
  state_list_[6] = &state_destroyed_;
  fsm_.set_states(state_list_, kStateCount);
}

void DeviceFsm::Start() { fsm_.start(); }

void DeviceFsm::Receive(const etl::imessage& msg) { fsm_.receive(msg); }

auto DeviceFsm::GetStateId() const -> etl::fsm_state_id_t {
  return fsm_.get_state_id();
}
