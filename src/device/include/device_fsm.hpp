/** @copyright Copyright The DevMgr Contributors */

#ifndef DEVMGR_SRC_DEVICE_INCLUDE_DEVICE_FSM_HPP_
#define DEVMGR_SRC_DEVICE_INCLUDE_DEVICE_FSM_HPP_

#include <etl/fsm.h>

#include "device_messages.hpp"
#include "device_types.hpp"

/// 设备状态 ID：用作 etl::fsm 的状态 ID
enum DeviceStateId : uint8_t {
  kDiscovered = static_cast<uint8_t>(DeviceState::kDiscovered),
  kResourceReserved = static_cast<uint8_t>(DeviceState::kResourceReserved),
  kInitializing = static_cast<uint8_t>(DeviceState::kInitializing),
  kReady = static_cast<uint8_t>(DeviceState::kReady),
  kFailed = static_cast<uint8_t>(DeviceState::kFailed),
  kRemoving = static_cast<uint8_t>(DeviceState::kRemoving),
  kDestroyed = static_cast<uint8_t>(DeviceState::kDestroyed),
};

/// 状态 Discovered，总线已报告，尚未申请资源
struct StateDiscovered
    : public etl::fsm_state<etl::fsm, StateDiscovered,
                            DeviceStateId::kDiscovered, MsgResourcesGranted,
                            MsgResourcesDenied> {
  auto on_event(const MsgResourcesGranted& msg) -> etl::fsm_state_id_t;
  auto on_event(const MsgResourcesDenied& msg) -> etl::fsm_state_id_t;
  auto on_event_unknown(const etl::imessage& msg) -> etl::fsm_state_id_t;
};

/// 状态 ResourceReserved，已持有资源授予，等待初始化
struct StateResourceReserved
    : public etl::fsm_state<etl::fsm, StateResourceReserved,
                            DeviceStateId::kResourceReserved, MsgInitStart,
                            MsgInitFailed> {
  auto on_event(const MsgInitStart& msg) -> etl::fsm_state_id_t;
  /// 驱动工厂构造失败
  auto on_event(const MsgInitFailed& msg) -> etl::fsm_state_id_t;
  auto on_event_unknown(const etl::imessage& msg) -> etl::fsm_state_id_t;
};

/// 状态 Initializing，驱动 Init() 执行中
struct StateInitializing
    : public etl::fsm_state<etl::fsm, StateInitializing,
                            DeviceStateId::kInitializing, MsgInitDone,
                            MsgInitFailed> {
  auto on_event(const MsgInitDone& msg) -> etl::fsm_state_id_t;
  auto on_event(const MsgInitFailed& msg) -> etl::fsm_state_id_t;
  auto on_event_unknown(const etl::imessage& msg) -> etl::fsm_state_id_t;
};

/// 状态 Ready，设备可用
struct StateReady : public etl::fsm_state<etl::fsm, StateReady,
                                          DeviceStateId::kReady, MsgRemove> {
  auto on_event(const MsgRemove& msg) -> etl::fsm_state_id_t;
  auto on_event_unknown(const etl::imessage& msg) -> etl::fsm_state_id_t;
};

/// 状态 Failed，终态，资源已释放，等待驱逐
struct StateFailed : public etl::fsm_state<etl::fsm, StateFailed,
                                           DeviceStateId::kFailed, MsgEvict> {
  auto on_event(const MsgEvict& msg) -> etl::fsm_state_id_t;
  auto on_event_unknown(const etl::imessage& msg) -> etl::fsm_state_id_t;
};

/// 状态 Removing，驱动 Shutdown() 执行中
struct StateRemoving
    : public etl::fsm_state<etl::fsm, StateRemoving, DeviceStateId::kRemoving,
                            MsgShutdownDone> {
  auto on_event(const MsgShutdownDone& msg) -> etl::fsm_state_id_t;
  auto on_event_unknown(const etl::imessage& msg) -> etl::fsm_state_id_t;
};

/// 状态 Destroyed，终态，等待驱逐
struct StateDestroyed
    : public etl::fsm_state<etl::fsm, StateDestroyed,
                            DeviceStateId::kDestroyed, MsgEvict> {
  auto on_event(const MsgEvict& msg) -> etl::fsm_state_id_t;
  auto on_event_unknown(const etl::imessage& msg) -> etl::fsm_state_id_t;
};

/**
 * @brief 设备生命周期状态机
 * @note  不可复制、不可移动，记录通过 etl::unique_ptr 持有以保证地址稳定
 */
class DeviceFsm {
 public:
  DeviceFsm();

  /// 启动 FSM，进入 Discovered
  void Start();

  /// 向 FSM 发送消息
  void Receive(const etl::imessage& msg);

  /// 获取当前状态 ID
  [[nodiscard]] auto GetStateId() const -> etl::fsm_state_id_t;

  /// 获取当前状态
  [[nodiscard]] auto GetState() const -> DeviceState {
    return static_cast<DeviceState>(GetStateId());
  }

  /// @name 构造/析构函数
  /// @{
  DeviceFsm(const DeviceFsm&) = delete;
  DeviceFsm(DeviceFsm&&) = delete;
  auto operator=(const DeviceFsm&) -> DeviceFsm& = delete;
  auto operator=(DeviceFsm&&) -> DeviceFsm& = delete;
  ~DeviceFsm() = default;
  /// @}

 private:
  static constexpr size_t kStateCount = 7;

  StateDiscovered state_discovered_;
  StateResourceReserved state_resource_reserved_;
  StateInitializing state_initializing_;
  StateReady state_ready_;
  StateFailed state_failed_;
  StateRemoving state_removing_;
  StateDestroyed state_destroyed_;

  etl::ifsm_state* state_list_[kStateCount];

  etl::fsm fsm_;
};

#endif  // DEVMGR_SRC_DEVICE_INCLUDE_DEVICE_FSM_HPP_
