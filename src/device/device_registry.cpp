/**
 * @copyright Copyright The DevMgr Contributors
 */

#include "device_registry.hpp"

#include <etl/to_string.h>

#include <algorithm>
#include <bit>
#include <utility>

#include "kernel_log.hpp"

auto DeviceRecord::MakeView() const -> DeviceView {
  DeviceView view{};
  view.id = descriptor.id;
  view.device_class = device_class;
  view.state = GetState();
  view.failure = failure;
  view.grant = grant;
  view.name = name;
  view.descriptor = descriptor;
  return view;
}

auto DeviceRegistry::FindLocked(DeviceId id) -> RecordTable::iterator {
  return std::find_if(records_.begin(), records_.end(),
                      [id](const etl::unique_ptr<DeviceRecord>& record) {
                        return record->descriptor.id == id;
                      });
}

auto DeviceRegistry::FindLocked(DeviceId id) const
    -> RecordTable::const_iterator {
  return std::find_if(records_.cbegin(), records_.cend(),
                      [id](const etl::unique_ptr<DeviceRecord>& record) {
                        return record->descriptor.id == id;
                      });
}

auto DeviceRegistry::AssignName(DeviceRecord& record) -> void {
  auto& slots = instance_slots_[static_cast<size_t>(record.device_class)];
  // 注册表容量不超过位图宽度，总能找到空闲编号
  auto index = static_cast<size_t>(std::countr_one(slots));
  slots |= 1ULL << index;
  record.instance = index;
  record.name = DeviceClassPrefix(record.device_class);
  etl::to_string(index, record.name, true);
}

auto DeviceRegistry::ReleaseName(const DeviceRecord& record) -> void {
  instance_slots_[static_cast<size_t>(record.device_class)] &=
      ~(1ULL << record.instance);
}

auto DeviceRegistry::Insert(etl::unique_ptr<DeviceRecord>&& record)
    -> Expected<DeviceView> {
  auto state = record->GetState();
  if (state != DeviceState::kReady && state != DeviceState::kFailed) {
    klog::Err("DeviceRegistry: refusing record in state %s\n",
              DeviceStateName(state));
    return std::unexpected(Error(ErrorCode::kDeviceInvalidState));
  }

  LockGuard guard(lock_);
  if (FindLocked(record->descriptor.id) != records_.end()) {
    return std::unexpected(Error(ErrorCode::kDeviceAlreadyExists));
  }
  if (records_.full()) {
    return std::unexpected(Error(ErrorCode::kDeviceRegistryFull));
  }

  AssignName(*record);
  auto view = record->MakeView();
  records_.push_back(std::move(record));

  klog::Debug("DeviceRegistry: %s inserted as %s\n", view.name.c_str(),
              DeviceStateName(view.state));
  return view;
}

auto DeviceRegistry::Contains(DeviceId id) const -> bool {
  LockGuard guard(lock_);
  return FindLocked(id) != records_.cend();
}

auto DeviceRegistry::Find(DeviceId id) const -> Expected<DeviceView> {
  LockGuard guard(lock_);
  auto it = FindLocked(id);
  if (it == records_.cend()) {
    return std::unexpected(Error(ErrorCode::kDeviceNotFound));
  }
  return (*it)->MakeView();
}

auto DeviceRegistry::List(DeviceView* out, size_t max) const -> size_t {
  LockGuard guard(lock_);
  size_t found = 0;
  for (auto it = records_.cbegin(); it != records_.cend() && found < max;
       ++it) {
    out[found++] = (*it)->MakeView();
  }
  return found;
}

auto DeviceRegistry::ListByClass(DeviceClass device_class, DeviceView* out,
                                 size_t max) const -> size_t {
  LockGuard guard(lock_);
  size_t found = 0;
  for (auto it = records_.cbegin(); it != records_.cend() && found < max;
       ++it) {
    if ((*it)->device_class == device_class) {
      out[found++] = (*it)->MakeView();
    }
  }
  return found;
}

auto DeviceRegistry::ListIds(BusFamily family, DeviceId* out,
                             size_t max) const -> size_t {
  LockGuard guard(lock_);
  size_t found = 0;
  for (auto it = records_.cbegin(); it != records_.cend() && found < max;
       ++it) {
    if ((*it)->descriptor.id.family == family) {
      out[found++] = (*it)->descriptor.id;
    }
  }
  return found;
}

auto DeviceRegistry::ListIds(DeviceId* out, size_t max) const -> size_t {
  LockGuard guard(lock_);
  size_t found = 0;
  for (auto it = records_.cbegin(); it != records_.cend() && found < max;
       ++it) {
    out[found++] = (*it)->descriptor.id;
  }
  return found;
}

auto DeviceRegistry::Count() const -> size_t {
  LockGuard guard(lock_);
  return records_.size();
}

auto DeviceRegistry::IsFull() const -> bool {
  LockGuard guard(lock_);
  return records_.full();
}

auto DeviceRegistry::ReplaceDescriptor(const RawDeviceDescriptor& descriptor)
    -> Expected<void> {
  LockGuard guard(lock_);
  auto it = FindLocked(descriptor.id);
  if (it == records_.end()) {
    return std::unexpected(Error(ErrorCode::kDeviceNotFound));
  }
  auto state = (*it)->GetState();
  if (state != DeviceState::kReady && state != DeviceState::kFailed) {
    return std::unexpected(Error(ErrorCode::kDeviceInvalidState));
  }
  (*it)->descriptor = descriptor;
  return {};
}

auto DeviceRegistry::BeginRemoval(DeviceId id) -> Expected<Device*> {
  LockGuard guard(lock_);
  auto it = FindLocked(id);
  if (it == records_.end()) {
    return std::unexpected(Error(ErrorCode::kDeviceNotFound));
  }

  auto& record = **it;
  switch (record.GetState()) {
    case DeviceState::kReady:
      record.fsm.Receive(MsgRemove{});
      klog::Debug("DeviceRegistry: %s -> Removing\n", record.name.c_str());
      return record.driver.get();
    case DeviceState::kFailed:
      return nullptr;
    default:
      klog::Warn("DeviceRegistry: %s cannot be removed in state %s\n",
                 record.name.c_str(), DeviceStateName(record.GetState()));
      return std::unexpected(Error(ErrorCode::kDeviceInvalidState));
  }
}

auto DeviceRegistry::CompleteRemoval(DeviceId id, bool clean,
                                     ResourceArbiter& arbiter)
    -> Expected<void> {
  // 在锁释放后析构，驱动析构函数不在锁内运行
  etl::unique_ptr<DeviceRecord> evicted;
  Expected<void> released{};

  {
    LockGuard guard(lock_);
    auto it = FindLocked(id);
    if (it == records_.end()) {
      return std::unexpected(Error(ErrorCode::kDeviceNotFound));
    }

    auto& record = **it;
    auto state = record.GetState();
    if (state == DeviceState::kRemoving) {
      record.fsm.Receive(MsgShutdownDone{clean});
      if (record.grant.IsValid()) {
        released = arbiter.Release(record.grant);
        record.grant = ResourceGrant{};
      }
    } else if (state != DeviceState::kFailed) {
      return std::unexpected(Error(ErrorCode::kDeviceInvalidState));
    }

    record.fsm.Receive(MsgEvict{});
    ReleaseName(record);
    klog::Debug("DeviceRegistry: %s evicted\n", record.name.c_str());
    evicted = std::move(*it);
    records_.erase(it);
  }

  return released;
}
