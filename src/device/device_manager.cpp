/**
 * @copyright Copyright The DevMgr Contributors
 */

#include "device_manager.hpp"

#include <utility>

#include "device.hpp"
#include "sk_assert.h"

auto DeviceManager::EnumerateBus(BusFamily family, RawDeviceDescriptor* out,
                                 size_t max) -> Expected<size_t> {
  EnumerateFunction enumerate;
  {
    LockGuard guard(bus_lock_);
    for (const auto& entry : buses_) {
      if (entry.family == family) {
        enumerate = entry.enumerate;
        break;
      }
    }
  }
  if (!enumerate.is_valid()) {
    return std::unexpected(Error(ErrorCode::kBusNotRegistered));
  }
  return enumerate(out, max);
}

auto DeviceManager::ReportEnumerationError(const BusEntry& bus,
                                           const Error& error) -> void {
  switch (error.code) {
    case ErrorCode::kBusNotPresent:
      klog::Info("DeviceManager: bus '%s' not present\n", bus.name);
      break;
    case ErrorCode::kProbeTimeout:
      klog::Warn("DeviceManager: bus '%s' probe timed out, will retry\n",
                 bus.name);
      hotplug_.ScheduleRetry(bus.family);
      break;
    default:
      klog::Err("DeviceManager: bus '%s' enumeration failed: %s\n", bus.name,
                error.message());
      break;
  }
}

auto DeviceManager::DetectAll() -> Expected<void> {
  BusTable buses;
  {
    LockGuard guard(bus_lock_);
    detection_started_ = true;
    buses = buses_;
  }

  size_t inserted = 0;
  for (const auto& bus : buses) {
    auto found = bus.enumerate(scratch_, devmgr::config::kMaxDescriptorsPerBus);
    if (!found.has_value()) {
      ReportEnumerationError(bus, found.error());
      continue;
    }

    auto filled = FilledCount(*found, devmgr::config::kMaxDescriptorsPerBus);
    klog::Info("DeviceManager: bus '%s' enumerated %zu device(s)\n", bus.name,
               *found);
    if (filled < *found) {
      klog::Warn("DeviceManager: bus '%s' has %zu device(s) beyond capacity\n",
                 bus.name, *found - filled);
    }
    for (size_t i = 0; i < filled; ++i) {
      if (registry_.Contains(scratch_[i].id)) {
        continue;
      }
      auto view = InsertDevice(scratch_[i]);
      if (view.has_value()) {
        ++inserted;
      }
    }
  }

  klog::Info("DeviceManager: detection complete, %zu new, %zu total\n",
             inserted, registry_.Count());
  return {};
}

auto DeviceManager::ReleaseGrant(ResourceGrant& grant) -> void {
  if (!grant.IsValid()) {
    return;
  }
  auto released = arbiter_.Release(grant);
  sk_assert_msg(released.has_value(), "grant #%u release failed: %s",
                grant.handle, released.error().message());
  grant = ResourceGrant{};
}

auto DeviceManager::FailRecord(DeviceRecord& record, ErrorCode cause) -> void {
  ReleaseGrant(record.grant);
  record.driver.reset();
  record.failure = Error(ErrorCode::kDeviceInitFailed, cause);
  record.fsm.Receive(MsgInitFailed{cause});
}

auto DeviceManager::InsertDevice(const RawDeviceDescriptor& descriptor)
    -> Expected<DeviceView> {
  auto device_class = Classify(descriptor);

  // 注册表已满时不申请资源，也不触碰硬件
  if (registry_.IsFull()) {
    klog::Err("DeviceManager: registry full, %s device 0x%lx not attached\n",
              DeviceClassName(device_class), descriptor.id.address);
    return std::unexpected(Error(ErrorCode::kDeviceRegistryFull));
  }

  auto driver = drivers_.FindDriver(device_class);

  etl::unique_ptr<DeviceRecord> record(
      new DeviceRecord(descriptor, device_class));
  if (!record) {
    return std::unexpected(Error(ErrorCode::kOutOfMemory));
  }

  ResourceRequest request{};
  if (driver.has_value()) {
    request = driver->descriptor->request;
    if (!descriptor.UsesInterrupt()) {
      request.irq_count = 0;
    }
  }

  auto grant = arbiter_.Reserve(descriptor.id, request);
  if (!grant.has_value()) {
    auto code = grant.error().code;
    sk_assert_msg(code != ErrorCode::kMisalignedRequest,
                  "driver '%s' declares a misaligned MMIO request",
                  driver.has_value() ? driver->descriptor->name : "generic");
    klog::Warn("DeviceManager: %s device denied resources: %s\n",
               DeviceClassName(device_class), grant.error().message());
    record->failure = grant.error();
    record->fsm.Receive(MsgResourcesDenied{code});
  } else {
    record->grant = *grant;
    record->fsm.Receive(MsgResourcesGranted{});

    Expected<etl::unique_ptr<Device>> created =
        std::unexpected(Error(ErrorCode::kDeviceDriverUnavailable));
    if (driver.has_value()) {
      created = driver->create(descriptor, *grant);
    } else {
      created = etl::unique_ptr<Device>(
          new GenericDevice(descriptor.id, device_class));
    }

    if (!created.has_value() || !*created) {
      auto cause = created.has_value() ? ErrorCode::kOutOfMemory
                                       : created.error().code;
      klog::Err("DeviceManager: %s driver construction failed: %s\n",
                DeviceClassName(device_class), GetErrorMessage(cause));
      FailRecord(*record, cause);
    } else {
      record->driver = std::move(*created);
      record->fsm.Receive(MsgInitStart{});
      auto init = record->driver->Init();
      if (!init.has_value()) {
        klog::Err("DeviceManager: %s init failed: %s\n",
                  DeviceClassName(device_class), init.error().message());
        FailRecord(*record, init.error().code);
      } else {
        record->fsm.Receive(MsgInitDone{});
      }
    }
  }

  auto view = registry_.Insert(std::move(record));
  if (!view.has_value()) {
    // 注册表拒绝插入，回滚本次插入路径的全部副作用
    klog::Err("DeviceManager: %s device rejected by registry: %s\n",
              DeviceClassName(device_class), view.error().message());
    if (record->driver) {
      auto shutdown = record->driver->Shutdown();
      if (!shutdown.has_value()) {
        klog::Warn("DeviceManager: rollback shutdown failed: %s\n",
                   shutdown.error().message());
      }
    }
    ReleaseGrant(record->grant);
    return std::unexpected(view.error());
  }

  klog::Info("DeviceManager: %s (%s) on %s is %s\n", view->name.c_str(),
             DeviceClassName(view->device_class),
             BusFamilyName(view->id.family), DeviceStateName(view->state));
  hotplug_.Publish(HotplugEvent{HotplugEventType::kAdded, view->id});
  return view;
}

auto DeviceManager::RefreshDevice(const RawDeviceDescriptor& descriptor)
    -> Expected<void> {
  auto replaced = registry_.ReplaceDescriptor(descriptor);
  if (!replaced.has_value()) {
    return replaced;
  }
  klog::Debug("DeviceManager: %s device 0x%lx changed\n",
              BusFamilyName(descriptor.id.family), descriptor.id.address);
  hotplug_.Publish(HotplugEvent{HotplugEventType::kChanged, descriptor.id});
  return {};
}

auto DeviceManager::RemoveDevice(DeviceId id) -> Expected<void> {
  auto driver = registry_.BeginRemoval(id);
  if (!driver.has_value()) {
    return std::unexpected(driver.error());
  }

  Expected<void> shutdown{};
  if (*driver != nullptr) {
    shutdown = (*driver)->Shutdown();
    if (!shutdown.has_value()) {
      klog::Warn("DeviceManager: %s device 0x%lx shutdown failed: %s\n",
                 BusFamilyName(id.family), id.address,
                 shutdown.error().message());
    }
  }

  auto released =
      registry_.CompleteRemoval(id, shutdown.has_value(), arbiter_);
  sk_assert_msg(released.has_value(), "device 0x%lx removal failed: %s",
                id.address, released.error().message());

  hotplug_.Publish(HotplugEvent{HotplugEventType::kRemoved, id});

  if (!shutdown.has_value()) {
    return std::unexpected(
        Error(ErrorCode::kDeviceShutdownFailed, shutdown.error().code));
  }
  return {};
}

auto DeviceManager::ShutdownAll() -> Expected<void> {
  DeviceId ids[devmgr::config::kMaxDevices]{};
  auto count = registry_.ListIds(ids, devmgr::config::kMaxDevices);

  Expected<void> first_error{};
  for (size_t i = count; i-- > 0;) {
    auto removed = RemoveDevice(ids[i]);
    if (!removed.has_value() && first_error.has_value()) {
      first_error = removed;
    }
  }

  klog::Info("DeviceManager: shut down %zu device(s)\n", count);
  return first_error;
}
