/**
 * @copyright Copyright The DevMgr Contributors
 */

#include "hotplug_manager.hpp"

#include <cpu_io.h>

#include <algorithm>

#include "device_manager.hpp"
#include "kernel_log.hpp"

namespace {

/// 在扫描结果中查找指定 id
auto FindScanned(const RawDeviceDescriptor* scanned, size_t count, DeviceId id)
    -> const RawDeviceDescriptor* {
  auto* end = scanned + count;
  auto* it = std::find_if(scanned, end, [id](const RawDeviceDescriptor& desc) {
    return desc.id == id;
  });
  return it == end ? nullptr : it;
}

}  // namespace

auto HotplugManager::NotifyFromInterrupt(BusFamily family) -> void {
  auto bit = BusFamilyBit(family);
  auto previous = pending_mask_.fetch_or(bit, std::memory_order_acq_rel);
  if ((previous & bit) != 0) {
    tokens_coalesced_.fetch_add(1, std::memory_order_relaxed);
    return;
  }

  if (!queue_.push(HotplugToken{family})) {
    // 掩码位保留，ProcessPending() 扫描掩码时兜底处理
    queue_overflows_.fetch_add(1, std::memory_order_relaxed);
    return;
  }
  tokens_accepted_.fetch_add(1, std::memory_order_relaxed);
}

auto HotplugManager::DrainFamily(BusFamily family) -> bool {
  auto bit = BusFamilyBit(family);
  auto previous = pending_mask_.fetch_and(~bit, std::memory_order_acq_rel);
  if ((previous & bit) == 0) {
    return false;
  }

  auto result = RunDiffPass(family);
  if (!result.has_value()) {
    klog::Debug("HotplugManager: %s diff pass aborted: %s\n",
                BusFamilyName(family), result.error().message());
  }
  return true;
}

auto HotplugManager::ProcessPending() -> size_t {
  size_t processed = 0;

  HotplugToken token{};
  while (queue_.pop(token)) {
    if (DrainFamily(token.family)) {
      ++processed;
    }
  }

  // 队列溢出时令牌丢失，但掩码位仍然保留
  for (size_t i = 0; i < kBusFamilyCount; ++i) {
    auto family = static_cast<BusFamily>(i);
    if ((pending_mask_.load(std::memory_order_acquire) &
         BusFamilyBit(family)) != 0 &&
        DrainFamily(family)) {
      ++processed;
    }
  }

  return processed;
}

auto HotplugManager::Run(const std::atomic<bool>& stop,
                         etl::delegate<void()> idle) -> void {
  klog::Info("HotplugManager: worker started\n");
  while (!stop.load(std::memory_order_acquire)) {
    if (ProcessPending() != 0) {
      continue;
    }
    if (idle.is_valid()) {
      idle();
    } else {
      cpu_io::Pause();
    }
  }
  klog::Info("HotplugManager: worker stopped\n");
}

auto HotplugManager::RunDiffPass(BusFamily family) -> Expected<void> {
  size_t scanned = 0;
  bool truncated = false;
  auto found = manager_.EnumerateBus(family, scratch_,
                                     devmgr::config::kMaxDescriptorsPerBus);
  if (!found.has_value()) {
    switch (found.error().code) {
      case ErrorCode::kBusNotPresent:
        // 整条总线消失：已知设备全部移除
        klog::Info("HotplugManager: %s bus not present\n",
                   BusFamilyName(family));
        break;
      case ErrorCode::kProbeTimeout:
        ScheduleRetry(family);
        return std::unexpected(found.error());
      default:
        klog::Err("HotplugManager: %s enumeration failed: %s\n",
                  BusFamilyName(family), found.error().message());
        return std::unexpected(found.error());
    }
  } else {
    scanned = FilledCount(*found, devmgr::config::kMaxDescriptorsPerBus);
    truncated = scanned < *found;
    if (truncated) {
      // 缓冲区外的设备看不到，不能据此判定为消失
      klog::Warn("HotplugManager: %s scan truncated at %zu of %zu, "
                 "removals limited to changed devices\n",
                 BusFamilyName(family), scanned, *found);
    }
  }

  retry_mask_.fetch_and(~BusFamilyBit(family), std::memory_order_acq_rel);
  passes_.fetch_add(1, std::memory_order_relaxed);

  auto known = manager_.registry_.ListIds(family, known_ids_,
                                          devmgr::config::kMaxDevices);

  // 先移除：消失的设备与同一地址上身份改变的设备
  size_t removed = 0;
  for (size_t i = 0; i < known; ++i) {
    auto current = manager_.registry_.Find(known_ids_[i]);
    if (!current.has_value()) {
      continue;
    }
    auto* match = FindScanned(scratch_, scanned, known_ids_[i]);
    if (match != nullptr && IdentityMatches(current->descriptor, *match)) {
      continue;
    }
    if (match == nullptr && truncated) {
      continue;
    }

    auto result = manager_.RemoveDevice(known_ids_[i]);
    if (!result.has_value() &&
        result.error().code != ErrorCode::kDeviceShutdownFailed) {
      klog::Warn("HotplugManager: %s removal skipped: %s\n",
                 current->name.c_str(), result.error().message());
      continue;
    }
    ++removed;
  }

  // 再插入新设备，刷新辅助字段变化的设备
  size_t added = 0;
  size_t changed = 0;
  for (size_t i = 0; i < scanned; ++i) {
    auto current = manager_.registry_.Find(scratch_[i].id);
    if (!current.has_value()) {
      if (manager_.InsertDevice(scratch_[i]).has_value()) {
        ++added;
      }
      continue;
    }
    if (!AuxiliaryMatches(current->descriptor, scratch_[i])) {
      if (manager_.RefreshDevice(scratch_[i]).has_value()) {
        ++changed;
      }
    }
  }

  klog::Debug("HotplugManager: %s pass: %zu added, %zu removed, %zu changed\n",
              BusFamilyName(family), added, removed, changed);
  return {};
}

auto HotplugManager::RegisterListener(HotplugListener listener)
    -> Expected<void> {
  if (!listener.is_valid()) {
    return std::unexpected(Error(ErrorCode::kInvalidArgument));
  }
  LockGuard guard(listener_lock_);
  if (listeners_.full()) {
    return std::unexpected(Error(ErrorCode::kOutOfMemory));
  }
  listeners_.push_back(listener);
  return {};
}

auto HotplugManager::Publish(const HotplugEvent& event) -> void {
  ListenerTable listeners;
  {
    LockGuard guard(listener_lock_);
    listeners = listeners_;
  }

  events_published_.fetch_add(1, std::memory_order_relaxed);
  for (auto& listener : listeners) {
    auto result = listener(event);
    if (!result.has_value()) {
      listener_failures_.fetch_add(1, std::memory_order_relaxed);
      klog::Warn("HotplugManager: listener failed on %s event: %s\n",
                 BusFamilyName(event.id.family), result.error().message());
    }
  }
}

auto HotplugManager::ScheduleRetry(BusFamily family) -> void {
  retry_mask_.fetch_or(BusFamilyBit(family), std::memory_order_acq_rel);
  retries_scheduled_.fetch_add(1, std::memory_order_relaxed);
  klog::Warn("HotplugManager: %s probe timed out, retry in %lu ticks\n",
             BusFamilyName(family), devmgr::config::kHotplugRetryTicks);
}

void HotplugManager::notification(TickEvent event) {
  (void)event;
  if (retry_mask_.load(std::memory_order_acquire) == 0) {
    ticks_waiting_ = 0;
    return;
  }
  // 从超时后的第一个 tick 开始计数，满 kHotplugRetryTicks 才投递
  if (++ticks_waiting_ < devmgr::config::kHotplugRetryTicks) {
    return;
  }
  ticks_waiting_ = 0;

  auto mask = retry_mask_.exchange(0, std::memory_order_acq_rel);
  for (size_t i = 0; i < kBusFamilyCount; ++i) {
    auto family = static_cast<BusFamily>(i);
    if ((mask & BusFamilyBit(family)) != 0) {
      NotifyFromInterrupt(family);
    }
  }
}

auto HotplugManager::GetStats() const -> HotplugStats {
  return HotplugStats{
      .tokens_accepted = tokens_accepted_.load(std::memory_order_relaxed),
      .tokens_coalesced = tokens_coalesced_.load(std::memory_order_relaxed),
      .queue_overflows = queue_overflows_.load(std::memory_order_relaxed),
      .passes = passes_.load(std::memory_order_relaxed),
      .events_published = events_published_.load(std::memory_order_relaxed),
      .listener_failures = listener_failures_.load(std::memory_order_relaxed),
      .retries_scheduled = retries_scheduled_.load(std::memory_order_relaxed),
  };
}
