/**
 * @copyright Copyright The DevMgr Contributors
 * @brief 热插拔通知、差异比对与事件分发
 */

#ifndef DEVMGR_SRC_DEVICE_INCLUDE_HOTPLUG_MANAGER_HPP_
#define DEVMGR_SRC_DEVICE_INCLUDE_HOTPLUG_MANAGER_HPP_

#include <MPMCQueue.hpp>
#include <etl/delegate.h>
#include <etl/vector.h>

#include <atomic>
#include <cstddef>
#include <cstdint>

#include "device_descriptor.hpp"
#include "device_types.hpp"
#include "devmgr_config.hpp"
#include "expected.hpp"
#include "spinlock.hpp"
#include "tick_observer.hpp"

class DeviceManager;

/// 中断上下文投递给工作线程的唤醒令牌
struct HotplugToken {
  BusFamily family{BusFamily::kPlatform};
};

/// 热插拔监听者；返回错误只被记录，不影响后续监听者
using HotplugListener = etl::delegate<Expected<void>(const HotplugEvent&)>;

/// 热插拔统计
struct HotplugStats {
  /// 成功入队的令牌
  uint64_t tokens_accepted{0};
  /// 因同族已有待处理令牌而被合并的通知
  uint64_t tokens_coalesced{0};
  /// 队列满，仅置位待处理掩码的通知
  uint64_t queue_overflows{0};
  /// 已执行的差异比对轮次
  uint64_t passes{0};
  /// 已发布的事件（每个事件计一次，与监听者数量无关）
  uint64_t events_published{0};
  /// 监听者返回错误的次数
  uint64_t listener_failures{0};
  /// 因 ProbeTimeout 安排的重试
  uint64_t retries_scheduled{0};
};

/**
 * @brief 热插拔管理器
 *
 * 中断上下文只调用 NotifyFromInterrupt()：置位原子待处理掩码并推入无锁队列，
 * 不阻塞、不分配内存。唯一的工作上下文调用 ProcessPending()，
 * 对每个待处理总线族重新枚举并与注册表比对，先执行全部移除，再执行插入。
 *
 * 同时作为 tick 观察者，每 kHotplugRetryTicks 个 tick 重新投递上次
 * 枚举超时的总线族。
 */
class HotplugManager : public ITickObserver {
 public:
  explicit HotplugManager(DeviceManager& manager) : manager_(manager) {}

  /**
   * @brief  中断上下文：报告某总线族发生了变化
   * @note   同一总线族已有待处理令牌时只计为合并；队列满时保留掩码位，
   *         由下一次 ProcessPending() 兜底处理
   * @param  family         发生变化的总线族
   */
  auto NotifyFromInterrupt(BusFamily family) -> void;

  /**
   * @brief  工作上下文：处理所有待处理的总线族
   * @return size_t         执行的差异比对轮次
   */
  auto ProcessPending() -> size_t;

  /**
   * @brief  工作线程主循环
   * @param  stop           置位后退出
   * @param  idle           没有待处理令牌时调用（通常由宿主内核让出 CPU）
   */
  auto Run(const std::atomic<bool>& stop, etl::delegate<void()> idle) -> void;

  /**
   * @brief  对一个总线族执行一轮差异比对
   * @return Expected<void> 枚举失败时返回枚举错误，注册表保持不变
   */
  auto RunDiffPass(BusFamily family) -> Expected<void>;

  /**
   * @brief  注册监听者，可在任意时刻调用
   * @return Expected<void> 监听者表已满返回 kOutOfMemory
   */
  auto RegisterListener(HotplugListener listener) -> Expected<void>;

  /// 按注册顺序把事件分发给所有监听者
  auto Publish(const HotplugEvent& event) -> void;

  /// 记录总线族枚举超时，在下一个重试 tick 重新投递
  auto ScheduleRetry(BusFamily family) -> void;

  /// tick 回调，运行于时钟中断上下文
  void notification(TickEvent event) override;

  [[nodiscard]] auto GetStats() const -> HotplugStats;

  /// 是否有待处理的总线族
  [[nodiscard]] auto HasPending() const -> bool {
    return pending_mask_.load(std::memory_order_acquire) != 0;
  }

  /// 等待重试的总线族掩码
  [[nodiscard]] auto GetRetryMask() const -> uint32_t {
    return retry_mask_.load(std::memory_order_acquire);
  }

  /// @name 构造/析构函数
  /// @{
  HotplugManager() = delete;
  HotplugManager(const HotplugManager&) = delete;
  HotplugManager(HotplugManager&&) = delete;
  auto operator=(const HotplugManager&) -> HotplugManager& = delete;
  auto operator=(HotplugManager&&) -> HotplugManager& = delete;
  ~HotplugManager() override = default;
  /// @}

 private:
  using TokenQueue = mpmc_queue::MPMCQueue<HotplugToken,
                                           devmgr::config::kHotplugQueueCapacity>;
  using ListenerTable =
      etl::vector<HotplugListener, devmgr::config::kMaxHotplugListeners>;

  /// 清除掩码位并执行比对；位已被清除（重复令牌）时跳过
  auto DrainFamily(BusFamily family) -> bool;

  DeviceManager& manager_;

  TokenQueue queue_;
  /// 已投递但尚未处理的总线族
  std::atomic<uint32_t> pending_mask_{0};
  /// 上次枚举超时、等待重试的总线族
  std::atomic<uint32_t> retry_mask_{0};
  /// 重试掩码非空以来经过的 tick 数，仅在 tick 上下文访问
  uint64_t ticks_waiting_{0};

  ListenerTable listeners_;
  SpinLock listener_lock_{"hotplug_listeners"};

  /// 比对用的枚举缓冲区，仅工作上下文访问
  RawDeviceDescriptor scratch_[devmgr::config::kMaxDescriptorsPerBus]{};
  DeviceId known_ids_[devmgr::config::kMaxDevices]{};

  std::atomic<uint64_t> tokens_accepted_{0};
  std::atomic<uint64_t> tokens_coalesced_{0};
  std::atomic<uint64_t> queue_overflows_{0};
  std::atomic<uint64_t> passes_{0};
  std::atomic<uint64_t> events_published_{0};
  std::atomic<uint64_t> listener_failures_{0};
  std::atomic<uint64_t> retries_scheduled_{0};
};

#endif /* DEVMGR_SRC_DEVICE_INCLUDE_HOTPLUG_MANAGER_HPP_ */
