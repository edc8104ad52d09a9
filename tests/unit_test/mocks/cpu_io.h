/**
 * @copyright Copyright The DevMgr Contributors
 */

#ifndef DEVMGR_TESTS_UNIT_TEST_MOCKS_CPU_IO_H_
#define DEVMGR_TESTS_UNIT_TEST_MOCKS_CPU_IO_H_

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <thread>

namespace cpu_io {

/// 模拟的核心数，与 per_cpu::PerCpu::kMaxCoreCount 一致
inline constexpr size_t kMockCoreCount = 4;

namespace detail {

/// 核心编号占用位图，保证同时存活的线程拿到不同的核心 ID
inline auto CoreSlots() -> std::atomic<uint32_t>& {
  static std::atomic<uint32_t> slots{0};
  return slots;
}

/// 线程首次访问时占用一个空闲核心编号，线程退出时归还
struct ThreadCore {
  size_t id{0};

  ThreadCore() {
    auto& slots = CoreSlots();
    while (true) {
      auto current = slots.load(std::memory_order_acquire);
      for (size_t i = 0; i < kMockCoreCount; ++i) {
        auto bit = 1U << i;
        if ((current & bit) == 0 &&
            slots.compare_exchange_weak(current, current | bit,
                                        std::memory_order_acq_rel)) {
          id = i;
          return;
        }
      }
      std::this_thread::yield();
    }
  }

  ~ThreadCore() {
    CoreSlots().fetch_and(~(1U << id), std::memory_order_acq_rel);
  }

  ThreadCore(const ThreadCore&) = delete;
  ThreadCore(ThreadCore&&) = delete;
  auto operator=(const ThreadCore&) -> ThreadCore& = delete;
  auto operator=(ThreadCore&&) -> ThreadCore& = delete;
};

inline auto InterruptStatusRef() -> bool& {
  thread_local bool interrupt_enabled = true;
  return interrupt_enabled;
}

}  // namespace detail

inline void Pause() {
  // 在单元测试中使用 yield 避免死循环
  std::this_thread::yield();
}

inline auto GetCurrentCoreId() -> size_t {
  thread_local detail::ThreadCore core;
  return core.id;
}

inline void EnableInterrupt() { detail::InterruptStatusRef() = true; }

inline void DisableInterrupt() { detail::InterruptStatusRef() = false; }

inline bool GetInterruptStatus() { return detail::InterruptStatusRef(); }

}  // namespace cpu_io

#endif /* DEVMGR_TESTS_UNIT_TEST_MOCKS_CPU_IO_H_ */
