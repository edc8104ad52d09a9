/**
 * @file spinlock.hpp
 * @brief 关中断自旋锁与 RAII 守卫
 * @copyright Copyright The DevMgr Contributors
 */

#ifndef DEVMGR_SRC_INCLUDE_SPINLOCK_HPP_
#define DEVMGR_SRC_INCLUDE_SPINLOCK_HPP_

#include <cpu_io.h>

#include <atomic>
#include <cstddef>
#include <cstdint>

#include "per_cpu.hpp"
#include "sk_stdio.h"

/**
 * @brief 自旋锁
 * @note 持锁期间本核中断关闭。中断开关状态记录在 per_cpu 中，
 *       多把锁嵌套时只有最外层 unlock 才会恢复中断。
 *       同一核心重复 lock 返回 false，不会死锁。
 */
class SpinLock {
 public:
  explicit SpinLock(const char *name) : name_(name) {}

  /// @name 构造/析构函数
  /// @{
  SpinLock() = default;
  SpinLock(const SpinLock &) = delete;
  SpinLock(SpinLock &&) = delete;
  auto operator=(const SpinLock &) -> SpinLock & = delete;
  auto operator=(SpinLock &&) -> SpinLock & = delete;
  virtual ~SpinLock() = default;
  /// @}

  /**
   * @brief 获得锁
   * @return false            当前核心已持有此锁
   */
  __always_inline auto lock() -> bool {
    PushInterruptOff();
    if (HeldByThisCore()) {
      sk_printf("[devmgr] lock '%s' re-acquired on core %zu\n", name_,
                GetCurrentCoreId());
      PopInterruptOff();
      return false;
    }
    while (locked_.test_and_set(std::memory_order_acquire)) {
      cpu_io::Pause();
    }
    owner_.store(GetCurrentCoreId(), std::memory_order_relaxed);
    return true;
  }

  /**
   * @brief 释放锁
   * @return false            当前核心未持有此锁，或中断嵌套计数异常
   */
  __always_inline auto unlock() -> bool {
    if (!HeldByThisCore()) {
      sk_printf("[devmgr] lock '%s' released by non-owner core %zu\n", name_,
                GetCurrentCoreId());
      return false;
    }
    owner_.store(kNoOwner, std::memory_order_relaxed);
    locked_.clear(std::memory_order_release);
    return PopInterruptOff();
  }

  [[nodiscard]] auto GetName() const -> const char * { return name_; }

 protected:
  /// 测试中可覆盖，用于模拟其他核心
  [[nodiscard]] virtual auto GetCurrentCoreId() -> size_t {
    return cpu_io::GetCurrentCoreId();
  }

 private:
  static constexpr size_t kNoOwner = SIZE_MAX;

  const char *name_{"unnamed"};
  std::atomic_flag locked_{ATOMIC_FLAG_INIT};
  std::atomic<size_t> owner_{kNoOwner};

  __always_inline auto HeldByThisCore() -> bool {
    return locked_.test(std::memory_order_relaxed) &&
           owner_.load(std::memory_order_relaxed) == GetCurrentCoreId();
  }

  /// 关中断并增加嵌套深度，最外层记录原先的中断状态
  __always_inline void PushInterruptOff() {
    const bool was_enabled = cpu_io::GetInterruptStatus();
    cpu_io::DisableInterrupt();
    auto &core = per_cpu::GetCurrentCore();
    if (core.noff_ == 0) {
      core.intr_enable_ = was_enabled;
    }
    ++core.noff_;
  }

  /// 减少嵌套深度，回到 0 时按记录恢复中断
  __always_inline auto PopInterruptOff() -> bool {
    auto &core = per_cpu::GetCurrentCore();
    if (cpu_io::GetInterruptStatus() || core.noff_ == 0) {
      sk_printf("[devmgr] unbalanced interrupt nesting on core %zu\n",
                GetCurrentCoreId());
      return false;
    }
    if (--core.noff_ == 0 && core.intr_enable_) {
      cpu_io::EnableInterrupt();
    }
    return true;
  }
};

/**
 * @brief RAII 锁守卫，只释放自己成功获得的锁
 * @tparam Mutex              提供 bool lock()/unlock() 的锁类型
 */
template <typename Mutex>
class LockGuard {
 public:
  explicit LockGuard(Mutex &mutex) : mutex_(mutex), owned_(mutex.lock()) {}

  ~LockGuard() {
    if (owned_) {
      mutex_.unlock();
    }
  }

  LockGuard(const LockGuard &) = delete;
  LockGuard(LockGuard &&) = delete;
  auto operator=(const LockGuard &) -> LockGuard & = delete;
  auto operator=(LockGuard &&) -> LockGuard & = delete;

 private:
  Mutex &mutex_;
  bool owned_;
};

#endif /* DEVMGR_SRC_INCLUDE_SPINLOCK_HPP_ */
