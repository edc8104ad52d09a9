/**
 * @copyright Copyright The DevMgr Contributors
 * @brief 自旋锁
 */

#include "spinlock.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

namespace {

/// 可以指定核心编号的自旋锁，用于模拟跨核释放
class SpinLockTestable : public SpinLock {
 public:
  explicit SpinLockTestable(const char* name) : SpinLock(name) {}

  void SetCoreOverride(size_t id) { core_override_ = id; }
  void ClearCoreOverride() { core_override_ = SIZE_MAX; }

 protected:
  auto GetCurrentCoreId() -> size_t override {
    return core_override_ == SIZE_MAX ? cpu_io::GetCurrentCoreId()
                                      : core_override_;
  }

 private:
  size_t core_override_{SIZE_MAX};
};

class SpinLockTest : public ::testing::Test {
 protected:
  void SetUp() override { cpu_io::EnableInterrupt(); }
  void TearDown() override { cpu_io::EnableInterrupt(); }
};

// 测试基本的 lock/unlock 功能
TEST_F(SpinLockTest, BasicLockUnlock) {
  SpinLock lock("basic_test");
  EXPECT_STREQ(lock.GetName(), "basic_test");

  EXPECT_TRUE(lock.lock());
  EXPECT_TRUE(lock.unlock());
  // 再次获取
  EXPECT_TRUE(lock.lock());
  EXPECT_TRUE(lock.unlock());
}

// 测试持锁期间关中断，释放后恢复
TEST_F(SpinLockTest, InterruptControl) {
  SpinLock lock("intr_test");

  ASSERT_TRUE(cpu_io::GetInterruptStatus());
  ASSERT_TRUE(lock.lock());
  EXPECT_FALSE(cpu_io::GetInterruptStatus());
  ASSERT_TRUE(lock.unlock());
  EXPECT_TRUE(cpu_io::GetInterruptStatus());
}

// 测试进入临界区前已关中断时，释放后保持关闭
TEST_F(SpinLockTest, InterruptsStayDisabled) {
  SpinLock lock("intr_disabled_test");

  cpu_io::DisableInterrupt();
  ASSERT_TRUE(lock.lock());
  ASSERT_TRUE(lock.unlock());
  EXPECT_FALSE(cpu_io::GetInterruptStatus());
}

// 测试嵌套持有两把锁时只在最外层恢复中断
TEST_F(SpinLockTest, NestedInterruptControl) {
  SpinLock outer("outer");
  SpinLock inner("inner");

  ASSERT_TRUE(outer.lock());
  ASSERT_TRUE(inner.lock());
  EXPECT_FALSE(cpu_io::GetInterruptStatus());

  ASSERT_TRUE(inner.unlock());
  EXPECT_FALSE(cpu_io::GetInterruptStatus());

  ASSERT_TRUE(outer.unlock());
  EXPECT_TRUE(cpu_io::GetInterruptStatus());
}

// 测试同一核心递归获取被拒绝，且不破坏嵌套计数
TEST_F(SpinLockTest, RecursiveLockRejected) {
  SpinLock lock("recursive_test");

  ASSERT_TRUE(lock.lock());
  EXPECT_FALSE(lock.lock());
  EXPECT_FALSE(cpu_io::GetInterruptStatus());
  ASSERT_TRUE(lock.unlock());
  EXPECT_TRUE(cpu_io::GetInterruptStatus());
}

TEST_F(SpinLockTest, UnlockWithoutOwnership) {
  SpinLock lock("unowned_test");
  EXPECT_FALSE(lock.unlock());
  EXPECT_TRUE(cpu_io::GetInterruptStatus());
}

// 测试其他核心不能释放当前核心持有的锁
TEST_F(SpinLockTest, LockOwnership) {
  SpinLockTestable lock("ownership_test");

  ASSERT_TRUE(lock.lock());
  lock.SetCoreOverride(cpu_io::GetCurrentCoreId() + 1);
  EXPECT_FALSE(lock.unlock());

  lock.ClearCoreOverride();
  EXPECT_TRUE(lock.unlock());
}

TEST_F(SpinLockTest, MultipleLockIndependence) {
  SpinLock first("first");
  SpinLock second("second");

  ASSERT_TRUE(first.lock());
  EXPECT_TRUE(second.lock());
  EXPECT_TRUE(first.unlock());
  EXPECT_TRUE(second.unlock());
}

TEST_F(SpinLockTest, LockGuardReleasesOnScopeExit) {
  SpinLock lock("guard_test");
  {
    LockGuard guard(lock);
    EXPECT_FALSE(cpu_io::GetInterruptStatus());
  }
  EXPECT_TRUE(cpu_io::GetInterruptStatus());
  EXPECT_TRUE(lock.lock());
  EXPECT_TRUE(lock.unlock());
}

// 测试未获得锁的 LockGuard 不会释放别人的锁
TEST_F(SpinLockTest, LockGuardIgnoresFailedAcquire) {
  SpinLock lock("guard_recursive_test");
  ASSERT_TRUE(lock.lock());
  {
    LockGuard guard(lock);
  }
  // 外层仍持有
  EXPECT_FALSE(cpu_io::GetInterruptStatus());
  EXPECT_TRUE(lock.unlock());
}

// 测试多线程下临界区互斥
TEST_F(SpinLockTest, ConcurrentAccess) {
  SpinLock lock("concurrent_test");
  // 模拟核心数为 4，主线程占用一个
  constexpr int kThreads = 3;
  constexpr int kIterations = 20000;
  int counter = 0;
  std::atomic<int> inside{0};
  std::atomic<bool> overlap{false};

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&]() {
      for (int i = 0; i < kIterations; ++i) {
        LockGuard guard(lock);
        if (inside.fetch_add(1) != 0) {
          overlap = true;
        }
        ++counter;
        inside.fetch_sub(1);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(counter, kThreads * kIterations);
  EXPECT_FALSE(overlap.load());
}

}  // namespace
