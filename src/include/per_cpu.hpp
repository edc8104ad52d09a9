/**
 * @file per_cpu.hpp
 * @brief 多核数据结构
 * @copyright Copyright The DevMgr Contributors
 */

#ifndef DEVMGR_SRC_INCLUDE_PER_CPU_HPP_
#define DEVMGR_SRC_INCLUDE_PER_CPU_HPP_

#include <cpu_io.h>
#include <sys/types.h>

#include <array>
#include <cstddef>
#include <cstdint>

namespace per_cpu {
class PerCpu {
 public:
  /// 最大 CPU 数
  static constexpr size_t kMaxCoreCount = 4;

  /// 核心 ID
  size_t core_id_{0};
  /// 中断嵌套深度
  ssize_t noff_{0};
  /// 进入第一层临界区前的中断使能状态
  bool intr_enable_{false};

  PerCpu() = default;
  explicit PerCpu(size_t id) : core_id_(id) {}

  /// @name 构造/析构函数
  /// @{
  PerCpu(const PerCpu &) = default;
  PerCpu(PerCpu &&) = default;
  auto operator=(const PerCpu &) -> PerCpu & = default;
  auto operator=(PerCpu &&) -> PerCpu & = default;
  virtual ~PerCpu() = default;
  /// @}
};

/// 所有核心的 per cpu 数据，下标为核心 ID
inline auto GetCores() -> std::array<PerCpu, PerCpu::kMaxCoreCount> & {
  static std::array<PerCpu, PerCpu::kMaxCoreCount> cores = [] {
    std::array<PerCpu, PerCpu::kMaxCoreCount> init{};
    for (size_t i = 0; i < init.size(); ++i) {
      init[i].core_id_ = i;
    }
    return init;
  }();
  return cores;
}

/// 获取当前核心的 per cpu 数据
static __always_inline auto GetCurrentCore() -> PerCpu & {
  return GetCores()[cpu_io::GetCurrentCoreId() % PerCpu::kMaxCoreCount];
}

}  // namespace per_cpu

#endif /* DEVMGR_SRC_INCLUDE_PER_CPU_HPP_ */
