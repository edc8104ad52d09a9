/**
 * @copyright Copyright The DevMgr Contributors
 * @brief 中断线、DMA 通道与 MMIO 窗口的仲裁
 */

#ifndef DEVMGR_SRC_DEVICE_INCLUDE_RESOURCE_ARBITER_HPP_
#define DEVMGR_SRC_DEVICE_INCLUDE_RESOURCE_ARBITER_HPP_

#include <etl/vector.h>

#include <cstddef>
#include <cstdint>

#include "device_types.hpp"
#include "devmgr_config.hpp"
#include "expected.hpp"
#include "spinlock.hpp"

/// 资源池配置，由平台在构造仲裁器时给出
struct ArbiterConfig {
  /// 可分配的第一条中断线
  uint32_t irq_base{devmgr::config::kDefaultIrqBase};
  /// 可分配的中断线数量（不超过 kMaxIrqLines）
  uint32_t irq_count{devmgr::config::kDefaultIrqCount};
  /// DMA 通道数量（不超过 kMaxDmaChannels）
  uint32_t dma_channels{devmgr::config::kDefaultDmaChannels};
  /// MMIO 窗口基址，需按 kMmioGranularity 对齐
  uint64_t mmio_base{devmgr::config::kDefaultMmioBase};
  /// MMIO 窗口大小
  uint64_t mmio_size{devmgr::config::kDefaultMmioSize};
};

/**
 * @brief 资源仲裁器
 *
 * 以全有或全无的方式授予资源：任一类资源不足时整个请求失败，
 * 不产生部分分配。所有授予在池中互不重叠。
 *
 * @note 锁顺序：DeviceRegistry 锁 -> ResourceArbiter 锁
 */
class ResourceArbiter {
 public:
  explicit ResourceArbiter(const ArbiterConfig& config = {});

  /**
   * @brief  为设备预留资源
   * @param  owner          申请者
   * @param  request        资源需求
   * @return Expected<ResourceGrant> 成功时返回授予；
   *         kResourceExhausted / kMisalignedRequest / kInvalidArgument
   */
  auto Reserve(DeviceId owner, const ResourceRequest& request)
      -> Expected<ResourceGrant>;

  /**
   * @brief  归还授予的全部资源
   * @param  grant          Reserve() 返回的授予
   * @return Expected<void> 重复释放返回 kDoubleRelease；
   *         内容与仲裁器记录不符返回 kGrantNotOwned
   */
  auto Release(const ResourceGrant& grant) -> Expected<void>;

  /// @name 诊断接口
  /// @{
  [[nodiscard]] auto FreeIrqCount() const -> size_t;
  [[nodiscard]] auto FreeDmaCount() const -> size_t;
  [[nodiscard]] auto FreeMmioBytes() const -> uint64_t;
  [[nodiscard]] auto LargestFreeMmioRegion() const -> uint64_t;
  [[nodiscard]] auto LiveGrantCount() const -> size_t;
  [[nodiscard]] auto GetConfig() const -> const ArbiterConfig& {
    return config_;
  }
  /// @}

  /// @name 构造/析构函数
  /// @{
  ResourceArbiter(const ResourceArbiter&) = delete;
  ResourceArbiter(ResourceArbiter&&) = delete;
  auto operator=(const ResourceArbiter&) -> ResourceArbiter& = delete;
  auto operator=(ResourceArbiter&&) -> ResourceArbiter& = delete;
  ~ResourceArbiter() = default;
  /// @}

 private:
  /// 在空闲链表中首次适配一段对齐的窗口，成功时切分空闲区间
  auto AllocateMmio(uint64_t size, uint64_t alignment) -> Expected<MmioWindow>;

  /// 将窗口插回空闲链表并与相邻区间合并
  auto FreeMmio(const MmioWindow& window) -> void;

  [[nodiscard]] auto IrqMask() const -> uint64_t;
  [[nodiscard]] auto DmaMask() const -> uint32_t;

  ArbiterConfig config_;

  /// 已分配中断线位图，bit i 对应 irq_base + i
  uint64_t irq_used_{0};
  /// 已分配 DMA 通道位图
  uint32_t dma_used_{0};
  /// 按基址升序排列的 MMIO 空闲区间
  etl::vector<MmioWindow, devmgr::config::kMaxMmioFreeRegions> mmio_free_;
  /// 存活授予，用于识别重复释放
  etl::vector<ResourceGrant, devmgr::config::kMaxLiveGrants> live_grants_;
  /// 下一个授予句柄，从 1 开始且永不复用
  uint32_t next_handle_{1};

  mutable SpinLock lock_{"resource_arbiter"};
};

#endif /* DEVMGR_SRC_DEVICE_INCLUDE_RESOURCE_ARBITER_HPP_ */
