/**
 * @copyright Copyright The DevMgr Contributors
 */

#ifndef DEVMGR_SRC_DEVICE_INCLUDE_PLATFORM_BUS_HPP_
#define DEVMGR_SRC_DEVICE_INCLUDE_PLATFORM_BUS_HPP_

#include <etl/delegate.h>

#include <cstddef>
#include <cstdint>

#include "bus.hpp"
#include "device_descriptor.hpp"
#include "expected.hpp"

/// 固件描述的设备节点
struct PlatformNode {
  const char* name;
  const char* compatible;
  uint64_t mmio_base;
  uint64_t mmio_size;
  uint32_t irq;
};

/// 节点访问回调，返回 false 停止遍历
using PlatformNodeVisitor = etl::delegate<bool(const PlatformNode&)>;

/**
 * @brief 固件设备树访问后端（FDT 或 ACPI 命名空间的只读视图）
 */
class PlatformFirmware {
 public:
  /**
   * @brief  按固定顺序遍历所有设备节点
   * @param  visitor        节点回调
   * @return Expected<void> 固件数据损坏返回 kMalformedResponse
   */
  virtual auto ForEachNode(PlatformNodeVisitor visitor) -> Expected<void> = 0;

  /// @name 构造/析构函数
  /// @{
  PlatformFirmware() = default;
  PlatformFirmware(const PlatformFirmware&) = delete;
  PlatformFirmware(PlatformFirmware&&) = delete;
  auto operator=(const PlatformFirmware&) -> PlatformFirmware& = delete;
  auto operator=(PlatformFirmware&&) -> PlatformFirmware& = delete;
  virtual ~PlatformFirmware() = default;
  /// @}
};

/// Platform 总线：固件驱动的设备发现
class PlatformBus {
 public:
  explicit PlatformBus(PlatformFirmware& firmware) : firmware_(firmware) {}

  static auto GetName() -> const char* { return "platform"; }
  static auto GetFamily() -> BusFamily { return BusFamily::kPlatform; }

  /**
   * @brief  枚举固件中带 compatible 属性的节点
   * @note   节点序号即 DeviceId 地址，没有 compatible 的节点也占用序号
   * @return Expected<size_t> 带 compatible 的节点总数，可能大于 max
   */
  auto Enumerate(RawDeviceDescriptor* out, size_t max) -> Expected<size_t>;

  /// @name 构造/析构函数
  /// @{
  PlatformBus() = delete;
  ~PlatformBus() = default;
  PlatformBus(const PlatformBus&) = delete;
  PlatformBus(PlatformBus&&) = delete;
  auto operator=(const PlatformBus&) -> PlatformBus& = delete;
  auto operator=(PlatformBus&&) -> PlatformBus& = delete;
  /// @}

 private:
  PlatformFirmware& firmware_;
};

#endif /* DEVMGR_SRC_DEVICE_INCLUDE_PLATFORM_BUS_HPP_ */
