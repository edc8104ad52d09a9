/**
 * @copyright Copyright The DevMgr Contributors
 * @brief 总线枚举产出的原始设备描述符与设备分类
 */

#ifndef DEVMGR_SRC_DEVICE_INCLUDE_DEVICE_DESCRIPTOR_HPP_
#define DEVMGR_SRC_DEVICE_INCLUDE_DEVICE_DESCRIPTOR_HPP_

#include <etl/string.h>

#include <cstddef>
#include <cstdint>
#include <variant>

#include "device_types.hpp"

/// PCI 配置空间头部摘要
struct PciIdentity {
  uint16_t vendor_id{0};
  uint16_t device_id{0};
  uint8_t class_code{0};
  uint8_t subclass{0};
  uint8_t prog_if{0};
  uint8_t revision{0};
  uint8_t header_type{0};
  /// 0 表示不使用中断引脚，1..4 对应 INTA#..INTD#
  uint8_t interrupt_pin{0};
};

/// USB 连接速率
enum class UsbSpeed : uint8_t {
  kLow = 0,
  kFull = 1,
  kHigh = 2,
  kSuper = 3,
};

/// USB 设备描述符与首个接口描述符摘要
struct UsbIdentity {
  uint16_t vendor_id{0};
  uint16_t product_id{0};
  uint8_t device_class{0};
  uint8_t device_subclass{0};
  uint8_t device_protocol{0};
  uint8_t interface_class{0};
  uint8_t interface_subclass{0};
  uint8_t interface_protocol{0};
  uint16_t bcd_device{0};
  UsbSpeed speed{UsbSpeed::kFull};
};

/// Bluetooth 设备摘要
struct BluetoothIdentity {
  uint8_t bd_addr[6]{};
  /// 24 位 Class of Device
  uint32_t class_of_device{0};
  int8_t rssi{0};
  /// 本机控制器（而非远端设备）
  bool local_controller{false};
};

/// 固件（FDT/ACPI）描述的平台设备
struct PlatformIdentity {
  static constexpr size_t kMaxCompatibleLength = 64;

  etl::string<kMaxCompatibleLength> compatible;
  uint64_t mmio_base{0};
  uint64_t mmio_size{0};
  /// 0 表示无中断
  uint32_t irq{0};
};

/// 总线特定标识（类型安全 variant）
using BusIdentity =
    std::variant<PciIdentity, UsbIdentity, BluetoothIdentity, PlatformIdentity>;

/**
 * @brief 原始设备描述符
 * @note  由总线枚举器产出，设备管理器在插入后拥有其副本
 */
struct RawDeviceDescriptor {
  DeviceId id{};
  BusIdentity identity{};

  /// 设备是否需要中断线
  [[nodiscard]] auto UsesInterrupt() const -> bool;
};

/**
 * @brief  根据描述符的能力摘要判定设备类别
 * @param  descriptor     原始设备描述符
 * @return DeviceClass    无法识别时返回 kUnknown
 */
[[nodiscard]] auto Classify(const RawDeviceDescriptor& descriptor)
    -> DeviceClass;

/**
 * @brief  判断两份描述符是否为同一物理设备
 * @note   比较厂商、产品与类别三元组；不同即视为移除后重新插入
 */
[[nodiscard]] auto IdentityMatches(const RawDeviceDescriptor& lhs,
                                   const RawDeviceDescriptor& rhs) -> bool;

/**
 * @brief  判断两份同一设备的描述符在辅助字段上是否一致
 * @note   辅助字段包括修订号、速率、中断引脚等，变化时发布 Changed
 */
[[nodiscard]] auto AuxiliaryMatches(const RawDeviceDescriptor& lhs,
                                    const RawDeviceDescriptor& rhs) -> bool;

#endif /* DEVMGR_SRC_DEVICE_INCLUDE_DEVICE_DESCRIPTOR_HPP_ */
