/**
 * @copyright Copyright The DevMgr Contributors
 */

#ifndef DEVMGR_SRC_DEVICE_INCLUDE_PCI_BUS_HPP_
#define DEVMGR_SRC_DEVICE_INCLUDE_PCI_BUS_HPP_

#include <cstddef>
#include <cstdint>

#include "bus.hpp"
#include "device_descriptor.hpp"
#include "expected.hpp"

/// PCI 配置空间寄存器偏移
namespace pci_reg {
static constexpr uint8_t kVendorDevice = 0x00;
static constexpr uint8_t kClassRevision = 0x08;
static constexpr uint8_t kHeaderType = 0x0C;
static constexpr uint8_t kInterrupt = 0x3C;
}  // namespace pci_reg

/**
 * @brief PCI 配置空间访问后端（只读）
 */
class PciConfigSpace {
 public:
  /// 主桥是否存在
  [[nodiscard]] virtual auto IsPresent() const -> bool = 0;

  /// 可访问的总线数
  [[nodiscard]] virtual auto GetBusCount() const -> uint16_t = 0;

  /**
   * @brief  读取 32 位配置寄存器
   * @param  bus            总线号
   * @param  slot           设备号（0..31）
   * @param  function       功能号（0..7）
   * @param  offset         4 字节对齐的寄存器偏移
   * @return Expected<uint32_t> 读超时返回 kProbeTimeout
   */
  virtual auto Read32(uint8_t bus, uint8_t slot, uint8_t function,
                      uint8_t offset) -> Expected<uint32_t> = 0;

  /// @name 构造/析构函数
  /// @{
  PciConfigSpace() = default;
  PciConfigSpace(const PciConfigSpace&) = delete;
  PciConfigSpace(PciConfigSpace&&) = delete;
  auto operator=(const PciConfigSpace&) -> PciConfigSpace& = delete;
  auto operator=(PciConfigSpace&&) -> PciConfigSpace& = delete;
  virtual ~PciConfigSpace() = default;
  /// @}
};

/**
 * @brief ECAM（PCIe 增强配置访问机制）后端
 * @note  每个功能占 4 KiB，地址 = base | bus << 20 | slot << 15 |
 *        function << 12 | offset
 */
class EcamConfigSpace final : public PciConfigSpace {
 public:
  /**
   * @param ecam_base ECAM 基地址（从 FDT 或 ACPI MCFG 获取），0 表示没有 PCI
   * @param bus_count ECAM 窗口覆盖的总线数
   */
  explicit EcamConfigSpace(uint64_t ecam_base, uint16_t bus_count = 256)
      : base_(ecam_base), bus_count_(bus_count) {}

  [[nodiscard]] auto IsPresent() const -> bool override {
    return base_ != 0;
  }

  [[nodiscard]] auto GetBusCount() const -> uint16_t override {
    return bus_count_;
  }

  auto Read32(uint8_t bus, uint8_t slot, uint8_t function, uint8_t offset)
      -> Expected<uint32_t> override {
    auto address = (static_cast<size_t>(bus) << 20) |
                   (static_cast<size_t>(slot & 0x1F) << 15) |
                   (static_cast<size_t>(function & 0x07) << 12) |
                   (offset & 0xFC);
    return *reinterpret_cast<volatile uint32_t*>(base_ + address);
  }

 private:
  uint64_t base_;
  uint16_t bus_count_;
};

/// PCI 总线：按 (bus, slot, function) 遍历配置空间
class PciBus {
 public:
  explicit PciBus(PciConfigSpace& config) : config_(config) {}

  static auto GetName() -> const char* { return "pci"; }
  static auto GetFamily() -> BusFamily { return BusFamily::kPci; }

  /**
   * @brief  枚举 PCI 设备
   * @note   vendor 0xFFFF 表示槽位为空；仅当功能 0 的 header type
   *         bit 7 置位时探测功能 1..7。桥只被分类，不向下递归。
   * @param  out            输出描述符数组
   * @param  max            最大枚举数量
   * @return Expected<size_t> 发现的功能总数，可能大于 max；
   *         主桥不存在返回 kBusNotPresent
   */
  auto Enumerate(RawDeviceDescriptor* out, size_t max) -> Expected<size_t>;

  /// @name 构造/析构函数
  /// @{
  PciBus() = delete;
  ~PciBus() = default;
  PciBus(const PciBus&) = delete;
  PciBus(PciBus&&) = delete;
  auto operator=(const PciBus&) -> PciBus& = delete;
  auto operator=(PciBus&&) -> PciBus& = delete;
  /// @}

 private:
  static constexpr uint16_t kInvalidVendor = 0xFFFF;
  static constexpr uint8_t kMaxSlots = 32;
  static constexpr uint8_t kMaxFunctions = 8;
  static constexpr uint8_t kMultiFunctionBit = 0x80;
  static constexpr uint8_t kMaxHeaderLayout = 0x02;

  /// 读取单个功能的头部，功能不存在时返回 false
  auto ProbeFunction(uint8_t bus, uint8_t slot, uint8_t function,
                     RawDeviceDescriptor& out) -> Expected<bool>;

  PciConfigSpace& config_;
};

#endif /* DEVMGR_SRC_DEVICE_INCLUDE_PCI_BUS_HPP_ */
