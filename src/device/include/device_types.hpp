/**
 * @copyright Copyright The DevMgr Contributors
 * @brief 设备标识、设备类别、生命周期状态与资源描述
 */

#ifndef DEVMGR_SRC_DEVICE_INCLUDE_DEVICE_TYPES_HPP_
#define DEVMGR_SRC_DEVICE_INCLUDE_DEVICE_TYPES_HPP_

#include <compare>
#include <cstddef>
#include <cstdint>

#include "devmgr_config.hpp"

/// 总线族
enum class BusFamily : uint8_t {
  kPci = 0,
  kUsb = 1,
  kBluetooth = 2,
  kPlatform = 3,
};

/// 总线族数量
inline constexpr size_t kBusFamilyCount = 4;

/// 总线族在位掩码中对应的位
[[nodiscard]] constexpr auto BusFamilyBit(BusFamily family) -> uint32_t {
  return 1U << static_cast<uint32_t>(family);
}

[[nodiscard]] auto BusFamilyName(BusFamily family) -> const char*;

/**
 * @brief 设备标识
 * @note  在同一总线族内唯一，设备移除后可被重新使用。
 *        address 的编码由总线族决定：
 *        - PCI:       bus << 16 | slot << 11 | function << 8
 *        - USB:       bus << 8 | port
 *        - Bluetooth: 48 位 BD_ADDR（大端）
 *        - Platform:  固件节点序号
 */
struct DeviceId {
  BusFamily family{BusFamily::kPlatform};
  uint64_t address{0};

  [[nodiscard]] static constexpr auto Pci(uint8_t bus, uint8_t slot,
                                          uint8_t function) -> DeviceId {
    return {BusFamily::kPci, (static_cast<uint64_t>(bus) << 16) |
                                 (static_cast<uint64_t>(slot & 0x1F) << 11) |
                                 (static_cast<uint64_t>(function & 0x07) << 8)};
  }

  [[nodiscard]] static constexpr auto Usb(uint8_t bus, uint8_t port)
      -> DeviceId {
    return {BusFamily::kUsb, (static_cast<uint64_t>(bus) << 8) | port};
  }

  [[nodiscard]] static constexpr auto Bluetooth(const uint8_t (&bd_addr)[6])
      -> DeviceId {
    uint64_t address = 0;
    for (auto byte : bd_addr) {
      address = (address << 8) | byte;
    }
    return {BusFamily::kBluetooth, address};
  }

  [[nodiscard]] static constexpr auto Platform(uint32_t node_index)
      -> DeviceId {
    return {BusFamily::kPlatform, node_index};
  }

  friend constexpr auto operator==(const DeviceId&, const DeviceId&)
      -> bool = default;
  friend constexpr auto operator<=>(const DeviceId&, const DeviceId&) =
      default;
};

/// 设备类别
enum class DeviceClass : uint8_t {
  kNetworkEthernet = 0,
  kNetworkWifi = 1,
  kStorageUsb = 2,
  kStorageAta = 3,
  kBluetoothAdapter = 4,
  kAudioAdapter = 5,
  kVideoAdapter = 6,
  kBridge = 7,
  kUnknown = 8,
};

/// 设备类别数量
inline constexpr size_t kDeviceClassCount = 9;

[[nodiscard]] auto DeviceClassName(DeviceClass device_class) -> const char*;

/// 设备实例名前缀（eth、wlan、usb ...）
[[nodiscard]] auto DeviceClassPrefix(DeviceClass device_class) -> const char*;

/// 设备生命周期状态，数值与 DeviceFsm 的状态 ID 一致
enum class DeviceState : uint8_t {
  kDiscovered = 0,
  kResourceReserved = 1,
  kInitializing = 2,
  kReady = 3,
  kFailed = 4,
  kRemoving = 5,
  kDestroyed = 6,
};

[[nodiscard]] auto DeviceStateName(DeviceState state) -> const char*;

/// 驱动声明的资源需求
struct ResourceRequest {
  uint8_t irq_count{0};
  uint8_t dma_count{0};
  uint64_t mmio_size{0};
  uint64_t mmio_alignment{devmgr::config::kMmioGranularity};

  [[nodiscard]] auto IsEmpty() const -> bool {
    return irq_count == 0 && dma_count == 0 && mmio_size == 0;
  }
};

/// MMIO 窗口
struct MmioWindow {
  uint64_t base{0};
  uint64_t size{0};

  [[nodiscard]] auto End() const -> uint64_t { return base + size; }

  [[nodiscard]] auto Overlaps(const MmioWindow& other) const -> bool {
    return size != 0 && other.size != 0 && base < other.End() &&
           other.base < End();
  }

  friend constexpr auto operator==(const MmioWindow&, const MmioWindow&)
      -> bool = default;
};

/**
 * @brief 资源授予
 * @note  handle 单调递增且永不复用，handle 为 0 表示无效授予。
 *        每份授予只能被释放一次。
 */
struct ResourceGrant {
  uint32_t handle{0};
  DeviceId owner{};
  uint32_t irq[devmgr::config::kMaxIrqsPerGrant]{};
  uint8_t irq_count{0};
  uint8_t dma[devmgr::config::kMaxDmaPerGrant]{};
  uint8_t dma_count{0};
  MmioWindow mmio{};

  [[nodiscard]] auto IsValid() const -> bool { return handle != 0; }

  friend constexpr auto operator==(const ResourceGrant&, const ResourceGrant&)
      -> bool = default;
};

/// 热插拔事件类型
enum class HotplugEventType : uint8_t {
  kAdded,
  kRemoved,
  kChanged,
};

/// 热插拔事件
struct HotplugEvent {
  HotplugEventType type{HotplugEventType::kAdded};
  DeviceId id{};

  friend constexpr auto operator==(const HotplugEvent&, const HotplugEvent&)
      -> bool = default;
};

#endif /* DEVMGR_SRC_DEVICE_INCLUDE_DEVICE_TYPES_HPP_ */
