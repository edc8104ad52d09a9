/**
 * @copyright Copyright The DevMgr Contributors
 * @brief 设备分类表与描述符比较
 */

#include "device_descriptor.hpp"

#include <etl/string_view.h>

#include <type_traits>

namespace {

/// PCI 基类代码
namespace pci_class {
constexpr uint8_t kMassStorage = 0x01;
constexpr uint8_t kNetwork = 0x02;
constexpr uint8_t kDisplay = 0x03;
constexpr uint8_t kMultimedia = 0x04;
constexpr uint8_t kBridge = 0x06;
constexpr uint8_t kSerialBus = 0x0C;
constexpr uint8_t kWireless = 0x0D;
}  // namespace pci_class

/// USB 类代码
namespace usb_class {
constexpr uint8_t kPerInterface = 0x00;
constexpr uint8_t kAudio = 0x01;
constexpr uint8_t kCommunications = 0x02;
constexpr uint8_t kMassStorage = 0x08;
constexpr uint8_t kHub = 0x09;
constexpr uint8_t kVideo = 0x0E;
constexpr uint8_t kWirelessController = 0xE0;
constexpr uint8_t kMiscellaneous = 0xEF;
}  // namespace usb_class

auto ClassifyPci(const PciIdentity& pci) -> DeviceClass {
  switch (pci.class_code) {
    case pci_class::kMassStorage:
      return DeviceClass::kStorageAta;
    case pci_class::kNetwork:
      // 0x80 (Other) 几乎都是无线网卡
      return pci.subclass == 0x80 ? DeviceClass::kNetworkWifi
                                  : DeviceClass::kNetworkEthernet;
    case pci_class::kDisplay:
      return DeviceClass::kVideoAdapter;
    case pci_class::kMultimedia:
      if (pci.subclass == 0x00) {
        return DeviceClass::kVideoAdapter;
      }
      if (pci.subclass == 0x01 || pci.subclass == 0x03) {
        return DeviceClass::kAudioAdapter;
      }
      return DeviceClass::kUnknown;
    case pci_class::kBridge:
      return DeviceClass::kBridge;
    case pci_class::kSerialBus:
      // USB 主控制器桥接到下游 USB 总线
      return pci.subclass == 0x03 ? DeviceClass::kBridge
                                  : DeviceClass::kUnknown;
    case pci_class::kWireless:
      if (pci.subclass == 0x11) {
        return DeviceClass::kBluetoothAdapter;
      }
      if (pci.subclass == 0x20 || pci.subclass == 0x21) {
        return DeviceClass::kNetworkWifi;
      }
      return DeviceClass::kUnknown;
    default:
      return DeviceClass::kUnknown;
  }
}

auto ClassifyUsbTriad(uint8_t cls, uint8_t subclass, uint8_t protocol)
    -> DeviceClass {
  switch (cls) {
    case usb_class::kAudio:
      return DeviceClass::kAudioAdapter;
    case usb_class::kCommunications:
      // ECM / NCM
      if (subclass == 0x06 || subclass == 0x0D) {
        return DeviceClass::kNetworkEthernet;
      }
      return DeviceClass::kUnknown;
    case usb_class::kMassStorage:
      return DeviceClass::kStorageUsb;
    case usb_class::kHub:
      return DeviceClass::kBridge;
    case usb_class::kVideo:
      return DeviceClass::kVideoAdapter;
    case usb_class::kWirelessController:
      if (subclass == 0x01 && protocol == 0x01) {
        return DeviceClass::kBluetoothAdapter;
      }
      // RNDIS
      if (subclass == 0x01 && protocol == 0x03) {
        return DeviceClass::kNetworkEthernet;
      }
      return DeviceClass::kUnknown;
    default:
      return DeviceClass::kUnknown;
  }
}

auto ClassifyUsb(const UsbIdentity& usb) -> DeviceClass {
  if (usb.device_class == usb_class::kPerInterface ||
      usb.device_class == usb_class::kMiscellaneous) {
    return ClassifyUsbTriad(usb.interface_class, usb.interface_subclass,
                            usb.interface_protocol);
  }
  return ClassifyUsbTriad(usb.device_class, usb.device_subclass,
                          usb.device_protocol);
}

/// Class of Device 主类别
namespace cod_major {
constexpr uint32_t kLanAccessPoint = 0x03;
constexpr uint32_t kAudioVideo = 0x04;
constexpr uint32_t kImaging = 0x06;
}  // namespace cod_major

[[nodiscard]] auto CodMajor(uint32_t cod) -> uint32_t {
  return (cod >> 8) & 0x1F;
}

auto ClassifyBluetooth(const BluetoothIdentity& bt) -> DeviceClass {
  if (bt.local_controller) {
    return DeviceClass::kBluetoothAdapter;
  }
  auto minor = (bt.class_of_device >> 2) & 0x3F;
  switch (CodMajor(bt.class_of_device)) {
    case cod_major::kLanAccessPoint:
      return DeviceClass::kNetworkWifi;
    case cod_major::kAudioVideo:
      // 0x0B (VCR) .. 0x10 (Video Conferencing) 为视频设备
      if (minor >= 0x0B && minor <= 0x10) {
        return DeviceClass::kVideoAdapter;
      }
      return DeviceClass::kAudioAdapter;
    case cod_major::kImaging:
      // minor bit 5: camera
      return (bt.class_of_device & 0x80) != 0 ? DeviceClass::kVideoAdapter
                                              : DeviceClass::kUnknown;
    default:
      return DeviceClass::kUnknown;
  }
}

/// compatible 关键字 -> 设备类别
struct CompatibleRule {
  const char* keyword;
  DeviceClass device_class;
};

constexpr CompatibleRule kCompatibleRules[] = {
    {"bluetooth", DeviceClass::kBluetoothAdapter},
    {"wlan", DeviceClass::kNetworkWifi},
    {"wifi", DeviceClass::kNetworkWifi},
    {"ethernet", DeviceClass::kNetworkEthernet},
    {"dwmac", DeviceClass::kNetworkEthernet},
    {"smc91", DeviceClass::kNetworkEthernet},
    {"ahci", DeviceClass::kStorageAta},
    {"sata", DeviceClass::kStorageAta},
    {"pata", DeviceClass::kStorageAta},
    {"xhci", DeviceClass::kBridge},
    {"ehci", DeviceClass::kBridge},
    {"ohci", DeviceClass::kBridge},
    {"pci-host", DeviceClass::kBridge},
    {"pcie", DeviceClass::kBridge},
    {"hda", DeviceClass::kAudioAdapter},
    {"audio", DeviceClass::kAudioAdapter},
    {"sound", DeviceClass::kAudioAdapter},
    {"i2s", DeviceClass::kAudioAdapter},
    {"framebuffer", DeviceClass::kVideoAdapter},
    {"display", DeviceClass::kVideoAdapter},
    {"gpu", DeviceClass::kVideoAdapter},
};

auto ClassifyPlatform(const PlatformIdentity& platform) -> DeviceClass {
  etl::string_view compatible(platform.compatible.data(),
                              platform.compatible.size());
  for (const auto& rule : kCompatibleRules) {
    if (compatible.find(rule.keyword) != etl::string_view::npos) {
      return rule.device_class;
    }
  }
  return DeviceClass::kUnknown;
}

}  // namespace

auto RawDeviceDescriptor::UsesInterrupt() const -> bool {
  return std::visit(
      [](const auto& identity) -> bool {
        using T = std::decay_t<decltype(identity)>;
        if constexpr (std::is_same_v<T, PciIdentity>) {
          return identity.interrupt_pin != 0;
        } else if constexpr (std::is_same_v<T, PlatformIdentity>) {
          return identity.irq != 0;
        } else {
          // USB / Bluetooth 设备经由主控制器中断
          return false;
        }
      },
      identity);
}

auto Classify(const RawDeviceDescriptor& descriptor) -> DeviceClass {
  return std::visit(
      [](const auto& identity) -> DeviceClass {
        using T = std::decay_t<decltype(identity)>;
        if constexpr (std::is_same_v<T, PciIdentity>) {
          return ClassifyPci(identity);
        } else if constexpr (std::is_same_v<T, UsbIdentity>) {
          return ClassifyUsb(identity);
        } else if constexpr (std::is_same_v<T, BluetoothIdentity>) {
          return ClassifyBluetooth(identity);
        } else {
          return ClassifyPlatform(identity);
        }
      },
      descriptor.identity);
}

auto IdentityMatches(const RawDeviceDescriptor& lhs,
                     const RawDeviceDescriptor& rhs) -> bool {
  if (lhs.id != rhs.id || lhs.identity.index() != rhs.identity.index()) {
    return false;
  }
  return std::visit(
      [&rhs](const auto& a) -> bool {
        using T = std::decay_t<decltype(a)>;
        const auto& b = std::get<T>(rhs.identity);
        if constexpr (std::is_same_v<T, PciIdentity>) {
          return a.vendor_id == b.vendor_id && a.device_id == b.device_id &&
                 a.class_code == b.class_code && a.subclass == b.subclass &&
                 a.prog_if == b.prog_if;
        } else if constexpr (std::is_same_v<T, UsbIdentity>) {
          return a.vendor_id == b.vendor_id && a.product_id == b.product_id &&
                 a.device_class == b.device_class &&
                 a.device_subclass == b.device_subclass &&
                 a.device_protocol == b.device_protocol &&
                 a.interface_class == b.interface_class &&
                 a.interface_subclass == b.interface_subclass &&
                 a.interface_protocol == b.interface_protocol;
        } else if constexpr (std::is_same_v<T, BluetoothIdentity>) {
          return a.local_controller == b.local_controller &&
                 CodMajor(a.class_of_device) == CodMajor(b.class_of_device);
        } else {
          return a.compatible == b.compatible;
        }
      },
      lhs.identity);
}

auto AuxiliaryMatches(const RawDeviceDescriptor& lhs,
                      const RawDeviceDescriptor& rhs) -> bool {
  if (lhs.identity.index() != rhs.identity.index()) {
    return false;
  }
  return std::visit(
      [&rhs](const auto& a) -> bool {
        using T = std::decay_t<decltype(a)>;
        const auto& b = std::get<T>(rhs.identity);
        if constexpr (std::is_same_v<T, PciIdentity>) {
          return a.revision == b.revision && a.header_type == b.header_type &&
                 a.interrupt_pin == b.interrupt_pin;
        } else if constexpr (std::is_same_v<T, UsbIdentity>) {
          return a.bcd_device == b.bcd_device && a.speed == b.speed;
        } else if constexpr (std::is_same_v<T, BluetoothIdentity>) {
          // RSSI 每次查询都会抖动，不参与比较
          return a.class_of_device == b.class_of_device;
        } else {
          return a.mmio_base == b.mmio_base && a.mmio_size == b.mmio_size &&
                 a.irq == b.irq;
        }
      },
      lhs.identity);
}
