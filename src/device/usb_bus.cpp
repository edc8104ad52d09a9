/**
 * @copyright Copyright The DevMgr Contributors
 */

#include "usb_bus.hpp"

#include <algorithm>

#include "kernel_log.hpp"

namespace {

[[nodiscard]] auto ReadLe16(const uint8_t* data) -> uint16_t {
  return static_cast<uint16_t>(data[0] | (data[1] << 8));
}

}  // namespace

auto UsbBus::ProbePort(uint8_t port, UsbSpeed speed) -> Expected<UsbIdentity> {
  uint8_t device[usb_desc::kDeviceLength]{};
  auto device_len =
      controller_.GetDescriptor(port, usb_desc::kDevice,
                                etl::span<uint8_t>(device, sizeof(device)));
  if (!device_len.has_value()) {
    return std::unexpected(device_len.error());
  }
  if (*device_len < usb_desc::kDeviceLength ||
      device[0] != usb_desc::kDeviceLength || device[1] != usb_desc::kDevice) {
    klog::Err("UsbBus: port %u bad device descriptor len=%zu bLength=%u\n",
              port, *device_len, device[0]);
    return std::unexpected(Error(ErrorCode::kMalformedResponse));
  }

  UsbIdentity usb{};
  usb.device_class = device[4];
  usb.device_subclass = device[5];
  usb.device_protocol = device[6];
  usb.vendor_id = ReadLe16(&device[8]);
  usb.product_id = ReadLe16(&device[10]);
  usb.bcd_device = ReadLe16(&device[12]);
  usb.speed = speed;

  uint8_t config[kConfigBufferSize]{};
  auto config_len = controller_.GetDescriptor(
      port, usb_desc::kConfiguration,
      etl::span<uint8_t>(config, sizeof(config)));
  if (!config_len.has_value()) {
    return std::unexpected(config_len.error());
  }
  if (*config_len < usb_desc::kConfigurationLength ||
      config[0] != usb_desc::kConfigurationLength ||
      config[1] != usb_desc::kConfiguration) {
    klog::Err("UsbBus: port %u bad configuration descriptor\n", port);
    return std::unexpected(Error(ErrorCode::kMalformedResponse));
  }

  // wTotalLength 可能超过缓冲区，只解析已读到且在缓冲区内的部分
  size_t total = std::min<size_t>(
      {ReadLe16(&config[2]), *config_len, sizeof(config)});
  size_t offset = config[0];
  while (offset + 2 <= total) {
    uint8_t length = config[offset];
    uint8_t type = config[offset + 1];
    if (length < 2 || offset + length > total) {
      klog::Err("UsbBus: port %u descriptor chain broken at %zu\n", port,
                offset);
      return std::unexpected(Error(ErrorCode::kMalformedResponse));
    }
    if (type == usb_desc::kInterface && length >= usb_desc::kInterfaceLength) {
      usb.interface_class = config[offset + 5];
      usb.interface_subclass = config[offset + 6];
      usb.interface_protocol = config[offset + 7];
      break;
    }
    offset += length;
  }

  return usb;
}

auto UsbBus::Enumerate(RawDeviceDescriptor* out, size_t max)
    -> Expected<size_t> {
  if (!controller_.IsPresent()) {
    return std::unexpected(Error(ErrorCode::kBusNotPresent));
  }

  size_t count = 0;
  auto bus = controller_.GetBusNumber();
  auto ports = controller_.GetPortCount();
  for (uint16_t index = 1; index <= ports; ++index) {
    auto port = static_cast<uint8_t>(index);
    auto status = controller_.GetPortStatus(port);
    if (!status.has_value()) {
      return std::unexpected(status.error());
    }
    if (!status->connected) {
      continue;
    }
    if (count >= max) {
      // 缓冲区已满：只计数，不再读取描述符
      ++count;
      continue;
    }

    auto identity = ProbePort(port, status->speed);
    if (!identity.has_value()) {
      return std::unexpected(identity.error());
    }

    out[count].id = DeviceId::Usb(bus, port);
    out[count].identity = *identity;
    klog::Debug("UsbBus: %u-%u %04x:%04x class %02x/%02x\n", bus, port,
                identity->vendor_id, identity->product_id,
                identity->device_class, identity->interface_class);
    ++count;
  }

  if (count > max) {
    klog::Warn("UsbBus: %zu device(s) connected, buffer holds %zu\n", count,
               max);
  }
  return count;
}
