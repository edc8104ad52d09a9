/**
 * @copyright Copyright The DevMgr Contributors
 */

#include "pci_bus.hpp"

#include "kernel_log.hpp"

auto PciBus::ProbeFunction(uint8_t bus, uint8_t slot, uint8_t function,
                           RawDeviceDescriptor& out) -> Expected<bool> {
  auto id_reg = config_.Read32(bus, slot, function, pci_reg::kVendorDevice);
  if (!id_reg.has_value()) {
    return std::unexpected(id_reg.error());
  }
  auto vendor = static_cast<uint16_t>(*id_reg & 0xFFFF);
  if (vendor == kInvalidVendor) {
    return false;
  }

  auto class_reg =
      config_.Read32(bus, slot, function, pci_reg::kClassRevision);
  if (!class_reg.has_value()) {
    return std::unexpected(class_reg.error());
  }
  auto header_reg = config_.Read32(bus, slot, function, pci_reg::kHeaderType);
  if (!header_reg.has_value()) {
    return std::unexpected(header_reg.error());
  }
  auto irq_reg = config_.Read32(bus, slot, function, pci_reg::kInterrupt);
  if (!irq_reg.has_value()) {
    return std::unexpected(irq_reg.error());
  }

  PciIdentity pci{};
  pci.vendor_id = vendor;
  pci.device_id = static_cast<uint16_t>(*id_reg >> 16);
  pci.revision = static_cast<uint8_t>(*class_reg & 0xFF);
  pci.prog_if = static_cast<uint8_t>((*class_reg >> 8) & 0xFF);
  pci.subclass = static_cast<uint8_t>((*class_reg >> 16) & 0xFF);
  pci.class_code = static_cast<uint8_t>(*class_reg >> 24);
  pci.header_type = static_cast<uint8_t>((*header_reg >> 16) & 0xFF);
  pci.interrupt_pin = static_cast<uint8_t>((*irq_reg >> 8) & 0xFF);

  if ((pci.header_type & ~kMultiFunctionBit) > kMaxHeaderLayout ||
      pci.interrupt_pin > 4) {
    klog::Err("PciBus: %02x:%02x.%x malformed header type=0x%x pin=%u\n", bus,
              slot, function, pci.header_type, pci.interrupt_pin);
    return std::unexpected(Error(ErrorCode::kMalformedResponse));
  }

  out.id = DeviceId::Pci(bus, slot, function);
  out.identity = pci;

  klog::Debug("PciBus: %02x:%02x.%x %04x:%04x class %02x:%02x\n", bus, slot,
              function, pci.vendor_id, pci.device_id, pci.class_code,
              pci.subclass);
  return true;
}

auto PciBus::Enumerate(RawDeviceDescriptor* out, size_t max)
    -> Expected<size_t> {
  if (!config_.IsPresent()) {
    return std::unexpected(Error(ErrorCode::kBusNotPresent));
  }

  size_t count = 0;
  // 缓冲区写满后继续探测，结果写入 spare，只计数
  RawDeviceDescriptor spare{};
  auto slot_for = [&]() -> RawDeviceDescriptor& {
    return count < max ? out[count] : spare;
  };

  auto bus_count = config_.GetBusCount();
  for (uint16_t bus = 0; bus < bus_count; ++bus) {
    for (uint8_t slot = 0; slot < kMaxSlots; ++slot) {
      auto& fn0_out = slot_for();
      auto present =
          ProbeFunction(static_cast<uint8_t>(bus), slot, 0, fn0_out);
      if (!present.has_value()) {
        return std::unexpected(present.error());
      }
      if (!*present) {
        continue;
      }

      const auto& fn0 = std::get<PciIdentity>(fn0_out.identity);
      bool multi_function = (fn0.header_type & kMultiFunctionBit) != 0;
      ++count;

      if (!multi_function) {
        continue;
      }
      for (uint8_t function = 1; function < kMaxFunctions; ++function) {
        auto found = ProbeFunction(static_cast<uint8_t>(bus), slot, function,
                                   slot_for());
        if (!found.has_value()) {
          return std::unexpected(found.error());
        }
        if (*found) {
          ++count;
        }
      }
    }
  }

  if (count > max) {
    klog::Warn("PciBus: %zu function(s) found, buffer holds %zu\n", count,
               max);
  }
  klog::Debug("PciBus: %zu function(s) found\n", count);
  return count;
}
