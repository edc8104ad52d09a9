/**
 * @copyright Copyright The DevMgr Contributors
 */

#include "bluetooth_bus.hpp"

#include <algorithm>
#include <iterator>

#include "kernel_log.hpp"

auto BluetoothBus::Enumerate(RawDeviceDescriptor* out, size_t max)
    -> Expected<size_t> {
  if (!transport_.IsPresent()) {
    return std::unexpected(Error(ErrorCode::kBusNotPresent));
  }
  auto local = transport_.ReadLocalInfo();
  if (!local.has_value()) {
    return std::unexpected(local.error());
  }
  if (local->class_of_device > kClassOfDeviceMask) {
    return std::unexpected(Error(ErrorCode::kMalformedResponse));
  }

  BluetoothIdentity controller{};
  std::copy(std::begin(local->bd_addr), std::end(local->bd_addr),
            controller.bd_addr);
  controller.class_of_device = local->class_of_device;
  controller.local_controller = true;
  auto local_id = DeviceId::Bluetooth(local->bd_addr);
  if (max > 0) {
    out[0].id = local_id;
    out[0].identity = controller;
  }
  size_t count = 1;

  auto found = transport_.Inquiry(
      timeout_ms_, etl::span<HciInquiryResult>(results_, std::size(results_)));
  if (!found.has_value()) {
    klog::Warn("BluetoothBus: inquiry failed: %s\n", found.error().message());
    return std::unexpected(found.error());
  }
  if (*found > std::size(results_)) {
    return std::unexpected(Error(ErrorCode::kMalformedResponse));
  }

  for (size_t i = 0; i < *found; ++i) {
    const auto& result = results_[i];
    if (result.class_of_device > kClassOfDeviceMask) {
      klog::Err("BluetoothBus: class of device 0x%x out of range\n",
                result.class_of_device);
      return std::unexpected(Error(ErrorCode::kMalformedResponse));
    }

    // 与本机地址或更早的应答重复时只保留第一条
    auto id = DeviceId::Bluetooth(result.bd_addr);
    bool duplicate =
        id == local_id ||
        std::any_of(results_, results_ + i, [id](const HciInquiryResult& seen) {
          return DeviceId::Bluetooth(seen.bd_addr) == id;
        });
    if (duplicate) {
      continue;
    }
    if (count >= max) {
      ++count;
      continue;
    }

    BluetoothIdentity remote{};
    std::copy(std::begin(result.bd_addr), std::end(result.bd_addr),
              remote.bd_addr);
    remote.class_of_device = result.class_of_device;
    remote.rssi = result.rssi;
    out[count].id = id;
    out[count].identity = remote;
    ++count;
  }

  if (count > max) {
    klog::Warn("BluetoothBus: %zu device(s) found, buffer holds %zu\n", count,
               max);
  }
  klog::Debug("BluetoothBus: %zu device(s) including local controller\n",
              count);
  return count;
}
