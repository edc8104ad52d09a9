/**
 * @copyright Copyright The DevMgr Contributors
 */

#include "platform_bus.hpp"

#include <etl/algorithm.h>
#include <etl/string_view.h>

#include "kernel_log.hpp"

auto PlatformBus::Enumerate(RawDeviceDescriptor* out, size_t max)
    -> Expected<size_t> {
  size_t count = 0;
  uint32_t index = 0;

  auto visitor = [&out, &count, &index, max](const PlatformNode& node) -> bool {
    auto node_index = index++;
    if (node.compatible == nullptr || node.compatible[0] == '\0') {
      return true;
    }
    if (count >= max) {
      ++count;
      return true;
    }

    etl::string_view compatible(node.compatible);
    PlatformIdentity platform{};
    if (compatible.size() > platform.compatible.capacity()) {
      klog::Warn(
          "PlatformBus: compatible truncated from %zu to %zu bytes for '%s'\n",
          compatible.size(), platform.compatible.capacity(), node.name);
    }
    auto length = etl::min(compatible.size(), platform.compatible.capacity());
    platform.compatible.assign(compatible.begin(),
                               compatible.begin() + length);
    platform.mmio_base = node.mmio_base;
    platform.mmio_size = node.mmio_size;
    platform.irq = node.irq;

    out[count].id = DeviceId::Platform(node_index);
    out[count].identity = platform;

    klog::Debug(
        "PlatformBus: found '%s' compatible='%s' mmio=0x%lX size=0x%lX "
        "irq=%u\n",
        node.name, node.compatible, node.mmio_base, node.mmio_size, node.irq);
    ++count;
    return true;
  };

  auto result = firmware_.ForEachNode(PlatformNodeVisitor(visitor));
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }
  if (count > max) {
    klog::Warn("PlatformBus: %zu node(s) found, buffer holds %zu\n", count,
               max);
  }
  return count;
}
