/**
 * @copyright Copyright The DevMgr Contributors
 */

#ifndef DEVMGR_SRC_DEVICE_INCLUDE_BUS_HPP_
#define DEVMGR_SRC_DEVICE_INCLUDE_BUS_HPP_

#include <etl/delegate.h>

#include <concepts>
#include <cstddef>

#include "device_descriptor.hpp"
#include "device_types.hpp"
#include "expected.hpp"

/**
 * @brief 总线枚举器 concept：每种总线负责枚举自己管辖范围内的设备
 * @note  Enumerate() 只读探测、可重复调用；总线部分存在时返回空序列。
 *        单次调用内不重试超时，由热插拔 tick 负责重试。
 *        返回值是总线上实际存在的设备数，可能大于 max；
 *        只有前 min(返回值, max) 项被写入 out[]。
 */
template <typename B>
concept BusEnumerator = requires(B b, RawDeviceDescriptor* out, size_t max) {
  /// 枚举该总线上所有设备，填充到 out[]，返回发现的设备总数
  { b.Enumerate(out, max) } -> std::same_as<Expected<size_t>>;
  /// 返回总线名称（用于日志）
  { B::GetName() } -> std::same_as<const char*>;
  /// 返回总线族
  { B::GetFamily() } -> std::same_as<BusFamily>;
};

/// 枚举结果中实际写入 out[] 的项数
[[nodiscard]] inline auto FilledCount(size_t found, size_t max) -> size_t {
  return found < max ? found : max;
}

/// 类型擦除的枚举函数
using EnumerateFunction =
    etl::delegate<Expected<size_t>(RawDeviceDescriptor*, size_t)>;

/// 类型擦除的总线注册项，总线实例由调用者持有
struct BusEntry {
  const char* name{nullptr};
  BusFamily family{BusFamily::kPlatform};
  EnumerateFunction enumerate;
};

#endif /* DEVMGR_SRC_DEVICE_INCLUDE_BUS_HPP_ */
