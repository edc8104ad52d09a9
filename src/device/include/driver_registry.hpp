/**
 * @copyright Copyright The DevMgr Contributors
 * @brief 驱动工厂注册表与 DeviceDriver concept
 */

#ifndef DEVMGR_SRC_DEVICE_INCLUDE_DRIVER_REGISTRY_HPP_
#define DEVMGR_SRC_DEVICE_INCLUDE_DRIVER_REGISTRY_HPP_

#include <etl/delegate.h>
#include <etl/memory.h>
#include <etl/optional.h>

#include <array>
#include <concepts>
#include <cstddef>

#include "device.hpp"
#include "device_descriptor.hpp"
#include "device_types.hpp"
#include "expected.hpp"
#include "kernel_log.hpp"
#include "spinlock.hpp"

/// 驱动描述符
struct DriverDescriptor {
  /// 驱动名称（用于日志）
  const char* name;
  /// 驱动负责的设备类别
  DeviceClass device_class;
  /// 设备需要的资源；描述符不使用中断时 irq_count 会被忽略
  ResourceRequest request;
};

/// 驱动工厂签名：根据描述符与资源授予构造设备对象
using DriverFactory = etl::delegate<Expected<etl::unique_ptr<Device>>(
    const RawDeviceDescriptor&, const ResourceGrant&)>;

/// 驱动 concept：所有驱动必须满足
template <typename D>
concept DeviceDriver = requires(D d, const RawDeviceDescriptor& descriptor,
                                const ResourceGrant& grant) {
  { D::GetDescriptor() } -> std::same_as<const DriverDescriptor&>;
  {
    d.Create(descriptor, grant)
  } -> std::same_as<Expected<etl::unique_ptr<Device>>>;
};

/// 类型擦除的驱动注册项
struct DriverEntry {
  const DriverDescriptor* descriptor{nullptr};
  DriverFactory create;
};

/**
 * @brief 驱动注册表
 *
 * 以 DeviceClass 为下标的封闭分发表，每个类别至多一个驱动工厂。
 * 驱动对象由调用者持有，生存期须长于注册表。
 */
class DriverRegistry {
 public:
  /**
   * @brief  注册一个驱动（编译期类型安全，运行期类型擦除存储）
   * @tparam D              驱动类型
   * @param  driver         驱动实例
   * @return Expected<void> 同一类别重复注册返回 kDriverAlreadyRegistered
   */
  template <DeviceDriver D>
  auto Register(D& driver) -> Expected<void> {
    const auto& descriptor = D::GetDescriptor();
    auto index = static_cast<size_t>(descriptor.device_class);

    LockGuard guard(lock_);
    if (drivers_[index].descriptor != nullptr) {
      klog::Err("DriverRegistry: class %s already served by '%s'\n",
                DeviceClassName(descriptor.device_class),
                drivers_[index].descriptor->name);
      return std::unexpected(Error(ErrorCode::kDriverAlreadyRegistered));
    }

    drivers_[index] = DriverEntry{
        .descriptor = &descriptor,
        .create = DriverFactory::create<D, &D::Create>(driver),
    };

    klog::Info("DriverRegistry: '%s' registered for %s\n", descriptor.name,
               DeviceClassName(descriptor.device_class));
    return {};
  }

  /**
   * @brief  查找设备类别对应的驱动
   * @return 未注册时返回 nullopt，调用者应回退到 GenericDevice
   */
  [[nodiscard]] auto FindDriver(DeviceClass device_class) const
      -> etl::optional<DriverEntry> {
    LockGuard guard(lock_);
    const auto& entry = drivers_[static_cast<size_t>(device_class)];
    if (entry.descriptor == nullptr) {
      return etl::nullopt;
    }
    return entry;
  }

  /// 已注册的驱动数量
  [[nodiscard]] auto Count() const -> size_t {
    LockGuard guard(lock_);
    size_t count = 0;
    for (const auto& entry : drivers_) {
      if (entry.descriptor != nullptr) {
        ++count;
      }
    }
    return count;
  }

  /// @name 构造/析构函数
  /// @{
  DriverRegistry() = default;
  ~DriverRegistry() = default;
  DriverRegistry(const DriverRegistry&) = delete;
  DriverRegistry(DriverRegistry&&) = delete;
  auto operator=(const DriverRegistry&) -> DriverRegistry& = delete;
  auto operator=(DriverRegistry&&) -> DriverRegistry& = delete;
  /// @}

 private:
  std::array<DriverEntry, kDeviceClassCount> drivers_{};
  mutable SpinLock lock_{"driver_registry"};
};

#endif /* DEVMGR_SRC_DEVICE_INCLUDE_DRIVER_REGISTRY_HPP_ */
