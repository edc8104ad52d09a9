/**
 * @copyright Copyright The DevMgr Contributors
 */

#ifndef DEVMGR_SRC_DEVICE_INCLUDE_DEVICE_MANAGER_HPP_
#define DEVMGR_SRC_DEVICE_INCLUDE_DEVICE_MANAGER_HPP_

#include <etl/vector.h>

#include <cstddef>

#include "bus.hpp"
#include "device_descriptor.hpp"
#include "device_registry.hpp"
#include "device_types.hpp"
#include "devmgr_config.hpp"
#include "driver_registry.hpp"
#include "expected.hpp"
#include "hotplug_manager.hpp"
#include "kernel_log.hpp"
#include "resource_arbiter.hpp"
#include "spinlock.hpp"

/**
 * @brief  设备管理器：总线枚举、资源仲裁、驱动绑定与热插拔的统一入口
 *
 * 由内核启动代码构造并持有，生存期覆盖整个内核运行期。
 * 驱动的 Init()/Shutdown() 与总线探测都在不持有任何锁的情况下进行。
 */
class DeviceManager {
 public:
  explicit DeviceManager(const ArbiterConfig& config = {}) : arbiter_(config) {}

  /**
   * @brief  注册一个总线枚举器
   * @note   必须在第一次 DetectAll() 之前调用
   * @tparam B              总线类型
   * @param  bus            总线实例，由调用者持有
   * @return Expected<void> kBusAlreadyRegistered / kBusRegistrationClosed
   */
  template <BusEnumerator B>
  auto RegisterBusEnumerator(B& bus) -> Expected<void> {
    LockGuard guard(bus_lock_);

    if (detection_started_) {
      klog::Err("DeviceManager: bus '%s' registered after detection\n",
                B::GetName());
      return std::unexpected(Error(ErrorCode::kBusRegistrationClosed));
    }
    for (const auto& entry : buses_) {
      if (entry.family == B::GetFamily()) {
        return std::unexpected(Error(ErrorCode::kBusAlreadyRegistered));
      }
    }
    if (buses_.full()) {
      return std::unexpected(Error(ErrorCode::kOutOfMemory));
    }

    buses_.push_back(BusEntry{
        .name = B::GetName(),
        .family = B::GetFamily(),
        .enumerate = EnumerateFunction::create<B, &B::Enumerate>(bus),
    });

    klog::Info("DeviceManager: bus '%s' registered\n", B::GetName());
    return {};
  }

  /**
   * @brief  注册设备驱动
   * @tparam D              驱动类型
   * @param  driver         驱动实例，由调用者持有
   */
  template <DeviceDriver D>
  auto RegisterDriver(D& driver) -> Expected<void> {
    return drivers_.Register(driver);
  }

  /// 注册热插拔监听者，可在任意时刻调用
  auto RegisterHotplugListener(HotplugListener listener) -> Expected<void> {
    return hotplug_.RegisterListener(listener);
  }

  /**
   * @brief  按注册顺序枚举所有总线并插入新发现的设备
   * @note   幂等：已在注册表中的设备被跳过。单条总线失败只记录日志，
   *         ProbeTimeout 会安排在下一个重试 tick 重新枚举
   * @return Expected<void> 成功时返回 void
   */
  auto DetectAll() -> Expected<void>;

  /**
   * @brief  查询设备
   * @return Expected<DeviceView> 不存在时返回 kDeviceNotFound
   */
  [[nodiscard]] auto GetDevice(DeviceId id) const -> Expected<DeviceView> {
    return registry_.Find(id);
  }

  /**
   * @brief  列出所有设备（包括 Failed 设备）
   * @param  out            输出视图数组
   * @param  max            最大数量
   * @return size_t         实际写入数量
   */
  auto ListDevices(DeviceView* out, size_t max) const -> size_t {
    return registry_.List(out, max);
  }

  /// 列出指定类别的设备
  auto ListDevicesByClass(DeviceClass device_class, DeviceView* out,
                          size_t max) const -> size_t {
    return registry_.ListByClass(device_class, out, max);
  }

  [[nodiscard]] auto CountDevices() const -> size_t {
    return registry_.Count();
  }

  /**
   * @brief  移除设备：Ready -> Removing -> Shutdown -> 归还资源 -> 驱逐
   * @note   驱逐完成后才发布 Removed。Failed 设备直接驱逐
   * @return Expected<void> Shutdown 失败时返回 kDeviceShutdownFailed，
   *         但设备仍被移除
   */
  auto RemoveDevice(DeviceId id) -> Expected<void>;

  /**
   * @brief  按插入逆序移除所有设备
   * @return Expected<void> 返回遇到的第一个错误，所有设备仍被移除
   */
  auto ShutdownAll() -> Expected<void>;

  auto GetHotplugManager() -> HotplugManager& { return hotplug_; }

  [[nodiscard]] auto GetArbiter() const -> const ResourceArbiter& {
    return arbiter_;
  }

  /// @name 构造/析构函数
  /// @{
  ~DeviceManager() = default;
  DeviceManager(const DeviceManager&) = delete;
  DeviceManager(DeviceManager&&) = delete;
  auto operator=(const DeviceManager&) -> DeviceManager& = delete;
  auto operator=(DeviceManager&&) -> DeviceManager& = delete;
  /// @}

 private:
  friend class HotplugManager;

  using BusTable = etl::vector<BusEntry, devmgr::config::kMaxBusEnumerators>;

  /// 调用指定总线族的枚举器（不持有任何锁）
  auto EnumerateBus(BusFamily family, RawDeviceDescriptor* out, size_t max)
      -> Expected<size_t>;

  /**
   * @brief  插入路径：分类 -> 申请资源 -> 构造驱动 -> Init -> 插入注册表
   * @return Expected<DeviceView> Failed 设备同样被插入并返回视图；
   *         仅在注册表拒绝插入时返回错误
   */
  auto InsertDevice(const RawDeviceDescriptor& descriptor)
      -> Expected<DeviceView>;

  /// 替换辅助字段变化的设备快照并发布 Changed
  auto RefreshDevice(const RawDeviceDescriptor& descriptor) -> Expected<void>;

  /// 设备转入 Failed：归还资源，销毁驱动对象
  auto FailRecord(DeviceRecord& record, ErrorCode cause) -> void;

  /// 归还授予，失败说明不变量被破坏
  auto ReleaseGrant(ResourceGrant& grant) -> void;

  /// 记录枚举失败并决定是否安排重试
  auto ReportEnumerationError(const BusEntry& bus, const Error& error) -> void;

  BusTable buses_;
  bool detection_started_{false};
  SpinLock bus_lock_{"device_manager_bus"};

  DriverRegistry drivers_;
  ResourceArbiter arbiter_;
  DeviceRegistry registry_;
  HotplugManager hotplug_{*this};

  /// DetectAll() 的枚举缓冲区
  RawDeviceDescriptor scratch_[devmgr::config::kMaxDescriptorsPerBus]{};
};

#endif /* DEVMGR_SRC_DEVICE_INCLUDE_DEVICE_MANAGER_HPP_ */
