/**
 * @copyright Copyright The DevMgr Contributors
 * @brief 设备注册表：DeviceId 到设备记录的唯一映射
 */

#ifndef DEVMGR_SRC_DEVICE_INCLUDE_DEVICE_REGISTRY_HPP_
#define DEVMGR_SRC_DEVICE_INCLUDE_DEVICE_REGISTRY_HPP_

#include <etl/memory.h>
#include <etl/string.h>
#include <etl/vector.h>

#include <array>
#include <cstddef>
#include <cstdint>

#include "device.hpp"
#include "device_descriptor.hpp"
#include "device_fsm.hpp"
#include "device_types.hpp"
#include "devmgr_config.hpp"
#include "expected.hpp"
#include "resource_arbiter.hpp"
#include "spinlock.hpp"

/// 设备实例名（eth0、hci1 ...）
using DeviceName = etl::string<devmgr::config::kMaxDeviceNameLength>;

/**
 * @brief 设备只读视图
 * @note  值拷贝，读取后与注册表无关联，不能驱动 Init/Shutdown
 */
struct DeviceView {
  DeviceId id{};
  DeviceClass device_class{DeviceClass::kUnknown};
  DeviceState state{DeviceState::kDiscovered};
  /// 仅在 Failed 状态下有意义
  Error failure{ErrorCode::kSuccess};
  /// Failed 设备的授予已归还，handle 为 0
  ResourceGrant grant{};
  DeviceName name;
  RawDeviceDescriptor descriptor{};
};

/// 设备记录，仅由 DeviceManager 在锁外构造、由注册表在锁内修改
struct DeviceRecord {
  DeviceRecord(const RawDeviceDescriptor& raw, DeviceClass cls)
      : descriptor(raw), device_class(cls) {
    fsm.Start();
  }

  [[nodiscard]] auto GetState() const -> DeviceState {
    return fsm.GetState();
  }

  [[nodiscard]] auto MakeView() const -> DeviceView;

  RawDeviceDescriptor descriptor;
  DeviceClass device_class;
  Error failure{ErrorCode::kSuccess};
  ResourceGrant grant{};
  etl::unique_ptr<Device> driver;
  DeviceName name;
  /// 类别内实例编号，插入时由注册表分配
  size_t instance{0};
  DeviceFsm fsm;

  /// @name 构造/析构函数
  /// @{
  DeviceRecord(const DeviceRecord&) = delete;
  DeviceRecord(DeviceRecord&&) = delete;
  auto operator=(const DeviceRecord&) -> DeviceRecord& = delete;
  auto operator=(DeviceRecord&&) -> DeviceRecord& = delete;
  ~DeviceRecord() = default;
  /// @}
};

/**
 * @brief 设备注册表
 *
 * 所有修改操作在同一把锁下进行，记录整体插入、替换或驱逐，
 * 读者只能得到值拷贝。
 *
 * @note 锁顺序：DeviceRegistry 锁 -> ResourceArbiter 锁
 */
class DeviceRegistry {
 public:
  /**
   * @brief  插入一条处于终态（Ready 或 Failed）的记录
   * @param  record         新记录，仅在成功时被移走
   * @return Expected<DeviceView> 插入后的视图（含分配的实例名）；
   *         kDeviceAlreadyExists / kDeviceRegistryFull / kDeviceInvalidState
   */
  auto Insert(etl::unique_ptr<DeviceRecord>&& record) -> Expected<DeviceView>;

  /// id 是否已有记录
  [[nodiscard]] auto Contains(DeviceId id) const -> bool;

  /**
   * @brief  查询设备
   * @return Expected<DeviceView> 不存在时返回 kDeviceNotFound
   */
  [[nodiscard]] auto Find(DeviceId id) const -> Expected<DeviceView>;

  /// 按插入顺序列出设备视图，返回写入数量
  auto List(DeviceView* out, size_t max) const -> size_t;

  /// 列出指定类别的设备视图
  auto ListByClass(DeviceClass device_class, DeviceView* out,
                   size_t max) const -> size_t;

  /// 按插入顺序列出指定总线族的设备标识
  auto ListIds(BusFamily family, DeviceId* out, size_t max) const -> size_t;

  /// 按插入顺序列出全部设备标识
  auto ListIds(DeviceId* out, size_t max) const -> size_t;

  [[nodiscard]] auto Count() const -> size_t;

  /// 记录表是否已满
  [[nodiscard]] auto IsFull() const -> bool;

  /**
   * @brief  整体替换设备的描述符快照（辅助字段变化）
   * @return Expected<void> kDeviceNotFound / kDeviceInvalidState
   */
  auto ReplaceDescriptor(const RawDeviceDescriptor& descriptor)
      -> Expected<void>;

  /**
   * @brief  开始移除：Ready -> Removing
   * @return Expected<Device*> 需要在锁外 Shutdown 的驱动；
   *         Failed 记录没有需要关闭的驱动，返回 nullptr
   */
  auto BeginRemoval(DeviceId id) -> Expected<Device*>;

  /**
   * @brief  完成移除：Removing -> Destroyed，归还授予，驱逐记录
   * @param  id             设备标识
   * @param  clean          驱动 Shutdown() 是否成功
   * @param  arbiter        授予归还的仲裁器
   * @return Expected<void> 归还失败时返回仲裁器的错误，记录仍被驱逐
   */
  auto CompleteRemoval(DeviceId id, bool clean, ResourceArbiter& arbiter)
      -> Expected<void>;

  /// @name 构造/析构函数
  /// @{
  DeviceRegistry() = default;
  ~DeviceRegistry() = default;
  DeviceRegistry(const DeviceRegistry&) = delete;
  DeviceRegistry(DeviceRegistry&&) = delete;
  auto operator=(const DeviceRegistry&) -> DeviceRegistry& = delete;
  auto operator=(DeviceRegistry&&) -> DeviceRegistry& = delete;
  /// @}

 private:
  using RecordTable = etl::vector<etl::unique_ptr<DeviceRecord>,
                                  devmgr::config::kMaxDevices>;

  [[nodiscard]] auto FindLocked(DeviceId id) -> RecordTable::iterator;
  [[nodiscard]] auto FindLocked(DeviceId id) const
      -> RecordTable::const_iterator;

  /// 分配该类别最小的空闲实例编号
  auto AssignName(DeviceRecord& record) -> void;
  auto ReleaseName(const DeviceRecord& record) -> void;

  static_assert(devmgr::config::kMaxInstancesPerClass <= 64,
                "instance bitmap is 64 bits wide");

  RecordTable records_;
  /// 每个类别已占用的实例编号位图
  std::array<uint64_t, kDeviceClassCount> instance_slots_{};
  mutable SpinLock lock_{"device_registry"};
};

#endif /* DEVMGR_SRC_DEVICE_INCLUDE_DEVICE_REGISTRY_HPP_ */
