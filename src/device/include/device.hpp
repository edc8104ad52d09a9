/**
 * @copyright Copyright The DevMgr Contributors
 */

#ifndef DEVMGR_SRC_DEVICE_INCLUDE_DEVICE_HPP_
#define DEVMGR_SRC_DEVICE_INCLUDE_DEVICE_HPP_

#include "device_types.hpp"
#include "expected.hpp"

/**
 * @brief 设备能力接口
 *
 * 每个已探测的设备由一个实现此接口的驱动对象表示，
 * 由设备注册表独占持有。
 *
 * @pre  Init() 与 Shutdown() 在不持有任何管理器锁的工作上下文中调用
 * @post Shutdown() 无论成败都不会再被调用第二次
 */
class Device {
 public:
  /// 设备标识
  [[nodiscard]] virtual auto GetId() const -> DeviceId = 0;

  /// 设备类别
  [[nodiscard]] virtual auto GetClass() const -> DeviceClass = 0;

  /**
   * @brief  初始化硬件
   * @return Expected<void> 失败时设备转入 Failed
   */
  virtual auto Init() -> Expected<void> = 0;

  /**
   * @brief  关闭硬件
   * @return Expected<void> 失败仅记录日志，设备仍会被销毁
   */
  virtual auto Shutdown() -> Expected<void> = 0;

  /// @name 构造/析构函数
  /// @{
  Device() = default;
  Device(const Device&) = delete;
  Device(Device&&) = delete;
  auto operator=(const Device&) -> Device& = delete;
  auto operator=(Device&&) -> Device& = delete;
  virtual ~Device() = default;
  /// @}
};

/**
 * @brief 无驱动设备
 *
 * 没有注册驱动工厂的类别（桥、未知设备等）使用此实现，
 * 不申请资源，Init/Shutdown 立即成功。
 */
class GenericDevice final : public Device {
 public:
  GenericDevice(DeviceId id, DeviceClass device_class)
      : id_(id), class_(device_class) {}

  [[nodiscard]] auto GetId() const -> DeviceId override { return id_; }
  [[nodiscard]] auto GetClass() const -> DeviceClass override {
    return class_;
  }
  auto Init() -> Expected<void> override { return {}; }
  auto Shutdown() -> Expected<void> override { return {}; }

 private:
  DeviceId id_;
  DeviceClass class_;
};

#endif /* DEVMGR_SRC_DEVICE_INCLUDE_DEVICE_HPP_ */
