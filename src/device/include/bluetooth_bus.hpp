/**
 * @copyright Copyright The DevMgr Contributors
 */

#ifndef DEVMGR_SRC_DEVICE_INCLUDE_BLUETOOTH_BUS_HPP_
#define DEVMGR_SRC_DEVICE_INCLUDE_BLUETOOTH_BUS_HPP_

#include <etl/span.h>

#include <cstddef>
#include <cstdint>

#include "bus.hpp"
#include "device_descriptor.hpp"
#include "devmgr_config.hpp"
#include "expected.hpp"

/// HCI Inquiry 单条结果
struct HciInquiryResult {
  uint8_t bd_addr[6]{};
  uint32_t class_of_device{0};
  int8_t rssi{0};
};

/// 本机控制器信息
struct HciLocalInfo {
  uint8_t bd_addr[6]{};
  uint32_t class_of_device{0};
};

/**
 * @brief HCI 传输后端（只读探测）
 */
class HciTransport {
 public:
  /// 控制器是否存在
  [[nodiscard]] virtual auto IsPresent() const -> bool = 0;

  /**
   * @brief  读取本机控制器地址与类别
   * @return Expected<HciLocalInfo> 无应答返回 kProbeTimeout
   */
  virtual auto ReadLocalInfo() -> Expected<HciLocalInfo> = 0;

  /**
   * @brief  执行一次 Inquiry
   * @param  timeout_ms     等待 Inquiry Complete 的时间预算
   * @param  results        输出缓冲区
   * @return Expected<size_t> 写入的结果数；超时未收到 Inquiry Complete
   *         返回 kProbeTimeout
   */
  virtual auto Inquiry(uint32_t timeout_ms, etl::span<HciInquiryResult> results)
      -> Expected<size_t> = 0;

  /// @name 构造/析构函数
  /// @{
  HciTransport() = default;
  HciTransport(const HciTransport&) = delete;
  HciTransport(HciTransport&&) = delete;
  auto operator=(const HciTransport&) -> HciTransport& = delete;
  auto operator=(HciTransport&&) -> HciTransport& = delete;
  virtual ~HciTransport() = default;
  /// @}
};

/// Bluetooth 总线：本机控制器加上一次 Inquiry 发现的远端设备
class BluetoothBus {
 public:
  explicit BluetoothBus(HciTransport& transport,
                        uint32_t timeout_ms = devmgr::config::kProbeTimeoutMs)
      : transport_(transport), timeout_ms_(timeout_ms) {}

  static auto GetName() -> const char* { return "bluetooth"; }
  static auto GetFamily() -> BusFamily { return BusFamily::kBluetooth; }

  /**
   * @brief  枚举本机控制器与附近设备
   * @note   重复的 BD_ADDR 只保留第一条
   * @param  out            输出描述符数组
   * @param  max            最大枚举数量
   * @return Expected<size_t> 发现的设备总数，可能大于 max
   */
  auto Enumerate(RawDeviceDescriptor* out, size_t max) -> Expected<size_t>;

  /// @name 构造/析构函数
  /// @{
  BluetoothBus() = delete;
  ~BluetoothBus() = default;
  BluetoothBus(const BluetoothBus&) = delete;
  BluetoothBus(BluetoothBus&&) = delete;
  auto operator=(const BluetoothBus&) -> BluetoothBus& = delete;
  auto operator=(BluetoothBus&&) -> BluetoothBus& = delete;
  /// @}

 private:
  /// Class of Device 只有 24 位
  static constexpr uint32_t kClassOfDeviceMask = 0xFFFFFF;

  HciTransport& transport_;
  uint32_t timeout_ms_;
  HciInquiryResult results_[devmgr::config::kMaxDescriptorsPerBus]{};
};

#endif /* DEVMGR_SRC_DEVICE_INCLUDE_BLUETOOTH_BUS_HPP_ */
