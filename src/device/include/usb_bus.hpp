/**
 * @copyright Copyright The DevMgr Contributors
 */

#ifndef DEVMGR_SRC_DEVICE_INCLUDE_USB_BUS_HPP_
#define DEVMGR_SRC_DEVICE_INCLUDE_USB_BUS_HPP_

#include <etl/span.h>

#include <cstddef>
#include <cstdint>

#include "bus.hpp"
#include "device_descriptor.hpp"
#include "expected.hpp"

/// USB 标准描述符类型
namespace usb_desc {
static constexpr uint8_t kDevice = 0x01;
static constexpr uint8_t kConfiguration = 0x02;
static constexpr uint8_t kInterface = 0x04;
static constexpr uint8_t kDeviceLength = 18;
static constexpr uint8_t kConfigurationLength = 9;
static constexpr uint8_t kInterfaceLength = 9;
}  // namespace usb_desc

/// 根集线器端口状态
struct UsbPortStatus {
  bool connected{false};
  UsbSpeed speed{UsbSpeed::kFull};
};

/**
 * @brief USB 主控制器探测后端（只读）
 */
class UsbHostController {
 public:
  /// 主控制器是否存在
  [[nodiscard]] virtual auto IsPresent() const -> bool = 0;

  /// 控制器对应的 USB 总线号
  [[nodiscard]] virtual auto GetBusNumber() const -> uint8_t = 0;

  /// 根集线器端口数
  [[nodiscard]] virtual auto GetPortCount() const -> uint8_t = 0;

  /**
   * @brief  读取端口状态
   * @param  port           端口号（从 1 开始）
   */
  virtual auto GetPortStatus(uint8_t port) -> Expected<UsbPortStatus> = 0;

  /**
   * @brief  对端口上的设备发出 GET_DESCRIPTOR
   * @param  port           端口号（从 1 开始）
   * @param  type           描述符类型
   * @param  buffer         输出缓冲区
   * @return Expected<size_t> 实际读到的字节数；无应答返回 kProbeTimeout
   */
  virtual auto GetDescriptor(uint8_t port, uint8_t type,
                             etl::span<uint8_t> buffer) -> Expected<size_t> = 0;

  /// @name 构造/析构函数
  /// @{
  UsbHostController() = default;
  UsbHostController(const UsbHostController&) = delete;
  UsbHostController(UsbHostController&&) = delete;
  auto operator=(const UsbHostController&) -> UsbHostController& = delete;
  auto operator=(UsbHostController&&) -> UsbHostController& = delete;
  virtual ~UsbHostController() = default;
  /// @}
};

/// USB 总线：遍历根集线器端口，读取设备与首个接口描述符
class UsbBus {
 public:
  explicit UsbBus(UsbHostController& controller) : controller_(controller) {}

  static auto GetName() -> const char* { return "usb"; }
  static auto GetFamily() -> BusFamily { return BusFamily::kUsb; }

  /**
   * @brief  枚举已连接端口上的 USB 设备
   * @param  out            输出描述符数组
   * @param  max            最大枚举数量
   * @return Expected<size_t> 已连接设备总数，可能大于 max；
   *         描述符格式错误返回 kMalformedResponse
   * @note   超出 max 的端口只计数，不读取描述符
   */
  auto Enumerate(RawDeviceDescriptor* out, size_t max) -> Expected<size_t>;

  /// @name 构造/析构函数
  /// @{
  UsbBus() = delete;
  ~UsbBus() = default;
  UsbBus(const UsbBus&) = delete;
  UsbBus(UsbBus&&) = delete;
  auto operator=(const UsbBus&) -> UsbBus& = delete;
  auto operator=(UsbBus&&) -> UsbBus& = delete;
  /// @}

 private:
  /// 配置描述符读取缓冲区大小
  static constexpr size_t kConfigBufferSize = 256;

  auto ProbePort(uint8_t port, UsbSpeed speed) -> Expected<UsbIdentity>;

  UsbHostController& controller_;
};

#endif /* DEVMGR_SRC_DEVICE_INCLUDE_USB_BUS_HPP_ */
