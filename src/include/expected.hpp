/**
 * @copyright Copyright The DevMgr Contributors
 */

#ifndef DEVMGR_SRC_INCLUDE_EXPECTED_HPP_
#define DEVMGR_SRC_INCLUDE_EXPECTED_HPP_

#include <cstdint>
#include <expected>

/// 设备管理器错误码
enum class ErrorCode : uint64_t {
  kSuccess = 0,
  // SpinLock 相关错误 (0x300 - 0x3FF)
  kSpinLockRecursiveLock = 0x300,
  kSpinLockNotOwned = 0x301,
  // 总线枚举相关错误 (0x700 - 0x7FF)
  kBusNotPresent = 0x700,
  kProbeTimeout = 0x701,
  kMalformedResponse = 0x702,
  kBusAlreadyRegistered = 0x703,
  kBusNotRegistered = 0x704,
  kBusRegistrationClosed = 0x705,
  // 资源仲裁相关错误 (0x800 - 0x8FF)
  kResourceExhausted = 0x800,
  kDoubleRelease = 0x801,
  kMisalignedRequest = 0x802,
  kGrantNotOwned = 0x803,
  // 设备相关错误 (0x900 - 0x9FF)
  kDeviceInitFailed = 0x900,
  kDeviceShutdownFailed = 0x901,
  kDeviceNotFound = 0x902,
  kDeviceAlreadyExists = 0x903,
  kDeviceInvalidState = 0x904,
  kDeviceRegistryFull = 0x905,
  kDeviceDriverUnavailable = 0x906,
  kHotplugListenerFailed = 0x907,
  kDriverAlreadyRegistered = 0x908,
  // 通用错误 (0xF00 - 0xFFF)
  kInvalidArgument = 0xF00,
  kOutOfMemory = 0xF01,
  kNotSupported = 0xF02,
  kTimeout = 0xF03,
  kIoError = 0xF04,
};

/// 获取错误码对应的错误信息
constexpr auto GetErrorMessage(ErrorCode code) -> const char* {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kSpinLockRecursiveLock:
      return "Recursive spinlock detected";
    case ErrorCode::kSpinLockNotOwned:
      return "Spinlock not owned by current core";
    case ErrorCode::kBusNotPresent:
      return "Bus not present";
    case ErrorCode::kProbeTimeout:
      return "Bus probe timed out";
    case ErrorCode::kMalformedResponse:
      return "Malformed bus response";
    case ErrorCode::kBusAlreadyRegistered:
      return "Bus family already registered";
    case ErrorCode::kBusNotRegistered:
      return "Bus family not registered";
    case ErrorCode::kBusRegistrationClosed:
      return "Bus registration closed after detection";
    case ErrorCode::kResourceExhausted:
      return "Resource pool exhausted";
    case ErrorCode::kDoubleRelease:
      return "Resource grant released twice";
    case ErrorCode::kMisalignedRequest:
      return "Misaligned resource request";
    case ErrorCode::kGrantNotOwned:
      return "Resource grant does not match its owner";
    case ErrorCode::kDeviceInitFailed:
      return "Device init failed";
    case ErrorCode::kDeviceShutdownFailed:
      return "Device shutdown failed";
    case ErrorCode::kDeviceNotFound:
      return "Device not found";
    case ErrorCode::kDeviceAlreadyExists:
      return "Device already exists";
    case ErrorCode::kDeviceInvalidState:
      return "Invalid device state transition";
    case ErrorCode::kDeviceRegistryFull:
      return "Device registry full";
    case ErrorCode::kDeviceDriverUnavailable:
      return "No driver factory for device class";
    case ErrorCode::kHotplugListenerFailed:
      return "Hotplug listener failed";
    case ErrorCode::kDriverAlreadyRegistered:
      return "Driver already registered for device class";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kOutOfMemory:
      return "Out of memory";
    case ErrorCode::kNotSupported:
      return "Not supported";
    case ErrorCode::kTimeout:
      return "Timeout";
    case ErrorCode::kIoError:
      return "I/O error";
    default:
      return "Unknown error";
  }
}

/// 错误类型，用于 std::expected
struct Error {
  ErrorCode code;
  /// 底层原因（InitFailed / ShutdownFailed 携带驱动返回的错误码）
  ErrorCode cause{ErrorCode::kSuccess};

  constexpr Error(ErrorCode c) : code(c) {}
  constexpr Error(ErrorCode c, ErrorCode why) : code(c), cause(why) {}

  [[nodiscard]] constexpr auto message() const -> const char* {
    return GetErrorMessage(code);
  }

  [[nodiscard]] constexpr auto cause_message() const -> const char* {
    return GetErrorMessage(cause);
  }
};

/// std::expected 别名模板
template <typename T>
using Expected = std::expected<T, Error>;

#endif /* DEVMGR_SRC_INCLUDE_EXPECTED_HPP_ */
