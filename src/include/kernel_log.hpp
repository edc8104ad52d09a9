/**
 * @copyright Copyright The DevMgr Contributors
 * @brief 设备管理器日志
 *
 * 输出格式：<颜色>[core][级别] 消息<复位>，Debug 级别额外带函数名。
 * Debug 在未定义 DEVMGR_DEBUG 时于编译期被丢弃。
 */

#ifndef DEVMGR_SRC_INCLUDE_KERNEL_LOG_HPP_
#define DEVMGR_SRC_INCLUDE_KERNEL_LOG_HPP_

#include <cpu_io.h>

#include <array>
#include <cstdint>
#include <source_location>
#include <utility>

#include "config.h"
#include "sk_stdio.h"
#include "spinlock.hpp"

namespace klog {
namespace detail {

/// 所有翻译单元共享同一把日志锁，保证整行输出不被打断
inline SpinLock log_lock("klog");

enum LogLevel : uint8_t {
  kDebug,
  kInfo,
  kWarn,
  kErr,
  kLogLevelMax,
};

struct LevelStyle {
  const char* color;
  const char* tag;
};

inline constexpr const char* kReset = "\033[0m";

inline constexpr std::array<LevelStyle, kLogLevelMax> kLevelStyles = {{
    {"\033[35m", "DBG"},
    {"\033[36m", "INF"},
    {"\033[33m", "WRN"},
    {"\033[31m", "ERR"},
}};

template <LogLevel Level, typename... Args>
inline void Emit(const std::source_location& location, Args&&... args) {
  if constexpr (Level == kDebug && !kDevMgrDebugLog) {
    (void)location;
    return;
  } else {
    constexpr auto style = kLevelStyles[Level];
    LockGuard guard(log_lock);
    sk_printf("%s[%zu][%s] ", style.color, cpu_io::GetCurrentCoreId(),
              style.tag);
    if constexpr (Level == kDebug) {
      sk_printf("%s: ", location.function_name());
    }
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat-security"
#pragma GCC diagnostic ignored "-Wformat-nonliteral"
    sk_printf(std::forward<Args>(args)...);
#pragma GCC diagnostic pop
    sk_printf("%s", kReset);
  }
}

}  // namespace detail

/// klog::Info("fmt", args...)：构造即输出，source_location 取调用点
template <typename... Args>
struct Debug {
  explicit Debug(Args&&... args, const std::source_location& location =
                                     std::source_location::current()) {
    detail::Emit<detail::kDebug>(location, std::forward<Args>(args)...);
  }
};
template <typename... Args>
Debug(Args&&...) -> Debug<Args...>;

template <typename... Args>
struct Info {
  explicit Info(Args&&... args, const std::source_location& location =
                                    std::source_location::current()) {
    detail::Emit<detail::kInfo>(location, std::forward<Args>(args)...);
  }
};
template <typename... Args>
Info(Args&&...) -> Info<Args...>;

template <typename... Args>
struct Warn {
  explicit Warn(Args&&... args, const std::source_location& location =
                                    std::source_location::current()) {
    detail::Emit<detail::kWarn>(location, std::forward<Args>(args)...);
  }
};
template <typename... Args>
Warn(Args&&...) -> Warn<Args...>;

template <typename... Args>
struct Err {
  explicit Err(Args&&... args, const std::source_location& location =
                                   std::source_location::current()) {
    detail::Emit<detail::kErr>(location, std::forward<Args>(args)...);
  }
};
template <typename... Args>
Err(Args&&...) -> Err<Args...>;

}  // namespace klog

#endif /* DEVMGR_SRC_INCLUDE_KERNEL_LOG_HPP_ */
