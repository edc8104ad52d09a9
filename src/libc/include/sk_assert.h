/**
 * @copyright Copyright The DevMgr Contributors
 * @brief 内部不变量断言
 */

#ifndef DEVMGR_SRC_LIBC_INCLUDE_SK_ASSERT_H_
#define DEVMGR_SRC_LIBC_INCLUDE_SK_ASSERT_H_

#include <cpu_io.h>

#include "kernel_log.hpp"

/// 断言失败后停在当前核心，不再返回
[[noreturn]] inline void SkAssertHalt() {
  while (true) {
    cpu_io::Pause();
  }
}

/**
 * @brief 不变量断言，失败时输出位置与消息后停机
 * @param expr 断言表达式
 * @param fmt printf 风格消息，必须是字符串字面量
 * @note 只用于“不可能发生”的内部错误，可预期的失败走 Expected
 */
#define sk_assert_msg(expr, fmt, ...)                                       \
  do {                                                                      \
    if (__builtin_expect(!(expr), 0)) {                                     \
      klog::Err("assert `%s` failed at %s:%d: " fmt "\n", #expr, __FILE__, \
                __LINE__, ##__VA_ARGS__);                                   \
      SkAssertHalt();                                                       \
    }                                                                       \
  } while (0)

#endif /* DEVMGR_SRC_LIBC_INCLUDE_SK_ASSERT_H_ */
