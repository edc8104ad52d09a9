/**
 * @copyright Copyright The DevMgr Contributors
 * @brief 设备管理器使用的控制台输出接口
 * @note  由宿主内核的 libc 提供实现，单元测试中由 mocks 提供
 */

#ifndef DEVMGR_SRC_LIBC_INCLUDE_SK_STDIO_H_
#define DEVMGR_SRC_LIBC_INCLUDE_SK_STDIO_H_

#ifdef __cplusplus
extern "C" {
#endif

/// 格式化输出到内核控制台
int sk_printf(const char* format, ...) __attribute__((format(printf, 1, 2)));

#ifdef __cplusplus
}
#endif

#endif /* DEVMGR_SRC_LIBC_INCLUDE_SK_STDIO_H_ */
