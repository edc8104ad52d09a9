/**
 * @copyright Copyright The DevMgr Contributors
 * @brief 设备管理器使用的 ETL 配置
 */

#ifndef DEVMGR_SRC_INCLUDE_ETL_PROFILE_H_
#define DEVMGR_SRC_INCLUDE_ETL_PROFILE_H_

#define ETL_CPP23_SUPPORTED 1

// 内核不使用异常；容器容量由调用方在 push 前用 full() 检查
#define ETL_NO_EXCEPTIONS 1
#define ETL_NO_CHECKS 0

#endif  // DEVMGR_SRC_INCLUDE_ETL_PROFILE_H_
