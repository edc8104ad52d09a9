/**
 * @copyright Copyright The DevMgr Contributors
 * @brief 编译期开关，由 cmake 通过编译定义传入
 */

#ifndef DEVMGR_SRC_INCLUDE_CONFIG_H_
#define DEVMGR_SRC_INCLUDE_CONFIG_H_

#ifdef DEVMGR_DEBUG
static constexpr const auto kDevMgrDebugLog = true;
#else
static constexpr const auto kDevMgrDebugLog = false;
#endif

#endif /* DEVMGR_SRC_INCLUDE_CONFIG_H_ */
