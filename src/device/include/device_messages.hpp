/**
 * @copyright Copyright The DevMgr Contributors
 */

#ifndef DEVMGR_SRC_DEVICE_INCLUDE_DEVICE_MESSAGES_HPP_
#define DEVMGR_SRC_DEVICE_INCLUDE_DEVICE_MESSAGES_HPP_

#include <etl/message.h>

#include "expected.hpp"

/// Device FSM 消息 ID
namespace device_msg_id {
static constexpr etl::message_id_t kResourcesGranted = 1;
static constexpr etl::message_id_t kResourcesDenied = 2;
static constexpr etl::message_id_t kInitStart = 3;
static constexpr etl::message_id_t kInitDone = 4;
static constexpr etl::message_id_t kInitFailed = 5;
static constexpr etl::message_id_t kRemove = 6;
static constexpr etl::message_id_t kShutdownDone = 7;
static constexpr etl::message_id_t kEvict = 8;
}  // namespace device_msg_id

/// 消息路由 ID
namespace router_id {
static constexpr etl::message_router_id_t kDeviceFsm = 1;
}  // namespace router_id

/// Device FSM 消息结构体（无负载，用作事件）
struct MsgResourcesGranted
    : public etl::message<device_msg_id::kResourcesGranted> {};
struct MsgInitStart : public etl::message<device_msg_id::kInitStart> {};
struct MsgInitDone : public etl::message<device_msg_id::kInitDone> {};
struct MsgRemove : public etl::message<device_msg_id::kRemove> {};
struct MsgEvict : public etl::message<device_msg_id::kEvict> {};

/// 资源被拒绝，携带仲裁器返回的错误码
struct MsgResourcesDenied
    : public etl::message<device_msg_id::kResourcesDenied> {
  ErrorCode reason;
  explicit MsgResourcesDenied(ErrorCode code) : reason(code) {}
};

/// 初始化失败，携带驱动返回的错误码
struct MsgInitFailed : public etl::message<device_msg_id::kInitFailed> {
  ErrorCode reason;
  explicit MsgInitFailed(ErrorCode code) : reason(code) {}
};

/// 关闭完成，携带驱动 Shutdown() 是否成功
struct MsgShutdownDone : public etl::message<device_msg_id::kShutdownDone> {
  bool clean;
  explicit MsgShutdownDone(bool ok) : clean(ok) {}
};

#endif  // DEVMGR_SRC_DEVICE_INCLUDE_DEVICE_MESSAGES_HPP_
