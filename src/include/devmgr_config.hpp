/** @copyright Copyright The DevMgr Contributors */

#ifndef DEVMGR_SRC_INCLUDE_DEVMGR_CONFIG_HPP_
#define DEVMGR_SRC_INCLUDE_DEVMGR_CONFIG_HPP_

#include <cstddef>
#include <cstdint>

namespace devmgr::config {

// ── 设备注册表容量 ──────────────────────────────────────────────
/// 注册表最大设备记录数
inline constexpr size_t kMaxDevices = 64;
/// 每个设备类别的最大实例编号（eth0 .. eth63），实例位图宽度为 64
inline constexpr size_t kMaxInstancesPerClass = kMaxDevices;
/// 设备实例名最大长度（不含结尾 '\0'）
inline constexpr size_t kMaxDeviceNameLength = 15;

// ── 总线枚举 ────────────────────────────────────────────────────
/// 最大总线枚举器数（PCI / USB / Bluetooth / Platform）
inline constexpr size_t kMaxBusEnumerators = 4;
/// 单次枚举单条总线最多返回的描述符数
inline constexpr size_t kMaxDescriptorsPerBus = 64;
/// 单次总线探测的超时预算（毫秒），由探测后端负责执行
inline constexpr uint32_t kProbeTimeoutMs = 1280;

// ── 热插拔 ──────────────────────────────────────────────────────
/// 中断 -> 工作线程队列深度（必须是 2 的幂）
inline constexpr size_t kHotplugQueueCapacity = 16;
/// 最大热插拔监听者数
inline constexpr size_t kMaxHotplugListeners = 16;
/// ProbeTimeout 后的重试间隔（tick）
inline constexpr uint64_t kHotplugRetryTicks = 100;
/// Tick 事件源最大观察者数
inline constexpr size_t kTickObservers = 4;

// ── 资源仲裁 ────────────────────────────────────────────────────
/// 同时存活的最大资源授权数
inline constexpr size_t kMaxLiveGrants = kMaxDevices;
/// MMIO 空闲链表最大区间数
inline constexpr size_t kMaxMmioFreeRegions = kMaxLiveGrants + 1;
/// 单个授权最多持有的 IRQ 线数
inline constexpr size_t kMaxIrqsPerGrant = 4;
/// 单个授权最多持有的 DMA 通道数
inline constexpr size_t kMaxDmaPerGrant = 2;
/// IRQ 池硬上限（位图宽度）
inline constexpr size_t kMaxIrqLines = 64;
/// DMA 池硬上限（位图宽度）
inline constexpr size_t kMaxDmaChannels = 32;
/// MMIO 分配粒度
inline constexpr uint64_t kMmioGranularity = 0x1000;

/// 默认平台资源池
inline constexpr uint32_t kDefaultIrqBase = 32;
inline constexpr uint32_t kDefaultIrqCount = 32;
inline constexpr uint32_t kDefaultDmaChannels = 8;
inline constexpr uint64_t kDefaultMmioBase = 0xC0000000;
inline constexpr uint64_t kDefaultMmioSize = 0x10000000;

}  // namespace devmgr::config

#endif  // DEVMGR_SRC_INCLUDE_DEVMGR_CONFIG_HPP_
