/**
 * @copyright Copyright The DevMgr Contributors
 */

#include "resource_arbiter.hpp"

#include <algorithm>
#include <bit>

#include "kernel_log.hpp"

namespace {

[[nodiscard]] constexpr auto AlignUp(uint64_t value, uint64_t alignment)
    -> uint64_t {
  return (value + alignment - 1) & ~(alignment - 1);
}

[[nodiscard]] constexpr auto AlignDown(uint64_t value, uint64_t alignment)
    -> uint64_t {
  return value & ~(alignment - 1);
}

[[nodiscard]] constexpr auto IsPowerOfTwo(uint64_t value) -> bool {
  return value != 0 && (value & (value - 1)) == 0;
}

}  // namespace

ResourceArbiter::ResourceArbiter(const ArbiterConfig& config)
    : config_(config) {
  using namespace devmgr::config;

  if (config_.irq_count > kMaxIrqLines) {
    klog::Warn("ResourceArbiter: irq pool %u clamped to %zu lines\n",
               config_.irq_count, kMaxIrqLines);
    config_.irq_count = kMaxIrqLines;
  }
  if (config_.dma_channels > kMaxDmaChannels) {
    klog::Warn("ResourceArbiter: dma pool %u clamped to %zu channels\n",
               config_.dma_channels, kMaxDmaChannels);
    config_.dma_channels = kMaxDmaChannels;
  }

  auto base = AlignUp(config_.mmio_base, kMmioGranularity);
  auto end = AlignDown(config_.mmio_base + config_.mmio_size, kMmioGranularity);
  if (config_.mmio_size == 0 || end <= base) {
    config_.mmio_base = base;
    config_.mmio_size = 0;
  } else {
    config_.mmio_base = base;
    config_.mmio_size = end - base;
    mmio_free_.push_back(MmioWindow{base, end - base});
  }

  klog::Info(
      "ResourceArbiter: irq [%u, %u), dma %u, mmio [0x%lx, 0x%lx)\n",
      config_.irq_base, config_.irq_base + config_.irq_count,
      config_.dma_channels, config_.mmio_base,
      config_.mmio_base + config_.mmio_size);
}

auto ResourceArbiter::IrqMask() const -> uint64_t {
  return config_.irq_count >= 64 ? ~0ULL : ((1ULL << config_.irq_count) - 1);
}

auto ResourceArbiter::DmaMask() const -> uint32_t {
  return config_.dma_channels >= 32 ? ~0U
                                    : ((1U << config_.dma_channels) - 1);
}

auto ResourceArbiter::Reserve(DeviceId owner, const ResourceRequest& request)
    -> Expected<ResourceGrant> {
  using namespace devmgr::config;

  if (request.irq_count > kMaxIrqsPerGrant ||
      request.dma_count > kMaxDmaPerGrant) {
    return std::unexpected(Error(ErrorCode::kInvalidArgument));
  }

  uint64_t mmio_size = 0;
  uint64_t mmio_alignment = kMmioGranularity;
  if (request.mmio_size != 0) {
    if (!IsPowerOfTwo(request.mmio_alignment)) {
      klog::Err("ResourceArbiter: mmio alignment 0x%lx is not a power of 2\n",
                request.mmio_alignment);
      return std::unexpected(Error(ErrorCode::kMisalignedRequest));
    }
    mmio_alignment = std::max(request.mmio_alignment, kMmioGranularity);
    mmio_size = AlignUp(request.mmio_size, kMmioGranularity);
  }

  LockGuard guard(lock_);

  if (live_grants_.full()) {
    return std::unexpected(Error(ErrorCode::kResourceExhausted));
  }

  auto free_irq = ~irq_used_ & IrqMask();
  auto free_dma = ~dma_used_ & DmaMask();
  if (static_cast<size_t>(std::popcount(free_irq)) < request.irq_count ||
      static_cast<size_t>(std::popcount(free_dma)) < request.dma_count) {
    return std::unexpected(Error(ErrorCode::kResourceExhausted));
  }

  ResourceGrant grant{};
  grant.owner = owner;

  // MMIO 是唯一可能在提交阶段失败的资源，最先分配
  if (mmio_size != 0) {
    auto window = AllocateMmio(mmio_size, mmio_alignment);
    if (!window.has_value()) {
      return std::unexpected(window.error());
    }
    grant.mmio = *window;
  }

  for (uint8_t i = 0; i < request.irq_count; ++i) {
    auto bit = std::countr_zero(free_irq);
    free_irq &= free_irq - 1;
    irq_used_ |= 1ULL << bit;
    grant.irq[grant.irq_count++] = config_.irq_base + bit;
  }
  for (uint8_t i = 0; i < request.dma_count; ++i) {
    auto bit = std::countr_zero(free_dma);
    free_dma &= free_dma - 1;
    dma_used_ |= 1U << bit;
    grant.dma[grant.dma_count++] = static_cast<uint8_t>(bit);
  }

  grant.handle = next_handle_++;
  if (next_handle_ == 0) {
    next_handle_ = 1;
  }
  live_grants_.push_back(grant);

  klog::Debug("ResourceArbiter: grant #%u irq=%u dma=%u mmio=0x%lx+0x%lx\n",
              grant.handle, grant.irq_count, grant.dma_count, grant.mmio.base,
              grant.mmio.size);
  return grant;
}

auto ResourceArbiter::Release(const ResourceGrant& grant) -> Expected<void> {
  if (!grant.IsValid()) {
    return std::unexpected(Error(ErrorCode::kInvalidArgument));
  }

  LockGuard guard(lock_);

  auto it = std::find_if(
      live_grants_.begin(), live_grants_.end(),
      [&grant](const ResourceGrant& live) {
        return live.handle == grant.handle;
      });
  if (it == live_grants_.end()) {
    klog::Err("ResourceArbiter: grant #%u released twice\n", grant.handle);
    return std::unexpected(Error(ErrorCode::kDoubleRelease));
  }
  if (!(*it == grant)) {
    klog::Err("ResourceArbiter: grant #%u does not match its record\n",
              grant.handle);
    return std::unexpected(Error(ErrorCode::kGrantNotOwned));
  }

  for (uint8_t i = 0; i < it->irq_count; ++i) {
    irq_used_ &= ~(1ULL << (it->irq[i] - config_.irq_base));
  }
  for (uint8_t i = 0; i < it->dma_count; ++i) {
    dma_used_ &= ~(1U << it->dma[i]);
  }
  if (it->mmio.size != 0) {
    FreeMmio(it->mmio);
  }

  klog::Debug("ResourceArbiter: grant #%u released\n", grant.handle);
  live_grants_.erase(it);
  return {};
}

auto ResourceArbiter::AllocateMmio(uint64_t size, uint64_t alignment)
    -> Expected<MmioWindow> {
  for (auto it = mmio_free_.begin(); it != mmio_free_.end(); ++it) {
    auto start = AlignUp(it->base, alignment);
    if (start < it->base || start >= it->End() || it->End() - start < size) {
      continue;
    }

    MmioWindow left{it->base, start - it->base};
    MmioWindow right{start + size, it->End() - (start + size)};

    if (left.size != 0 && right.size != 0) {
      if (mmio_free_.full()) {
        return std::unexpected(Error(ErrorCode::kResourceExhausted));
      }
      *it = left;
      mmio_free_.insert(it + 1, right);
    } else if (left.size != 0) {
      *it = left;
    } else if (right.size != 0) {
      *it = right;
    } else {
      mmio_free_.erase(it);
    }
    return MmioWindow{start, size};
  }
  return std::unexpected(Error(ErrorCode::kResourceExhausted));
}

auto ResourceArbiter::FreeMmio(const MmioWindow& window) -> void {
  auto next = std::find_if(
      mmio_free_.begin(), mmio_free_.end(),
      [&window](const MmioWindow& region) {
        return region.base > window.base;
      });

  bool merge_prev =
      next != mmio_free_.begin() && (next - 1)->End() == window.base;
  bool merge_next = next != mmio_free_.end() && window.End() == next->base;

  if (merge_prev && merge_next) {
    auto prev = next - 1;
    prev->size += window.size + next->size;
    mmio_free_.erase(next);
  } else if (merge_prev) {
    (next - 1)->size += window.size;
  } else if (merge_next) {
    next->base = window.base;
    next->size += window.size;
  } else {
    // 空闲区间数不超过存活授予数 + 1，此处总有空位
    mmio_free_.insert(next, window);
  }
}

auto ResourceArbiter::FreeIrqCount() const -> size_t {
  LockGuard guard(lock_);
  return static_cast<size_t>(std::popcount(~irq_used_ & IrqMask()));
}

auto ResourceArbiter::FreeDmaCount() const -> size_t {
  LockGuard guard(lock_);
  return static_cast<size_t>(std::popcount(~dma_used_ & DmaMask()));
}

auto ResourceArbiter::FreeMmioBytes() const -> uint64_t {
  LockGuard guard(lock_);
  uint64_t total = 0;
  for (const auto& region : mmio_free_) {
    total += region.size;
  }
  return total;
}

auto ResourceArbiter::LargestFreeMmioRegion() const -> uint64_t {
  LockGuard guard(lock_);
  uint64_t largest = 0;
  for (const auto& region : mmio_free_) {
    largest = std::max(largest, region.size);
  }
  return largest;
}

auto ResourceArbiter::LiveGrantCount() const -> size_t {
  LockGuard guard(lock_);
  return live_grants_.size();
}
