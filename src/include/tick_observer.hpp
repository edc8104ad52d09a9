/**
 * @copyright Copyright The DevMgr Contributors
 * @brief Tick event observer interface (etl::observer pattern)
 */

#ifndef DEVMGR_SRC_INCLUDE_TICK_OBSERVER_HPP_
#define DEVMGR_SRC_INCLUDE_TICK_OBSERVER_HPP_

#include <etl/observer.h>

#include <cstdint>

#include "devmgr_config.hpp"

/// @brief Tick event payload
struct TickEvent {
  uint64_t jiffies;
};

/// @brief Observer interface for tick events
using ITickObserver = etl::observer<TickEvent>;

/// @brief Tick 事件源，由宿主内核的时钟中断驱动
using TickObservable =
    etl::observable<ITickObserver, devmgr::config::kTickObservers>;

#endif  // DEVMGR_SRC_INCLUDE_TICK_OBSERVER_HPP_
