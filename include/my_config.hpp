#pragma once

#include "containers/lock_queue.hpp"
#include "containers/seen_window.hpp"
#include "containers/slot_pool.hpp"
#include "engine/constants.hpp"
#include "engine/types.hpp"

// Our sample config.
struct my_config {
  using RequestPool = threadsafe::slot_pool<Request>;
  using SeenWindow = seen_window<SEEN_WINDOW_WORDS>;
  using FrameQueue = threadsafe::stl_queue<Frame>;
  using EventQueue = threadsafe::stl_queue<Event>;
};
