#ifndef ENGINE_HPP
#define ENGINE_HPP

#include <cstdint>
#include <unordered_map>

#include "engine/concepts.hpp"
#include "engine/types.hpp"
#include <engine/logger.hpp>

// Consumes notice frames and completes the requests parked in the pool.
template <SlotpoolConfig config> class Engine {
private:
  config::FrameQueue &frames;
  config::RequestPool &pool;
  LoggerClass<config> &logger;
  // One duplicate window per client, only touched by the engine thread.
  std::unordered_map<ClientId, typename config::SeenWindow> windows;

  uint64_t completed_count{0};
  Amount balance_total{0};

  void complete(const Notice &notice);

public:
  Engine(config::FrameQueue &frame_q, config::RequestPool &pool,
         LoggerClass<config> &lgr);
  void handleFrame(const Frame &frame); // Synchronous, used by tests too.
  void handleEvents(); // runs on seperate thread until frames are closed.

  auto completed() const -> uint64_t { return completed_count; }
  auto balance() const -> Amount { return balance_total; }
};

#endif
