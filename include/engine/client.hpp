#ifndef CLIENT_HPP
#define CLIENT_HPP

#include <atomic>
#include <cstdint>
#include <random>

#include "engine/concepts.hpp"
#include "engine/logger.hpp"
#include "engine/types.hpp"

// Sample client: parks each request in the pool and sends its key to the
// engine, occasionally twice.
template <SlotpoolConfig config> class Client {
private:
  ClientId my_id;
  uint64_t num_requests;
  Sequence next_sequence{0};

  config::RequestPool &pool;
  config::FrameQueue &frames;
  LoggerClass<config> &logger;
  std::atomic<bool> &keep_running;

  std::mt19937_64 gen;
  std::uniform_int_distribution<Amount> distrib;

  auto park(const Request &request) -> SlotKey; // Blocks while pool is full.

public:
  Client(ClientId my_id, uint64_t num_requests, config::RequestPool &pool,
         config::FrameQueue &frames, LoggerClass<config> &logger,
         std::atomic<bool> &keep_running);
  void sendOne(); // Issues the next request.
  void run();     // Issues all requests unless stopped early.

  auto id() const -> ClientId { return my_id; }
  auto issued() const -> uint64_t { return next_sequence; }
};

#endif
