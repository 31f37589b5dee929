#ifndef TRACKER_HPP
#define TRACKER_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "engine/client.hpp"
#include "engine/concepts.hpp"
#include "engine/constants.hpp"
#include "engine/engine.hpp"
#include "engine/logger.hpp"
#include "engine/types.hpp"

// Request tracking table: clients park requests in a shared slot pool and
// the engine completes them from the keys it receives.
template <SlotpoolConfig config> class Tracker {
private:
  config::RequestPool pool;
  config::FrameQueue frames;
  config::EventQueue events;
  LoggerClass<config> logger;
  Engine<config> engine;
  std::vector<std::unique_ptr<Client<config>>> clients;

  std::atomic<bool> keep_running{true};
  std::atomic<size_t> clients_done{0};

  // Threads.
  std::thread engine_event_handler;
  std::thread event_log_writer;
  std::vector<std::thread> client_threads;

  // Start time of the run.
  std::chrono::steady_clock::time_point start;
  bool started{false};
  bool joined{false};

public:
  Tracker(size_t capacity, size_t num_clients, uint64_t requests_per_client,
          const std::string &log_dir = DEFAULT_LOG_DIR);
  ~Tracker();
  void init(); // Starts engine and log writer.
  void run();  // Starts clients.
  void wait(); // Joins everything once clients are done.
  void stop(); // Asks clients to stop early, then waits.

  auto finished() const -> bool;
  // Reserves until exhaustion and reports how many slots were free.
  // Only meaningful once no guards are held anywhere.
  auto drain() -> size_t;

  auto getEngine() const -> const Engine<config> & { return engine; }
  auto getLogger() const -> const LoggerClass<config> & { return logger; }
  auto capacity() const -> size_t { return pool.capacity(); }
};

#endif
