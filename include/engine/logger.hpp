#pragma once
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

#include <engine/concepts.hpp>
#include <engine/constants.hpp>
#include <engine/types.hpp>

template <SlotpoolConfig config> class LoggerClass {
private:
  config::EventQueue &events;
  std::string log_path;
  std::chrono::steady_clock::time_point start;
  std::array<std::atomic<uint64_t>, 6> counts{};

  void record(EventType type, ClientId client_id, Sequence sequence,
              SlotKey key, RequestId request_id);

public:
  explicit LoggerClass(config::EventQueue &ev_queue,
                       const std::string &log_dir = DEFAULT_LOG_DIR);
  ~LoggerClass();

  auto now() const -> TimeStamp; // Nanoseconds since the logger was created.

  void logIssued(const Notice &notice, RequestId request_id);
  void logCompleted(const Notice &notice, const Request &request);
  void logDuplicate(const Notice &notice);
  void logStale(const Notice &notice);
  void logExhausted(ClientId client_id);
  void logMalformed(size_t frame_size);

  auto count(EventType type) const -> uint64_t;
  auto path() const -> const std::string & { return log_path; }

  void writeEventLogs(); // Drains whatever is queued right now.
  void writeEventLogsContinuous(); // Runs until the event queue is closed.
};
