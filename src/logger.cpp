#include "engine/logger.hpp"
#include "engine/constants.hpp"
#include "my_config.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace {
auto eventName(EventType type) -> const char * {
  switch (type) {
  case EventType::ISSUED:
    return "ISSUED";
  case EventType::COMPLETED:
    return "COMPLETED";
  case EventType::DUPLICATE:
    return "DUPLICATE";
  case EventType::STALE:
    return "STALE";
  case EventType::EXHAUSTED:
    return "EXHAUSTED";
  case EventType::MALFORMED:
    return "MALFORMED";
  }
  return "UNKNOWN";
}

void writeEvent(std::ofstream &file, const Event &event) {
  file << eventName(event.type) << " client " << event.client_id;
  if (event.type != EventType::MALFORMED) {
    file << " seq " << event.sequence << " key " << event.key;
  }
  if (event.type == EventType::MALFORMED) {
    file << " bytes " << event.key;
  }
  if (event.type == EventType::ISSUED || event.type == EventType::COMPLETED) {
    file << " request " << event.request_id;
  }
  file << " TIMESTAMP-" << event.time_stamp << "\n";
}
} // namespace

template <SlotpoolConfig config>
LoggerClass<config>::LoggerClass(config::EventQueue &ev_queue,
                                 const std::string &log_dir)
    : events(ev_queue), start(std::chrono::steady_clock::now()) {
  std::filesystem::create_directories(log_dir);
  log_path = (std::filesystem::path(log_dir) / "events.txt").string();

  // Getting ready for later logging.
  std::ofstream file;
  file.open(log_path, std::ios::out);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open event log " + log_path);
  }
  file << "Slot Pool Events\n";
  file.close();
}

template <SlotpoolConfig config> LoggerClass<config>::~LoggerClass() {
  writeEventLogs();
}

template <SlotpoolConfig config>
auto LoggerClass<config>::now() const -> TimeStamp {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             std::chrono::steady_clock::now() - start)
      .count();
}

template <SlotpoolConfig config>
void LoggerClass<config>::record(EventType type, ClientId client_id,
                                 Sequence sequence, SlotKey key,
                                 RequestId request_id) {
  counts[static_cast<size_t>(type)].fetch_add(1, std::memory_order_relaxed);
  Event event{};
  event.type = type;
  event.client_id = client_id;
  event.sequence = sequence;
  event.key = key;
  event.request_id = request_id;
  event.time_stamp = now();
  // A closed queue means we are shutting down, the count still holds.
  events.push(event);
}

template <SlotpoolConfig config>
void LoggerClass<config>::logIssued(const Notice &notice,
                                    RequestId request_id) {
  record(EventType::ISSUED, notice.client_id, notice.sequence, notice.key,
         request_id);
}

template <SlotpoolConfig config>
void LoggerClass<config>::logCompleted(const Notice &notice,
                                       const Request &request) {
  record(EventType::COMPLETED, notice.client_id, notice.sequence, notice.key,
         request.request_id);
}

template <SlotpoolConfig config>
void LoggerClass<config>::logDuplicate(const Notice &notice) {
  record(EventType::DUPLICATE, notice.client_id, notice.sequence, notice.key,
         0);
}

template <SlotpoolConfig config>
void LoggerClass<config>::logStale(const Notice &notice) {
  record(EventType::STALE, notice.client_id, notice.sequence, notice.key, 0);
}

template <SlotpoolConfig config>
void LoggerClass<config>::logExhausted(ClientId /*unused*/) {
  // Backoff spins can be very frequent, only counted.
  counts[static_cast<size_t>(EventType::EXHAUSTED)].fetch_add(
      1, std::memory_order_relaxed);
}

template <SlotpoolConfig config>
void LoggerClass<config>::logMalformed(size_t frame_size) {
  record(EventType::MALFORMED, 0, 0, frame_size, 0);
}

template <SlotpoolConfig config>
auto LoggerClass<config>::count(EventType type) const -> uint64_t {
  return counts[static_cast<size_t>(type)].load(std::memory_order_relaxed);
}

template <SlotpoolConfig config> void LoggerClass<config>::writeEventLogs() {
  std::ofstream file;
  file.open(log_path, std::ios::app);
  Event event{};
  while (events.try_pop(event)) {
    writeEvent(file, event);
  }
  file.close();
}

template <SlotpoolConfig config>
void LoggerClass<config>::writeEventLogsContinuous() {
  std::ofstream file;
  file.open(log_path, std::ios::app);
  Event event{};
  size_t unflushed = 0;
  while (events.wait_pop(event)) {
    writeEvent(file, event);
    if (++unflushed >= MAX_BUFFERED_EVENTS) {
      file.flush();
      unflushed = 0;
    }
  }
  file.close();
}

template class LoggerClass<my_config>;
