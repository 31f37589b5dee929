#include "engine/tracker.hpp"
#include "my_config.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>

namespace {
auto checkedCapacity(size_t capacity) -> size_t {
  if (capacity == 0) {
    throw std::invalid_argument("Tracker needs a pool of at least one slot");
  }
  return capacity;
}
} // namespace

template <SlotpoolConfig config>
Tracker<config>::Tracker(size_t capacity, size_t num_clients,
                         uint64_t requests_per_client,
                         const std::string &log_dir)
    : pool(checkedCapacity(capacity)), logger(events, log_dir),
      engine(frames, pool, logger) {
  clients.reserve(num_clients);
  for (size_t i = 1; i <= num_clients; i++) {
    clients.push_back(std::make_unique<Client<config>>(
        static_cast<ClientId>(i), requests_per_client, pool, frames, logger,
        keep_running));
  }
}

template <SlotpoolConfig config> Tracker<config>::~Tracker() {
  if (started && !joined) {
    stop();
  }
}

template <SlotpoolConfig config> void Tracker<config>::init() {
  // Should automatically use std::move.
  engine_event_handler = std::thread(&Engine<config>::handleEvents, &engine);
  event_log_writer =
      std::thread(&LoggerClass<config>::writeEventLogsContinuous, &logger);
  started = true;
  std::cout << "Tracker initialised with " << pool.capacity() << " slots\n";
}

template <SlotpoolConfig config> void Tracker<config>::run() {
  if (!started) {
    throw std::runtime_error("Tracker::run called before init");
  }
  start = std::chrono::steady_clock::now();
  client_threads.reserve(clients.size());
  for (auto &client : clients) {
    client_threads.emplace_back([this, c = client.get()]() {
      c->run();
      clients_done.fetch_add(1, std::memory_order_release);
    });
  }
  std::cout << "Tracker running " << clients.size() << " clients\n";
}

template <SlotpoolConfig config> auto Tracker<config>::finished() const -> bool {
  return clients_done.load(std::memory_order_acquire) == clients.size();
}

template <SlotpoolConfig config> void Tracker<config>::wait() {
  if (!started || joined) {
    return;
  }
  for (auto &client_thread : client_threads) {
    client_thread.join();
  }
  // Clients are gone, let the engine drain the remaining frames.
  frames.close();
  engine_event_handler.join();
  events.close();
  event_log_writer.join();
  joined = true;

  auto end = std::chrono::steady_clock::now();
  std::cout << "Tracker ran for "
            << std::chrono::duration_cast<std::chrono::milliseconds>(end -
                                                                     start)
                   .count()
            << "ms: " << logger.count(EventType::ISSUED) << " issued, "
            << engine.completed() << " completed, "
            << logger.count(EventType::DUPLICATE) << " duplicates, "
            << logger.count(EventType::STALE) << " stale, "
            << logger.count(EventType::EXHAUSTED) << " backoffs\n";
}

template <SlotpoolConfig config> void Tracker<config>::stop() {
  keep_running.store(false);
  wait();
}

template <SlotpoolConfig config> auto Tracker<config>::drain() -> size_t {
  std::vector<typename config::RequestPool::reserved> held;
  held.reserve(pool.capacity());
  while (auto slot = pool.reserve()) {
    held.push_back(std::move(*slot));
  }
  return held.size();
}

template class Tracker<my_config>;
