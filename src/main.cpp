#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

#include "engine/constants.hpp"
#include "engine/tracker.hpp"
#include "my_config.hpp"

std::atomic<bool> keep_running(true);

// Signal handler for Ctrl + C
void signal_handler(int /*unused*/) { keep_running.store(false); }

auto main() -> int {
  // The main entry point of our simulation.
  std::signal(SIGINT, signal_handler);

  Tracker<my_config> tracker(DEFAULT_POOL_CAPACITY, NUM_DEFAULT_CLIENTS,
                             REQUESTS_PER_CLIENT);
  tracker.init();
  tracker.run();
  while (!tracker.finished() && keep_running.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  if (keep_running.load()) {
    tracker.wait();
  } else {
    tracker.stop();
  }

  // Every request completed or not, no slot may have leaked.
  size_t free_slots = tracker.drain();
  std::cout << free_slots << "/" << tracker.capacity()
            << " slots free after shutdown\n";
  if (tracker.getEngine().completed() !=
      tracker.getLogger().count(EventType::ISSUED)) {
    std::cerr << "Requests left parked in the pool\n";
    return EXIT_FAILURE;
  }
  return free_slots == tracker.capacity() ? EXIT_SUCCESS : EXIT_FAILURE;
}
