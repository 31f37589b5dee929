#ifndef CONSTANTS_HPP
#define CONSTANTS_HPP

#include <cstddef>
// NOTE: These constants are for simulation and testing purposes only.
static constexpr size_t DEFAULT_POOL_CAPACITY = 1024;
static constexpr size_t NUM_DEFAULT_CLIENTS = 4;
static constexpr size_t REQUESTS_PER_CLIENT = 100000;

// Every REDELIVERY_FREQ-th frame is sent twice.
static constexpr size_t REDELIVERY_FREQ = 16;

static constexpr long long CLIENT_AMOUNT_DISTRIB_MIN = -5000;
static constexpr long long CLIENT_AMOUNT_DISTRIB_MAX = 5000;

// Words per client in the duplicate window (64 sequences each).
static constexpr size_t SEEN_WINDOW_WORDS = 5;

// Events buffered before the logger flushes them to disk.
static constexpr size_t MAX_BUFFERED_EVENTS = 100000;

static constexpr const char* DEFAULT_LOG_DIR = "logs";
#endif
