#pragma once

#include "engine/types.hpp"
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>

template <typename P, typename T>
concept SlotPool = requires(P &pool, T item, SlotKey key) {
  { pool.reserve() };
  { pool.insert(item) } -> std::same_as<std::optional<SlotKey>>;
  { pool.take(key) } -> std::same_as<std::optional<T>>;
  { pool.get(key) };
  { pool.capacity() } -> std::convertible_to<std::size_t>;
};

template <typename W>
concept DedupWindow = requires(W window, uint64_t index) {
  { window.insert(index) } -> std::convertible_to<bool>;
  { window.can_insert(index) } -> std::convertible_to<bool>;
  { window.first_index() } -> std::convertible_to<uint64_t>;
};

template <typename Q, typename T>
concept ThreadSafeQueue = requires(Q &queue, T &item) {
  { queue.push(item) };
  { queue.try_pop(item) } -> std::convertible_to<bool>;
  { queue.wait_pop(item) } -> std::convertible_to<bool>;
  { queue.close() };
};

template <typename C>
concept SlotpoolConfig = requires {
  typename C::RequestPool;
  requires SlotPool<typename C::RequestPool, Request>;

  typename C::SeenWindow;
  requires DedupWindow<typename C::SeenWindow>;

  // NOTE: these queues must be threadsafe.
  typename C::FrameQueue;
  requires ThreadSafeQueue<typename C::FrameQueue, Frame>;

  typename C::EventQueue;
  requires ThreadSafeQueue<typename C::EventQueue, Event>;
};
