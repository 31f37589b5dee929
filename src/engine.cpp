#include "engine/engine.hpp"
#include "my_config.hpp"

#include <optional>
#include <utility>

#include "network/message.hpp"

template <SlotpoolConfig config>
Engine<config>::Engine(config::FrameQueue &frame_q, config::RequestPool &pool,
                       LoggerClass<config> &lgr)
    : frames(frame_q), pool(pool), logger(lgr) {}

template <SlotpoolConfig config>
void Engine<config>::complete(const Notice &notice) {
  auto entry = pool.get(notice.key);
  // The key may have been freed, or freed and reused by someone else.
  if (!entry ||
      (*entry)->request_id != makeRequestId(notice.client_id, notice.sequence)) {
    logger.logStale(notice);
    return;
  }
  // Dropping the reserved half hands the key straight back to the pool.
  auto [request, vacated] = entry->take();
  logger.logCompleted(notice, request);
  completed_count++;
  balance_total += request.amount;
}

template <SlotpoolConfig config>
void Engine<config>::handleFrame(const Frame &frame) {
  Notice notice{};
  if (!deserialise_notice(frame.bytes.data(), frame.bytes.size(), notice)) {
    logger.logMalformed(frame.bytes.size());
    return;
  }
  if (!windows[notice.client_id].insert(notice.sequence)) {
    logger.logDuplicate(notice);
    return;
  }
  complete(notice);
}

template <SlotpoolConfig config> void Engine<config>::handleEvents() {
  Frame frame;
  while (frames.wait_pop(frame)) {
    handleFrame(frame);
  }
}

template class Engine<my_config>;
