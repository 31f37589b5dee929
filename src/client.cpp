#include "engine/client.hpp"
#include "engine/constants.hpp"
#include "my_config.hpp"

#include <optional>
#include <stdexcept>
#include <thread>

#include "network/message.hpp"

template <SlotpoolConfig config>
Client<config>::Client(ClientId my_id, uint64_t num_requests,
                       config::RequestPool &pool, config::FrameQueue &frames,
                       LoggerClass<config> &logger,
                       std::atomic<bool> &keep_running)
    : my_id(my_id), num_requests(num_requests), pool(pool), frames(frames),
      logger(logger), keep_running(keep_running),
      gen(std::random_device{}()),
      distrib(CLIENT_AMOUNT_DISTRIB_MIN, CLIENT_AMOUNT_DISTRIB_MAX) {}

template <SlotpoolConfig config>
auto Client<config>::park(const Request &request) -> SlotKey {
  while (true) {
    auto slot = pool.reserve();
    if (slot) {
      // The occupied guard drops at the end of this scope, so the engine
      // can lock the slot once the notice arrives.
      return slot->insert(request).key();
    }
    logger.logExhausted(my_id);
    std::this_thread::yield();
  }
}

template <SlotpoolConfig config> void Client<config>::sendOne() {
  Sequence sequence = next_sequence++;
  Request request{};
  request.request_id = makeRequestId(my_id, sequence);
  request.client_id = my_id;
  request.issued_at = logger.now();
  request.amount = distrib(gen);

  Notice notice{};
  notice.client_id = my_id;
  notice.sequence = sequence;
  notice.key = park(request);
  notice.amount = request.amount;
  logger.logIssued(notice, request.request_id);

  Frame frame = make_frame(notice);
  bool sent = true;
  if (sequence % REDELIVERY_FREQ == 0) {
    sent = frames.push(frame); // Redelivery, the engine should drop the copy.
  }
  sent = sent && frames.push(std::move(frame));
  if (!sent) {
    throw std::runtime_error("Frame queue closed while clients are running");
  }
}

template <SlotpoolConfig config> void Client<config>::run() {
  while (next_sequence < num_requests &&
         keep_running.load(std::memory_order_relaxed)) {
    sendOne();
  }
}

template class Client<my_config>;
