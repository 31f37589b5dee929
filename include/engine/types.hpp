#ifndef TYPES_HPP
#define TYPES_HPP
#include <cstddef>
#include <cstdint>
#include <vector>

using ClientId = uint32_t;
using RequestId = uint64_t;
using Sequence = uint64_t;   // Per client frame sequence number.
using SlotKey = size_t;      // Key handed out by the slot pool.
using Amount = int64_t;      // Signed payload, may be negative.
using TimeStamp = uint64_t;  // Nanoseconds since the tracker started.

// Request ids are the client id in the high bits over the client's own
// sequence number.
static constexpr unsigned LOCAL_REQUEST_BITS = 40;
inline auto makeRequestId(ClientId client_id, Sequence sequence) -> RequestId {
  return (static_cast<RequestId>(client_id) << LOCAL_REQUEST_BITS) | sequence;
}

// What a client parks in the pool while its request is in flight.
struct Request {
  RequestId request_id;
  ClientId client_id;
  TimeStamp issued_at;
  Amount amount;
};

// Notification that a request is ready to be completed. Only the key and
// sequence cross threads, the request itself stays in its slot.
struct Notice {
  ClientId client_id;
  Sequence sequence;
  SlotKey key;
  Amount amount;
};

// Encoded notice as it travels through the frame queue.
struct Frame {
  std::vector<uint8_t> bytes;
};

enum class EventType : uint8_t {
  ISSUED = 0,     // Client stored a request and sent its key.
  COMPLETED = 1,  // Engine took the request out of its slot.
  DUPLICATE = 2,  // Redelivered frame dropped by the seen window.
  STALE = 3,      // Key no longer held a request.
  EXHAUSTED = 4,  // Client found no vacant slot and backed off.
  MALFORMED = 5   // Frame could not be decoded.
};

struct Event {
  EventType type;
  ClientId client_id;
  Sequence sequence;
  SlotKey key;
  RequestId request_id;
  TimeStamp time_stamp;
};
#endif
