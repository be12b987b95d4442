#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "parcel/outgoing_message.h"
#include "parcel/parcel.h"
#include "parcel/receipt.h"
#include "parcel/transfer_policy.h"

namespace parcelink::parcel {

enum class DeliveryOutcome { kDelivered, kFailed };

enum class FailureReason {
  kNone,
  kRetryExhausted,  // Peer never confirmed within the retry budget.
  kCancelled,       // Dropped by cancel_peer().
};

const char* failure_reason_to_string(FailureReason reason);

// One encoded parcel the transport must write, after waiting delay_before.
struct OutboundParcel {
  std::string peer_id;
  std::string message_id;
  std::uint16_t index{0};
  std::vector<std::uint8_t> bytes;
  std::chrono::milliseconds delay_before{0};
  bool retransmission{false};
};

struct DeliveryReport {
  std::string peer_id;
  std::string message_id;
  DeliveryOutcome outcome{DeliveryOutcome::kDelivered};
  FailureReason reason{FailureReason::kNone};
  std::uint32_t retries{0};
};

struct SenderActions {
  std::vector<OutboundParcel> parcels;
  std::vector<DeliveryReport> reports;

  [[nodiscard]] bool empty() const { return parcels.empty() && reports.empty(); }
  void append(SenderActions other);
};

struct SenderStats {
  std::uint64_t messages_enqueued{0};
  std::uint64_t messages_delivered{0};
  std::uint64_t messages_failed{0};
  std::uint64_t parcels_sent{0};
  std::uint64_t parcels_resent{0};
  std::uint64_t receipt_timeouts{0};
  std::uint64_t delayed_retransmissions{0};
};

/**
 * Sender side of the protocol. Keeps a FIFO queue per peer with at most one
 * message in flight, turns receipts into retransmissions and reports the final
 * outcome of every message.
 *
 * It performs no I/O and never sleeps: every call returns the parcels to write
 * (with the pacing delay before each) and the delivery reports to surface. The
 * caller supplies `now`, so the engine runs equally on a wall clock or a
 * simulated one.
 *
 * Thread Safety: all methods are thread-safe.
 */
class ParcelSender {
 public:
  explicit ParcelSender(TransferPolicy policy = {});

  // Queues a message and returns the id it will travel under. An empty, invalid or
  // colliding id (queued, in flight or retained for the same peer) is replaced by a
  // fresh random one. Splitting happens here, so an oversized payload throws
  // std::length_error.
  std::string enqueue(OutgoingMessage message, TimePoint now);

  // Starts the next message of every idle peer and retransmits transfers whose
  // receipt timed out.
  SenderActions poll(TimePoint now);

  // Non-complete receipts for the message in flight are ignored until its current
  // round has been fully sent; they describe a transfer the peer has not seen yet.
  SenderActions on_receipt(const std::string& peer_id, const Receipt& receipt, TimePoint now);

  // Forgets retained messages older than the retention period.
  void housekeeping(TimePoint now);

  // Drops everything pending for a peer; each dropped message is reported as cancelled.
  std::vector<DeliveryReport> cancel_peer(const std::string& peer_id);

  std::size_t queue_length(const std::string& peer_id) const;
  bool is_sending(const std::string& peer_id) const;
  SenderStats stats() const;

  const TransferPolicy& policy() const { return policy_; }

 private:
  struct QueuedMessage {
    OutgoingMessage message;
    // Encoded parcels, position == parcel index.
    std::vector<std::vector<std::uint8_t>> parcels;
  };

  struct ActiveTransfer {
    QueuedMessage entry;
    std::vector<std::uint16_t> last_requested;
    // When the last parcel of the current round goes out.
    TimePoint round_end{};
    TimePoint receipt_deadline{};
  };

  struct RetainedMessage {
    std::vector<std::vector<std::uint8_t>> parcels;
    TimePoint sent_at{};
  };

  struct PeerState {
    std::deque<QueuedMessage> queue;
    std::optional<ActiveTransfer> active;
    std::map<std::string, RetainedMessage> retained;
  };

  // Callers hold mutex_.
  bool id_in_use(const PeerState& state, const std::string& message_id) const;
  void transmit(const std::string& peer_id, ActiveTransfer& transfer,
                const std::vector<std::uint16_t>& indices, std::chrono::milliseconds lead_delay,
                bool retransmission, TimePoint now, SenderActions& actions);
  void emit(const std::string& peer_id, const std::string& message_id,
            const std::vector<std::vector<std::uint8_t>>& parcels,
            const std::vector<std::uint16_t>& indices, std::chrono::milliseconds lead_delay,
            bool retransmission, SenderActions& actions);
  void retry(const std::string& peer_id, PeerState& state, const std::vector<std::uint16_t>& indices,
             std::chrono::milliseconds lead_delay, TimePoint now, SenderActions& actions);
  DeliveryReport finish(const std::string& peer_id, PeerState& state, DeliveryOutcome outcome,
                        FailureReason reason, TimePoint now);

  TransferPolicy policy_;
  std::map<std::string, PeerState> peers_;
  SenderStats stats_;
  mutable std::mutex mutex_;
};

}  // namespace parcelink::parcel
