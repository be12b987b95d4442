#include "parcel/parcel_sender.h"

#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "common/logging/logger.h"
#include "parcel/parcel_codec.h"

namespace parcelink::parcel {

namespace {

// 26 * 26 possible ids; give up well after a full alphabet sweep.
constexpr int kMaxIdAttempts = 4096;

std::chrono::milliseconds total_delay(const std::vector<std::chrono::milliseconds>& delays) {
  std::chrono::milliseconds sum{0};
  for (const auto d : delays) {
    sum += d;
  }
  return sum;
}

std::vector<std::uint16_t> all_indices(std::size_t count) {
  std::vector<std::uint16_t> indices;
  indices.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    indices.push_back(static_cast<std::uint16_t>(i));
  }
  return indices;
}

}  // namespace

const char* failure_reason_to_string(FailureReason reason) {
  switch (reason) {
    case FailureReason::kNone: return "none";
    case FailureReason::kRetryExhausted: return "retry exhausted";
    case FailureReason::kCancelled: return "cancelled";
  }
  return "unknown";
}

void SenderActions::append(SenderActions other) {
  parcels.insert(parcels.end(), std::make_move_iterator(other.parcels.begin()),
                 std::make_move_iterator(other.parcels.end()));
  reports.insert(reports.end(), std::make_move_iterator(other.reports.begin()),
                 std::make_move_iterator(other.reports.end()));
}

ParcelSender::ParcelSender(TransferPolicy policy) : policy_(std::move(policy)) {}

bool ParcelSender::id_in_use(const PeerState& state, const std::string& message_id) const {
  if (state.active && state.active->entry.message.message_id == message_id) {
    return true;
  }
  for (const auto& queued : state.queue) {
    if (queued.message.message_id == message_id) {
      return true;
    }
  }
  return state.retained.find(message_id) != state.retained.end();
}

std::string ParcelSender::enqueue(OutgoingMessage message, TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& state = peers_[message.target_peer_id];

  if (!is_valid_message_id(message.message_id) || id_in_use(state, message.message_id)) {
    const auto requested = message.message_id;
    int attempts = 0;
    do {
      if (++attempts > kMaxIdAttempts) {
        throw std::runtime_error("no free message id for peer " + message.target_peer_id);
      }
      message.message_id = generate_message_id();
    } while (id_in_use(state, message.message_id));
    if (!requested.empty()) {
      LOG_DEBUG("Message id {} unavailable for {}, using {}", requested, message.target_peer_id,
                message.message_id);
    }
  }
  message.enqueued_at = now;
  message.retry_count = 0;

  QueuedMessage entry;
  for (const auto& parcel : split_message(message, policy_.compression_threshold)) {
    entry.parcels.push_back(ParcelCodec::encode(parcel));
  }
  auto id = message.message_id;
  LOG_INFO("Queued message {} for {}: {} bytes, {} parcels", id, message.target_peer_id,
           message.payload.size(), entry.parcels.size());
  entry.message = std::move(message);
  state.queue.push_back(std::move(entry));
  ++stats_.messages_enqueued;
  return id;
}

SenderActions ParcelSender::poll(TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  SenderActions actions;

  for (auto& [peer_id, state] : peers_) {
    if (state.active) {
      if (now < state.active->receipt_deadline) {
        continue;
      }
      ++stats_.receipt_timeouts;
      LOG_WARN("No receipt for message {} from {}, retransmitting",
               state.active->entry.message.message_id, peer_id);
      const auto indices = state.active->last_requested;
      retry(peer_id, state, indices, policy_.retry_backoff, now, actions);
      continue;
    }
    if (state.queue.empty()) {
      continue;
    }

    ActiveTransfer transfer;
    transfer.entry = std::move(state.queue.front());
    state.queue.pop_front();
    state.active = std::move(transfer);
    const auto indices = all_indices(state.active->entry.parcels.size());
    LOG_DEBUG("Starting message {} to {}", state.active->entry.message.message_id, peer_id);
    transmit(peer_id, *state.active, indices, std::chrono::milliseconds{0}, false, now, actions);
  }
  return actions;
}

SenderActions ParcelSender::on_receipt(const std::string& peer_id, const Receipt& receipt,
                                       TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  SenderActions actions;

  auto peer = peers_.find(peer_id);
  if (peer == peers_.end()) {
    LOG_DEBUG("Receipt {} from unknown peer {}", receipt.message_id, peer_id);
    return actions;
  }
  auto& state = peer->second;

  if (state.active && state.active->entry.message.message_id == receipt.message_id) {
    auto& transfer = *state.active;
    if (receipt.status == ReceiptStatus::kComplete) {
      actions.reports.push_back(
          finish(peer_id, state, DeliveryOutcome::kDelivered, FailureReason::kNone, now));
      return actions;
    }
    if (now < transfer.round_end) {
      LOG_DEBUG("Receipt {} for {} from {} arrived mid-round, ignoring",
                receipt_status_to_string(receipt.status), receipt.message_id, peer_id);
      return actions;
    }
    const auto total = static_cast<std::uint16_t>(transfer.entry.parcels.size());
    const auto indices = resend_indices(receipt, total);
    if (indices.empty()) {
      LOG_WARN("Receipt for {} from {} names no valid parcel", receipt.message_id, peer_id);
      return actions;
    }
    LOG_INFO("Peer {} reports {} for message {}, resending {} parcels", peer_id,
             receipt_status_to_string(receipt.status), receipt.message_id, indices.size());
    retry(peer_id, state, indices, std::chrono::milliseconds{0}, now, actions);
    return actions;
  }

  auto retained = state.retained.find(receipt.message_id);
  if (retained != state.retained.end()) {
    if (receipt.status == ReceiptStatus::kComplete) {
      return actions;
    }
    const auto total = static_cast<std::uint16_t>(retained->second.parcels.size());
    const auto indices = resend_indices(receipt, total);
    if (!indices.empty()) {
      ++stats_.delayed_retransmissions;
      LOG_INFO("Late request from {} for message {}, resending {} parcels", peer_id,
               receipt.message_id, indices.size());
      emit(peer_id, receipt.message_id, retained->second.parcels, indices,
           std::chrono::milliseconds{0}, true, actions);
    }
    return actions;
  }

  LOG_DEBUG("Ignoring receipt for unknown message {} from {}", receipt.message_id, peer_id);
  return actions;
}

void ParcelSender::housekeeping(TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto peer = peers_.begin(); peer != peers_.end();) {
    auto& retained = peer->second.retained;
    for (auto it = retained.begin(); it != retained.end();) {
      if (now - it->second.sent_at > policy_.sent_message_retention) {
        it = retained.erase(it);
      } else {
        ++it;
      }
    }
    const auto& state = peer->second;
    if (!state.active && state.queue.empty() && state.retained.empty()) {
      peer = peers_.erase(peer);
    } else {
      ++peer;
    }
  }
}

std::vector<DeliveryReport> ParcelSender::cancel_peer(const std::string& peer_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<DeliveryReport> reports;
  auto peer = peers_.find(peer_id);
  if (peer == peers_.end()) {
    return reports;
  }
  auto& state = peer->second;
  if (state.active) {
    reports.push_back({peer_id, state.active->entry.message.message_id, DeliveryOutcome::kFailed,
                       FailureReason::kCancelled, state.active->entry.message.retry_count});
  }
  for (const auto& queued : state.queue) {
    reports.push_back({peer_id, queued.message.message_id, DeliveryOutcome::kFailed,
                       FailureReason::kCancelled, 0});
  }
  stats_.messages_failed += reports.size();
  peers_.erase(peer);
  if (!reports.empty()) {
    LOG_INFO("Cancelled {} messages for {}", reports.size(), peer_id);
  }
  return reports;
}

std::size_t ParcelSender::queue_length(const std::string& peer_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto peer = peers_.find(peer_id);
  return peer == peers_.end() ? 0 : peer->second.queue.size();
}

bool ParcelSender::is_sending(const std::string& peer_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto peer = peers_.find(peer_id);
  return peer != peers_.end() && peer->second.active.has_value();
}

SenderStats ParcelSender::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

void ParcelSender::transmit(const std::string& peer_id, ActiveTransfer& transfer,
                            const std::vector<std::uint16_t>& indices,
                            std::chrono::milliseconds lead_delay, bool retransmission,
                            TimePoint now, SenderActions& actions) {
  emit(peer_id, transfer.entry.message.message_id, transfer.entry.parcels, indices, lead_delay,
       retransmission, actions);
  transfer.last_requested = indices;
  // The round takes the sum of its pacing delays; the receipt clock starts after it.
  transfer.round_end = now + lead_delay + total_delay(pacing_schedule(indices.size(), policy_));
  transfer.receipt_deadline = transfer.round_end + policy_.receipt_timeout;
}

void ParcelSender::emit(const std::string& peer_id, const std::string& message_id,
                        const std::vector<std::vector<std::uint8_t>>& parcels,
                        const std::vector<std::uint16_t>& indices,
                        std::chrono::milliseconds lead_delay, bool retransmission,
                        SenderActions& actions) {
  const auto delays = pacing_schedule(indices.size(), policy_);
  for (std::size_t i = 0; i < indices.size(); ++i) {
    OutboundParcel out;
    out.peer_id = peer_id;
    out.message_id = message_id;
    out.index = indices[i];
    out.bytes = parcels[indices[i]];
    out.delay_before = delays[i] + (i == 0 ? lead_delay : std::chrono::milliseconds{0});
    out.retransmission = retransmission;
    actions.parcels.push_back(std::move(out));
  }
  stats_.parcels_sent += indices.size();
  if (retransmission) {
    stats_.parcels_resent += indices.size();
  }
}

void ParcelSender::retry(const std::string& peer_id, PeerState& state,
                         const std::vector<std::uint16_t>& indices,
                         std::chrono::milliseconds lead_delay, TimePoint now,
                         SenderActions& actions) {
  auto& transfer = *state.active;
  ++transfer.entry.message.retry_count;
  if (transfer.entry.message.retry_count > policy_.max_retries) {
    actions.reports.push_back(
        finish(peer_id, state, DeliveryOutcome::kFailed, FailureReason::kRetryExhausted, now));
    return;
  }
  transmit(peer_id, transfer, indices, lead_delay, true, now, actions);
}

DeliveryReport ParcelSender::finish(const std::string& peer_id, PeerState& state,
                                    DeliveryOutcome outcome, FailureReason reason, TimePoint now) {
  auto& transfer = *state.active;
  DeliveryReport report{peer_id, transfer.entry.message.message_id, outcome, reason,
                        transfer.entry.message.retry_count};
  if (outcome == DeliveryOutcome::kDelivered) {
    ++stats_.messages_delivered;
    LOG_INFO("Message {} delivered to {} after {} retries", report.message_id, peer_id,
             report.retries);
    state.retained[report.message_id] = RetainedMessage{std::move(transfer.entry.parcels), now};
  } else {
    ++stats_.messages_failed;
    LOG_WARN("Message {} to {} failed: {}", report.message_id, peer_id,
             failure_reason_to_string(reason));
  }
  state.active.reset();
  return report;
}

}  // namespace parcelink::parcel
