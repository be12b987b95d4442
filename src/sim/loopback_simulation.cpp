#include "sim/loopback_simulation.h"

#include <algorithm>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "common/crypto/random.h"
#include "common/logging/logger.h"

namespace parcelink::sim {

namespace {

constexpr const char* kSenderPeer = "sim-sender";
constexpr const char* kReceiverPeer = "sim-receiver";

// Granularity of the simulated clock.
constexpr std::chrono::milliseconds kTick{10};

constexpr std::string_view kFiller =
    "parcelink loopback simulation: inventory sync record, status=ok, qty=12; ";

}  // namespace

LoopbackSimulation::LoopbackSimulation(SimConfig config)
    : config_(std::move(config)),
      sender_(config_.policy),
      receiver_(config_.policy),
      forward_(config_.link.drop_rate, config_.link.corrupt_rate, config_.seed),
      // Receipts are short JSON records; the link is only allowed to lose them.
      backward_(config_.link.receipt_drop_rate, 0.0, config_.seed == 0 ? 0 : config_.seed + 1) {}

std::vector<std::uint8_t> LoopbackSimulation::make_payload(std::size_t n) {
  std::vector<std::uint8_t> payload;
  payload.reserve(config_.payload_size);
  if (config_.compressible) {
    const auto prefix = "#" + std::to_string(n) + " ";
    payload.insert(payload.end(), prefix.begin(), prefix.end());
    while (payload.size() < config_.payload_size) {
      payload.insert(payload.end(), kFiller.begin(), kFiller.end());
    }
    payload.resize(config_.payload_size);
    return payload;
  }
  if (config_.seed != 0) {
    std::mt19937_64 rng(config_.seed * 1000003 + n);
    std::uniform_int_distribution<int> dist(0, 255);
    for (std::size_t i = 0; i < config_.payload_size; ++i) {
      payload.push_back(static_cast<std::uint8_t>(dist(rng)));
    }
    return payload;
  }
  return crypto::random_bytes(config_.payload_size);
}

SimReport LoopbackSimulation::run() {
  SimReport report;
  report.messages = config_.messages;

  const parcel::TimePoint start = parcel::TimePoint{} + std::chrono::hours(1);
  parcel::TimePoint now = start;
  link_free_at_ = now;

  for (std::size_t i = 0; i < config_.messages; ++i) {
    parcel::OutgoingMessage message;
    message.payload = make_payload(i);
    message.target_peer_id = kReceiverPeer;
    message.peer_supports_compression = config_.compression_enabled;
    auto payload = message.payload;
    const auto id = sender_.enqueue(std::move(message), now);
    expected_[id] = std::move(payload);
  }

  auto next_housekeeping = now + config_.policy.housekeeping_interval;
  while (reports_ < config_.messages) {
    if (now - start > config_.max_sim_time) {
      LOG_WARN("Simulated time limit reached with {} of {} messages settled", reports_,
               config_.messages);
      report.timed_out = true;
      break;
    }

    dispatch(sender_.poll(now), now, report);

    while (!in_flight_.empty() && in_flight_.top().arrival <= now) {
      auto item = in_flight_.top();
      in_flight_.pop();
      deliver(std::move(item), now, report);
    }

    if (now >= next_housekeeping) {
      for (const auto& pending : receiver_.housekeeping(now)) {
        send_receipt(pending.receipt, now);
      }
      sender_.housekeeping(now);
      next_housekeeping = now + config_.policy.housekeeping_interval;
    }

    now += kTick;
  }

  report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - start);
  report.sender = sender_.stats();
  report.receiver = receiver_.stats();
  report.forward = forward_.stats();
  report.backward = backward_.stats();
  return report;
}

void LoopbackSimulation::dispatch(parcel::SenderActions actions, parcel::TimePoint now,
                                  SimReport& report) {
  for (auto& out : actions.parcels) {
    const auto send_at = std::max(now, link_free_at_) + out.delay_before;
    link_free_at_ = send_at;
    auto carried = forward_.carry(std::move(out.bytes));
    if (!carried) {
      LOG_DEBUG("Link lost parcel {} of message {}", out.index, out.message_id);
      continue;
    }
    in_flight_.push(InFlight{send_at + config_.link.latency, next_sequence_++, true,
                             std::move(*carried)});
  }
  for (const auto& delivery : actions.reports) {
    ++reports_;
    if (delivery.outcome == parcel::DeliveryOutcome::kDelivered) {
      ++report.delivered;
    } else {
      ++report.failed;
      LOG_WARN("Message {} failed: {}", delivery.message_id,
               parcel::failure_reason_to_string(delivery.reason));
    }
  }
}

void LoopbackSimulation::send_receipt(const parcel::Receipt& receipt, parcel::TimePoint now) {
  auto carried = backward_.carry(parcel::encode_receipt(receipt));
  if (!carried) {
    LOG_DEBUG("Link lost {} receipt for message {}", parcel::receipt_status_to_string(receipt.status),
              receipt.message_id);
    return;
  }
  in_flight_.push(InFlight{now + config_.link.latency, next_sequence_++, false, std::move(*carried)});
}

void LoopbackSimulation::deliver(InFlight item, parcel::TimePoint now, SimReport& report) {
  if (!item.to_receiver) {
    if (!parcel::looks_like_receipt(item.bytes)) {
      return;
    }
    std::error_code ec;
    const auto receipt = parcel::decode_receipt(item.bytes, ec);
    if (!receipt) {
      LOG_WARN("Dropping malformed receipt: {}", ec.message());
      return;
    }
    dispatch(sender_.on_receipt(kReceiverPeer, *receipt, now), now, report);
    return;
  }

  auto result = receiver_.ingest(kSenderPeer, item.bytes, now);
  if (result.status == parcel::IngestStatus::kDecompressionFailed) {
    ++report.decompression_failures;
  }
  if (result.payload) {
    auto expected = expected_.find(result.message_id);
    if (expected == expected_.end() || expected->second != *result.payload) {
      ++report.payload_mismatches;
      LOG_ERROR("Message {} reassembled with wrong content", result.message_id);
    }
  }
  if (result.receipt) {
    send_receipt(*result.receipt, now);
  }
}

}  // namespace parcelink::sim
