#include "parcel/reassembly_table.h"

#include <set>
#include <string>
#include <utility>
#include <vector>

#include "common/logging/logger.h"
#include "parcel/checksum.h"
#include "parcel/errors.h"
#include "parcel/parcel_codec.h"

namespace parcelink::parcel {

namespace {

std::set<std::uint32_t> encoded_checksums(const IncomingMessage& message) {
  std::set<std::uint32_t> sums;
  for (const auto& [index, chunk] : message.chunks()) {
    const auto parcel =
        index == 0 ? make_header_parcel(message.message_id(), message.total_parcels(),
                                        message.expected_integrity_code(), message.flags(), chunk)
                   : make_data_parcel(message.message_id(), index, chunk);
    sums.insert(checksum(ParcelCodec::encode(parcel)));
  }
  return sums;
}

}  // namespace

ReassemblyTable::ReassemblyTable(TransferPolicy policy) : policy_(std::move(policy)) {}

IngestResult ReassemblyTable::ingest(const std::string& peer_id,
                                     std::span<const std::uint8_t> bytes, TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);

  const auto id = ParcelCodec::peek_message_id(bytes);
  if (!id) {
    return reject({}, bytes.size() < kMessageIdSize ? ParcelError::kTruncated
                                                    : ParcelError::kInvalidMessageId);
  }
  const Key key{peer_id, *id};
  if (messages_.find(key) != messages_.end()) {
    return ingest_locked(peer_id, bytes, ParcelKind::kData, now);
  }

  // No assembly in progress. A late parcel of a message that just completed would
  // otherwise be misread as a header; only an exact copy counts as one, so a new
  // message reusing the id still starts from its header.
  auto done = completed_.find(key);
  if (done != completed_.end() && done->second.parcel_checksums.count(checksum(bytes)) != 0) {
    ++stats_.duplicates_ignored;
    LOG_DEBUG("Ignoring retransmitted parcel of completed message {} from {}", *id, peer_id);
    return duplicate(*id);
  }
  return ingest_locked(peer_id, bytes, ParcelKind::kHeader, now);
}

IngestResult ReassemblyTable::ingest(const std::string& peer_id,
                                     std::span<const std::uint8_t> bytes, ParcelKind kind,
                                     TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  return ingest_locked(peer_id, bytes, kind, now);
}

IngestResult ReassemblyTable::ingest_locked(const std::string& peer_id,
                                            std::span<const std::uint8_t> bytes, ParcelKind kind,
                                            TimePoint now) {
  std::error_code ec;
  const auto parcel = ParcelCodec::decode(bytes, kind, ec);
  if (!parcel) {
    return reject(ParcelCodec::peek_message_id(bytes).value_or(std::string{}), ec);
  }
  const Key key{peer_id, parcel->message_id};
  if (parcel->is_header()) {
    return ingest_header(key, *parcel, now);
  }
  return ingest_data(key, *parcel, now);
}

IngestResult ReassemblyTable::ingest_header(const Key& key, const Parcel& parcel,
                                            TimePoint now) {
  auto it = messages_.find(key);
  if (it != messages_.end()) {
    std::error_code ec;
    if (it->second.add_parcel(parcel, now, ec)) {
      LOG_DEBUG("Duplicate header for message {} from {}", key.message_id, key.peer_id);
      return finish_if_complete(key, now);
    }
    // Same id, different transmission: the sender gave up on the old one.
    LOG_WARN("Message {} from {} restarted by a new header, dropping {}/{} parcels",
             key.message_id, key.peer_id, it->second.received_count(),
             it->second.total_parcels());
    messages_.erase(it);
  }

  auto done = completed_.find(key);
  if (done != completed_.end()) {
    if (done->second.total_parcels == parcel.total_parcels &&
        done->second.integrity_code == parcel.integrity_code) {
      ++stats_.duplicates_ignored;
      LOG_DEBUG("Header for completed message {} from {}", key.message_id, key.peer_id);
      return duplicate(key.message_id);
    }
    completed_.erase(done);
  }

  messages_.try_emplace(key, parcel, key.peer_id, now);
  ++stats_.messages_started;
  LOG_INFO("Receiving message {} from {}: {} parcels, flags={:#04x}", key.message_id,
           key.peer_id, parcel.total_parcels, parcel.flags);
  return finish_if_complete(key, now);
}

IngestResult ReassemblyTable::ingest_data(const Key& key, const Parcel& parcel, TimePoint now) {
  auto it = messages_.find(key);
  if (it == messages_.end()) {
    if (completed_.find(key) != completed_.end()) {
      ++stats_.duplicates_ignored;
      return duplicate(key.message_id);
    }
    LOG_DEBUG("Data parcel {} for unknown message {} from {}", parcel.index, key.message_id,
              key.peer_id);
    return reject(key.message_id, ParcelError::kUnknownMessage);
  }

  std::error_code ec;
  if (!it->second.add_parcel(parcel, now, ec)) {
    return reject(key.message_id, ec);
  }
  LOG_DEBUG("Message {} from {}: parcel {} ({}/{})", key.message_id, key.peer_id, parcel.index,
            it->second.received_count(), it->second.total_parcels());
  return finish_if_complete(key, now);
}

IngestResult ReassemblyTable::finish_if_complete(const Key& key, TimePoint now) {
  IngestResult result;
  result.message_id = key.message_id;

  auto it = messages_.find(key);
  if (it == messages_.end() || !it->second.is_complete()) {
    result.status = IngestStatus::kAccepted;
    return result;
  }

  auto assembly = it->second.assemble();
  CompletedMessage completed{it->second.total_parcels(), it->second.expected_integrity_code(),
                             {}, now};
  if (assembly.status == AssemblyStatus::kComplete) {
    completed.parcel_checksums = encoded_checksums(it->second);
  }
  messages_.erase(it);

  switch (assembly.status) {
    case AssemblyStatus::kComplete:
      ++stats_.messages_completed;
      completed_[key] = std::move(completed);
      LOG_INFO("Message {} from {} complete: {} bytes", key.message_id, key.peer_id,
               assembly.payload.size());
      result.status = IngestStatus::kCompleted;
      result.receipt = Receipt::complete(key.message_id);
      result.payload = std::move(assembly.payload);
      break;
    case AssemblyStatus::kChecksumFailed:
      ++stats_.checksum_failures;
      result.status = IngestStatus::kChecksumFailed;
      result.receipt = Receipt::checksum_failed(key.message_id);
      result.error = assembly.error;
      break;
    case AssemblyStatus::kDecompressionFailed:
      ++stats_.decompression_failures;
      result.status = IngestStatus::kDecompressionFailed;
      result.error = assembly.error;
      break;
    case AssemblyStatus::kIncomplete:
      // Unreachable: completeness was checked above.
      result.status = IngestStatus::kAccepted;
      break;
  }
  return result;
}

// A retransmission reaching us after completion means our complete receipt was
// lost; repeat it.
IngestResult ReassemblyTable::duplicate(const std::string& message_id) {
  IngestResult result;
  result.status = IngestStatus::kDuplicate;
  result.message_id = message_id;
  result.receipt = Receipt::complete(message_id);
  return result;
}

IngestResult ReassemblyTable::reject(const std::string& message_id, std::error_code ec) {
  ++stats_.parcels_rejected;
  LOG_DEBUG("Dropping parcel for message '{}': {}", message_id, ec.message());
  IngestResult result;
  result.status = IngestStatus::kRejected;
  result.message_id = message_id;
  result.error = ec;
  return result;
}

std::vector<PendingReceipt> ReassemblyTable::housekeeping(TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<PendingReceipt> receipts;

  for (auto it = messages_.begin(); it != messages_.end();) {
    auto& message = it->second;
    if (message.is_stale(now, policy_.incomplete_message_timeout)) {
      ++stats_.stale_evictions;
      LOG_INFO("Evicting stale message {} from {}: {}/{} parcels received", it->first.message_id,
               it->first.peer_id, message.received_count(), message.total_parcels());
      it = messages_.erase(it);
      continue;
    }
    if (now - message.last_activity() >= policy_.missing_request_delay) {
      auto missing = message.missing_indices();
      if (!missing.empty()) {
        ++stats_.missing_requests;
        LOG_DEBUG("Requesting {} missing parcels of message {} from {}", missing.size(),
                  it->first.message_id, it->first.peer_id);
        receipts.push_back({it->first.peer_id, Receipt::missing(it->first.message_id, std::move(missing))});
        message.mark_missing_request_sent(now);
      }
    }
    ++it;
  }

  for (auto it = completed_.begin(); it != completed_.end();) {
    if (now - it->second.completed_at > policy_.duplicate_window) {
      it = completed_.erase(it);
    } else {
      ++it;
    }
  }
  return receipts;
}

std::size_t ReassemblyTable::cancel_peer(const std::string& peer_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t dropped = 0;
  for (auto it = messages_.begin(); it != messages_.end();) {
    if (it->first.peer_id == peer_id) {
      it = messages_.erase(it);
      ++dropped;
    } else {
      ++it;
    }
  }
  for (auto it = completed_.begin(); it != completed_.end();) {
    if (it->first.peer_id == peer_id) {
      it = completed_.erase(it);
    } else {
      ++it;
    }
  }
  if (dropped > 0) {
    LOG_INFO("Dropped {} incomplete messages from {}", dropped, peer_id);
  }
  return dropped;
}

std::size_t ReassemblyTable::pending_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return messages_.size();
}

bool ReassemblyTable::has_pending(const std::string& peer_id, const std::string& message_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return messages_.find(Key{peer_id, message_id}) != messages_.end();
}

std::optional<std::vector<std::uint16_t>> ReassemblyTable::missing_indices(
    const std::string& peer_id, const std::string& message_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = messages_.find(Key{peer_id, message_id});
  if (it == messages_.end()) {
    return std::nullopt;
  }
  return it->second.missing_indices();
}

ReassemblyStats ReassemblyTable::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

}  // namespace parcelink::parcel
