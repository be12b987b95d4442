#include "parcel/incoming_message.h"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "common/logging/logger.h"
#include "parcel/checksum.h"
#include "parcel/compression.h"
#include "parcel/errors.h"

namespace parcelink::parcel {

IncomingMessage::IncomingMessage(const Parcel& header, std::string source_peer_id, TimePoint now)
    : message_id_(header.message_id),
      source_peer_id_(std::move(source_peer_id)),
      total_parcels_(header.total_parcels),
      expected_integrity_code_(header.integrity_code),
      flags_(header.flags),
      started_at_(now),
      last_parcel_received_at_(now) {
  if (!header.is_header() || header.total_parcels == 0) {
    throw std::invalid_argument("incoming message must start from a header parcel");
  }
  chunks_[0] = header.payload;
}

bool IncomingMessage::add_parcel(const Parcel& parcel, TimePoint now, std::error_code& ec) {
  if (parcel.message_id != message_id_) {
    ec = ParcelError::kUnknownMessage;
    return false;
  }
  if (parcel.is_header()) {
    // A header describing a different transmission is not a duplicate of ours.
    if (parcel.total_parcels != total_parcels_ || parcel.integrity_code != expected_integrity_code_ ||
        parcel.flags != flags_) {
      ec = ParcelError::kUnknownMessage;
      return false;
    }
  } else if (parcel.index == 0) {
    ec = ParcelError::kReservedIndex;
    return false;
  } else if (parcel.index >= total_parcels_) {
    ec = ParcelError::kIndexOutOfRange;
    return false;
  }

  chunks_[parcel.index] = parcel.payload;
  last_parcel_received_at_ = now;
  last_missing_request_at_.reset();
  return true;
}

std::vector<std::uint16_t> IncomingMessage::missing_indices() const {
  std::vector<std::uint16_t> missing;
  for (std::uint32_t i = 0; i < total_parcels_; ++i) {
    const auto index = static_cast<std::uint16_t>(i);
    if (chunks_.find(index) == chunks_.end()) {
      missing.push_back(index);
    }
  }
  return missing;
}

AssemblyResult IncomingMessage::assemble() const {
  AssemblyResult result;
  if (!is_complete()) {
    result.status = AssemblyStatus::kIncomplete;
    return result;
  }

  std::size_t total_size = 0;
  for (const auto& [index, chunk] : chunks_) {
    total_size += chunk.size();
  }
  std::vector<std::uint8_t> transmitted;
  transmitted.reserve(total_size);
  // std::map iterates in ascending index order.
  for (const auto& [index, chunk] : chunks_) {
    transmitted.insert(transmitted.end(), chunk.begin(), chunk.end());
  }

  const auto actual = checksum(transmitted);
  if (actual != expected_integrity_code_) {
    LOG_WARN("Checksum mismatch for message {} from {}: expected {:#010x}, got {:#010x}",
             message_id_, source_peer_id_, expected_integrity_code_, actual);
    result.status = AssemblyStatus::kChecksumFailed;
    result.error = ParcelError::kChecksumMismatch;
    return result;
  }

  const auto compression_id = static_cast<std::uint8_t>(flags_ & kCompressionMask);
  if (compression_id == static_cast<std::uint8_t>(CompressionAlgorithm::kNone)) {
    result.status = AssemblyStatus::kComplete;
    result.payload = std::move(transmitted);
    return result;
  }

  std::error_code ec;
  auto inflated = decompress(transmitted, compression_id, ec);
  if (!inflated) {
    LOG_ERROR("Decompression failed for message {} from {}: {}", message_id_, source_peer_id_,
              ec.message());
    result.status = AssemblyStatus::kDecompressionFailed;
    result.error = ec;
    return result;
  }
  result.status = AssemblyStatus::kComplete;
  result.payload = std::move(*inflated);
  return result;
}

bool IncomingMessage::is_stale(TimePoint now, std::chrono::milliseconds timeout) const {
  return !is_complete() && now - last_parcel_received_at_ > timeout;
}

TimePoint IncomingMessage::last_activity() const {
  if (last_missing_request_at_) {
    return std::max(last_parcel_received_at_, *last_missing_request_at_);
  }
  return last_parcel_received_at_;
}

}  // namespace parcelink::parcel
