#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "parcel/parcel.h"

namespace parcelink::parcel {

enum class AssemblyStatus {
  kComplete,
  kIncomplete,
  kChecksumFailed,
  kDecompressionFailed,
};

struct AssemblyResult {
  AssemblyStatus status{AssemblyStatus::kIncomplete};
  // Application bytes as sent; only set for kComplete.
  std::vector<std::uint8_t> payload;
  // Detail for the failure statuses.
  std::error_code error;
};

// Receiver-side state for one message from one peer. Created from the header
// parcel, which fixes total_parcels, the integrity code and the flags.
// Not thread-safe; ReassemblyTable serializes access.
class IncomingMessage {
 public:
  IncomingMessage(const Parcel& header, std::string source_peer_id, TimePoint now);

  // Stores the parcel payload at its index. Re-delivery overwrites the same slot.
  // Returns false and sets ec when the parcel belongs to another message
  // (kUnknownMessage) or its index is outside [0, total_parcels) (kIndexOutOfRange).
  bool add_parcel(const Parcel& parcel, TimePoint now, std::error_code& ec);

  [[nodiscard]] bool is_complete() const { return chunks_.size() == total_parcels_; }

  // Every index in [0, total_parcels) not yet received, ascending.
  std::vector<std::uint16_t> missing_indices() const;

  // Concatenates the chunks, verifies the integrity code and inflates if flagged.
  // Decompression is never attempted on data that fails the checksum.
  AssemblyResult assemble() const;

  void mark_missing_request_sent(TimePoint now) { last_missing_request_at_ = now; }

  // Incomplete and no parcel received for longer than `timeout`.
  [[nodiscard]] bool is_stale(TimePoint now, std::chrono::milliseconds timeout) const;

  // The later of the last parcel arrival and the last missing request.
  [[nodiscard]] TimePoint last_activity() const;

  [[nodiscard]] const std::string& message_id() const { return message_id_; }
  [[nodiscard]] const std::string& source_peer_id() const { return source_peer_id_; }
  [[nodiscard]] std::uint16_t total_parcels() const { return total_parcels_; }
  [[nodiscard]] std::uint32_t expected_integrity_code() const { return expected_integrity_code_; }
  [[nodiscard]] std::uint8_t flags() const { return flags_; }
  [[nodiscard]] std::size_t received_count() const { return chunks_.size(); }
  // Stored payloads by parcel index.
  [[nodiscard]] const std::map<std::uint16_t, std::vector<std::uint8_t>>& chunks() const {
    return chunks_;
  }
  [[nodiscard]] TimePoint started_at() const { return started_at_; }
  [[nodiscard]] TimePoint last_parcel_received_at() const { return last_parcel_received_at_; }
  [[nodiscard]] std::optional<TimePoint> last_missing_request_at() const {
    return last_missing_request_at_;
  }

 private:
  std::string message_id_;
  std::string source_peer_id_;
  std::uint16_t total_parcels_;
  std::uint32_t expected_integrity_code_;
  std::uint8_t flags_;
  std::map<std::uint16_t, std::vector<std::uint8_t>> chunks_;
  TimePoint started_at_;
  TimePoint last_parcel_received_at_;
  std::optional<TimePoint> last_missing_request_at_;
};

}  // namespace parcelink::parcel
