#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <system_error>
#include <vector>

#include "parcel/incoming_message.h"
#include "parcel/parcel.h"
#include "parcel/receipt.h"
#include "parcel/transfer_policy.h"

namespace parcelink::parcel {

enum class IngestStatus {
  kAccepted,             // Stored; message still incomplete.
  kCompleted,            // Message assembled; payload and a complete receipt are set.
  kChecksumFailed,       // Assembled bytes failed verification; receipt asks for a full resend.
  kDecompressionFailed,  // Hard failure; no receipt, the message is lost.
  kDuplicate,            // Retransmission of a completed message; a complete receipt is repeated.
  kRejected,             // Malformed or unroutable parcel, dropped.
};

struct IngestResult {
  IngestStatus status{IngestStatus::kRejected};
  std::string message_id;
  // Receipt the transport should send back to the peer, if any.
  std::optional<Receipt> receipt;
  std::optional<std::vector<std::uint8_t>> payload;
  std::error_code error;
};

struct PendingReceipt {
  std::string peer_id;
  Receipt receipt;
};

struct ReassemblyStats {
  std::uint64_t messages_started{0};
  std::uint64_t messages_completed{0};
  std::uint64_t checksum_failures{0};
  std::uint64_t decompression_failures{0};
  std::uint64_t parcels_rejected{0};
  std::uint64_t stale_evictions{0};
  std::uint64_t missing_requests{0};
  std::uint64_t duplicates_ignored{0};
};

// Receiver side of the protocol: one IncomingMessage per (peer, message id).
// All methods are thread-safe.
class ReassemblyTable {
 public:
  explicit ReassemblyTable(TransferPolicy policy = {});

  // Parses and stores one received buffer. The parcel kind comes from session
  // state: a buffer whose (peer, id) has no assembly in progress is parsed as a
  // header, otherwise as a data parcel. A buffer identical to a parcel of a recently
  // completed message is a retransmission and only repeats the complete receipt.
  IngestResult ingest(const std::string& peer_id, std::span<const std::uint8_t> bytes,
                      TimePoint now);

  // Same, for transports that know the kind (e.g. separate characteristics).
  IngestResult ingest(const std::string& peer_id, std::span<const std::uint8_t> bytes,
                      ParcelKind kind, TimePoint now);

  // Emits missing-parcel receipts for quiet incomplete messages, evicts stale ones
  // and forgets completed messages older than the duplicate window.
  std::vector<PendingReceipt> housekeeping(TimePoint now);

  // Drops every assembly in progress for a peer. Returns the number dropped.
  std::size_t cancel_peer(const std::string& peer_id);

  std::size_t pending_count() const;
  bool has_pending(const std::string& peer_id, const std::string& message_id) const;

  // Missing indices of an assembly in progress, nullopt when none exists.
  std::optional<std::vector<std::uint16_t>> missing_indices(const std::string& peer_id,
                                                            const std::string& message_id) const;

  ReassemblyStats stats() const;

  const TransferPolicy& policy() const { return policy_; }

 private:
  struct Key {
    std::string peer_id;
    std::string message_id;
    auto operator<=>(const Key&) const = default;
  };

  struct CompletedMessage {
    std::uint16_t total_parcels{0};
    std::uint32_t integrity_code{0};
    // CRC-32 of every parcel as it was encoded on the wire.
    std::set<std::uint32_t> parcel_checksums;
    TimePoint completed_at{};
  };

  // Callers hold mutex_.
  IngestResult ingest_header(const Key& key, const Parcel& parcel, TimePoint now);
  IngestResult ingest_data(const Key& key, const Parcel& parcel, TimePoint now);
  IngestResult finish_if_complete(const Key& key, TimePoint now);
  IngestResult duplicate(const std::string& message_id);
  IngestResult reject(const std::string& message_id, std::error_code ec);
  IngestResult ingest_locked(const std::string& peer_id, std::span<const std::uint8_t> bytes,
                             ParcelKind kind, TimePoint now);

  TransferPolicy policy_;
  std::map<Key, IncomingMessage> messages_;
  std::map<Key, CompletedMessage> completed_;
  ReassemblyStats stats_;
  mutable std::mutex mutex_;
};

}  // namespace parcelink::parcel
