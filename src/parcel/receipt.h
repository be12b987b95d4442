#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <vector>

namespace parcelink::parcel {

// ============================================================================
// Receipts - JSON control messages from receiver to sender
// ============================================================================
// {"msg_id":"AB","status":"complete"}
// {"msg_id":"AB","status":"missing","parcels":[2,5]}
// {"msg_id":"AB","status":"checksumFailed"}

enum class ReceiptStatus { kComplete, kMissing, kChecksumFailed };

struct Receipt {
  std::string message_id;
  ReceiptStatus status{ReceiptStatus::kComplete};
  // Only meaningful for kMissing; ascending.
  std::vector<std::uint16_t> missing_indices;

  static Receipt complete(std::string message_id);
  static Receipt missing(std::string message_id, std::vector<std::uint16_t> indices);
  static Receipt checksum_failed(std::string message_id);

  bool operator==(const Receipt&) const = default;
};

const char* receipt_status_to_string(ReceiptStatus status);
std::optional<ReceiptStatus> receipt_status_from_string(const std::string& str);

std::vector<std::uint8_t> encode_receipt(const Receipt& receipt);

// Returns nullopt and sets ec to kMalformedReceipt for anything that is not a
// well-formed receipt.
std::optional<Receipt> decode_receipt(std::span<const std::uint8_t> data, std::error_code& ec);

// Receipts and parcels may share one characteristic. Parcel ids are A-Z, so a
// leading '{' marks a receipt.
bool looks_like_receipt(std::span<const std::uint8_t> data);

// Indices the sender must retransmit: the listed ones below total_parcels for
// kMissing, every index for kChecksumFailed, none for kComplete.
std::vector<std::uint16_t> resend_indices(const Receipt& receipt, std::uint16_t total_parcels);

}  // namespace parcelink::parcel
