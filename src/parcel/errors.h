#pragma once

#include <string>
#include <system_error>
#include <type_traits>

namespace parcelink::parcel {

enum class ParcelError {
  kTruncated = 1,           // Buffer shorter than the parcel kind's framing overhead.
  kInvalidMessageId,        // Message id is not two printable ASCII characters.
  kReservedIndex,           // Data parcel carries index 0.
  kUnsupportedCompression,  // Compression id outside the known set.
  kCorruptStream,           // Compressed stream failed to inflate.
  kChecksumMismatch,
  kCapacityExceeded,
  kIndexOutOfRange,         // Data parcel index >= declared total.
  kUnknownMessage,          // Data parcel for a message with no assembly state.
  kMalformedReceipt,
};

const std::error_category& parcel_category() noexcept;

std::error_code make_error_code(ParcelError e) noexcept;

}  // namespace parcelink::parcel

namespace std {
template <>
struct is_error_code_enum<parcelink::parcel::ParcelError> : true_type {};
}  // namespace std
