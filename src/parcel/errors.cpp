#include "parcel/errors.h"

#include <string>

namespace parcelink::parcel {

namespace {

class ParcelCategory final : public std::error_category {
 public:
  const char* name() const noexcept override { return "parcel"; }

  std::string message(int value) const override {
    switch (static_cast<ParcelError>(value)) {
      case ParcelError::kTruncated: return "parcel shorter than its framing overhead";
      case ParcelError::kInvalidMessageId: return "invalid message id";
      case ParcelError::kReservedIndex: return "data parcel uses reserved index 0";
      case ParcelError::kUnsupportedCompression: return "unsupported compression algorithm";
      case ParcelError::kCorruptStream: return "corrupt compressed stream";
      case ParcelError::kChecksumMismatch: return "checksum mismatch";
      case ParcelError::kCapacityExceeded: return "payload exceeds parcel capacity";
      case ParcelError::kIndexOutOfRange: return "parcel index out of range";
      case ParcelError::kUnknownMessage: return "no assembly state for message";
      case ParcelError::kMalformedReceipt: return "malformed receipt";
    }
    return "unknown parcel error";
  }
};

}  // namespace

const std::error_category& parcel_category() noexcept {
  static const ParcelCategory category;
  return category;
}

std::error_code make_error_code(ParcelError e) noexcept {
  return {static_cast<int>(e), parcel_category()};
}

}  // namespace parcelink::parcel
