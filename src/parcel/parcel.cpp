#include "parcel/parcel.h"

#include <string>
#include <string_view>

#include "common/crypto/random.h"

namespace parcelink::parcel {

namespace {
constexpr std::string_view kIdAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
}  // namespace

bool is_valid_message_id(std::string_view id) {
  if (id.size() != kMessageIdSize) {
    return false;
  }
  for (const char c : id) {
    const auto byte = static_cast<unsigned char>(c);
    if (byte < 0x20 || byte > 0x7E) {
      return false;
    }
  }
  return true;
}

std::string generate_message_id() {
  std::string id;
  id.reserve(kMessageIdSize);
  for (std::size_t i = 0; i < kMessageIdSize; ++i) {
    id.push_back(kIdAlphabet[crypto::random_uniform(static_cast<std::uint32_t>(kIdAlphabet.size()))]);
  }
  return id;
}

bool is_known_compression(std::uint8_t compression_id) {
  return compression_id == static_cast<std::uint8_t>(CompressionAlgorithm::kNone) ||
         compression_id == static_cast<std::uint8_t>(CompressionAlgorithm::kDeflate);
}

std::size_t capacity_of(ParcelKind kind) {
  return kind == ParcelKind::kHeader ? kHeaderCapacity : kDataCapacity;
}

}  // namespace parcelink::parcel
