#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace parcelink::parcel {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

// Wire constants. A parcel never exceeds kMaxParcelSize bytes on the link.
inline constexpr std::size_t kMaxParcelSize = 280;
inline constexpr std::size_t kMessageIdSize = 2;
inline constexpr std::size_t kHeaderOverhead = kMessageIdSize + 2 + 4 + 1;  // 9 bytes
inline constexpr std::size_t kDataOverhead = kMessageIdSize + 2;            // 4 bytes
inline constexpr std::size_t kHeaderCapacity = kMaxParcelSize - kHeaderOverhead;  // 271
inline constexpr std::size_t kDataCapacity = kMaxParcelSize - kDataOverhead;      // 276

// Largest message the 16-bit total-parcels field can describe.
inline constexpr std::size_t kMaxTotalParcels = 0xFFFF;
inline constexpr std::size_t kMaxTransmittedBytes =
    kHeaderCapacity + (kMaxTotalParcels - 1) * kDataCapacity;

// Low nibble of the header flags byte.
enum class CompressionAlgorithm : std::uint8_t { kNone = 0x00, kDeflate = 0x01 };

inline constexpr std::uint8_t kCompressionMask = 0x0F;

enum class ParcelKind : std::uint8_t { kHeader, kData };

struct Parcel {
  ParcelKind kind{ParcelKind::kData};
  std::string message_id;
  // 0 for the header, 1..total_parcels-1 for data parcels.
  std::uint16_t index{0};
  // Header only.
  std::uint16_t total_parcels{0};
  std::uint32_t integrity_code{0};
  std::uint8_t flags{0};
  std::vector<std::uint8_t> payload;

  [[nodiscard]] bool is_header() const { return kind == ParcelKind::kHeader; }

  [[nodiscard]] std::uint8_t compression_id() const { return flags & kCompressionMask; }

  [[nodiscard]] bool is_compressed() const {
    return compression_id() != static_cast<std::uint8_t>(CompressionAlgorithm::kNone);
  }
};

// Two printable ASCII characters (0x20..0x7E).
bool is_valid_message_id(std::string_view id);

// Random id of two characters from A-Z.
std::string generate_message_id();

// True when the low nibble names an algorithm this build can decode.
bool is_known_compression(std::uint8_t compression_id);

std::size_t capacity_of(ParcelKind kind);

}  // namespace parcelink::parcel
