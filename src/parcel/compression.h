#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <system_error>
#include <vector>

#include "parcel/parcel.h"

namespace parcelink::parcel {

// Payloads below this size are never worth compressing.
inline constexpr std::size_t kDefaultCompressionThreshold = 300;

// Upper bound on inflated output; protects the receiver from decompression bombs.
inline constexpr std::size_t kMaxDecompressedSize = std::size_t{64} << 20;

// kNone is the identity. kDeflate returns a zlib stream only when it is strictly
// smaller than the input, otherwise the input unchanged; callers detect the
// fallback by comparing lengths.
// Throws std::invalid_argument for an algorithm id outside CompressionAlgorithm.
std::vector<std::uint8_t> compress(std::span<const std::uint8_t> data,
                                   CompressionAlgorithm algorithm);

// Reverses compress(). Returns nullopt and sets ec to kUnsupportedCompression for an
// unknown id, or kCorruptStream when the stream does not inflate cleanly.
std::optional<std::vector<std::uint8_t>> decompress(std::span<const std::uint8_t> data,
                                                    std::uint8_t compression_id,
                                                    std::error_code& ec,
                                                    std::size_t max_output = kMaxDecompressedSize);

// False for small payloads and for data that already carries a compressed or
// binary container signature (PNG, JPEG, GZIP, ZLIB, ZIP).
bool should_compress(std::span<const std::uint8_t> data,
                     std::size_t threshold = kDefaultCompressionThreshold);

bool looks_like_compressed(std::span<const std::uint8_t> data);

}  // namespace parcelink::parcel
