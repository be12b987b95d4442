#include "parcel/compression.h"

#include <zlib.h>

#include <array>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <stdexcept>
#include <vector>

#include "common/logging/logger.h"
#include "parcel/errors.h"

namespace {

// Releases the inflate state on every exit path.
struct InflateStream {
  z_stream stream{};
  bool initialized{false};

  ~InflateStream() {
    if (initialized) {
      inflateEnd(&stream);
    }
  }
};

std::vector<std::uint8_t> deflate_buffer(std::span<const std::uint8_t> data) {
  uLongf out_len = compressBound(static_cast<uLong>(data.size()));
  std::vector<std::uint8_t> out(out_len);
  const int ret = compress2(out.data(), &out_len, data.data(), static_cast<uLong>(data.size()),
                            Z_DEFAULT_COMPRESSION);
  if (ret != Z_OK) {
    LOG_WARN("deflate failed (zlib error {}), sending uncompressed", ret);
    return {data.begin(), data.end()};
  }
  out.resize(out_len);
  return out;
}

}  // namespace

namespace parcelink::parcel {

std::vector<std::uint8_t> compress(std::span<const std::uint8_t> data,
                                   CompressionAlgorithm algorithm) {
  switch (algorithm) {
    case CompressionAlgorithm::kNone:
      return {data.begin(), data.end()};
    case CompressionAlgorithm::kDeflate: {
      auto compressed = deflate_buffer(data);
      if (compressed.size() < data.size()) {
        return compressed;
      }
      return {data.begin(), data.end()};
    }
  }
  throw std::invalid_argument("unsupported compression algorithm");
}

std::optional<std::vector<std::uint8_t>> decompress(std::span<const std::uint8_t> data,
                                                    std::uint8_t compression_id,
                                                    std::error_code& ec,
                                                    std::size_t max_output) {
  if (compression_id == static_cast<std::uint8_t>(CompressionAlgorithm::kNone)) {
    return std::vector<std::uint8_t>(data.begin(), data.end());
  }
  if (compression_id != static_cast<std::uint8_t>(CompressionAlgorithm::kDeflate)) {
    ec = ParcelError::kUnsupportedCompression;
    return std::nullopt;
  }
  if (data.size() > std::numeric_limits<uInt>::max()) {
    ec = ParcelError::kCorruptStream;
    return std::nullopt;
  }

  InflateStream inflater;
  if (inflateInit(&inflater.stream) != Z_OK) {
    ec = ParcelError::kCorruptStream;
    return std::nullopt;
  }
  inflater.initialized = true;
  inflater.stream.next_in = const_cast<Bytef*>(data.data());
  inflater.stream.avail_in = static_cast<uInt>(data.size());

  std::vector<std::uint8_t> out;
  std::array<std::uint8_t, 16384> chunk{};
  int ret = Z_OK;
  while (ret != Z_STREAM_END) {
    inflater.stream.next_out = chunk.data();
    inflater.stream.avail_out = static_cast<uInt>(chunk.size());
    ret = inflate(&inflater.stream, Z_NO_FLUSH);
    if (ret != Z_OK && ret != Z_STREAM_END) {
      // Z_BUF_ERROR here means the input ended before the stream did.
      LOG_DEBUG("inflate failed: zlib error {}", ret);
      ec = ParcelError::kCorruptStream;
      return std::nullopt;
    }
    const std::size_t produced = chunk.size() - inflater.stream.avail_out;
    if (out.size() + produced > max_output) {
      LOG_WARN("inflated payload exceeds {} bytes, rejecting", max_output);
      ec = ParcelError::kCorruptStream;
      return std::nullopt;
    }
    out.insert(out.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(produced));
  }

  if (inflater.stream.avail_in != 0) {
    // Trailing bytes after the end of the zlib stream.
    ec = ParcelError::kCorruptStream;
    return std::nullopt;
  }
  return out;
}

bool should_compress(std::span<const std::uint8_t> data, std::size_t threshold) {
  if (data.size() < threshold) {
    return false;
  }
  return !looks_like_compressed(data);
}

bool looks_like_compressed(std::span<const std::uint8_t> data) {
  if (data.size() < 4) {
    return false;
  }
  // PNG
  if (data[0] == 0x89 && data[1] == 0x50 && data[2] == 0x4E && data[3] == 0x47) {
    return true;
  }
  // JPEG
  if (data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF) {
    return true;
  }
  // GZIP
  if (data[0] == 0x1F && data[1] == 0x8B) {
    return true;
  }
  // ZLIB, common compression levels.
  if (data[0] == 0x78 &&
      (data[1] == 0x01 || data[1] == 0x5E || data[1] == 0x9C || data[1] == 0xDA)) {
    return true;
  }
  // ZIP local file header
  if (data[0] == 0x50 && data[1] == 0x4B && data[2] == 0x03 && data[3] == 0x04) {
    return true;
  }
  return false;
}

}  // namespace parcelink::parcel
