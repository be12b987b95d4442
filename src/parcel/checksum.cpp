#include "parcel/checksum.h"

#include <zlib.h>

#include <algorithm>
#include <cstdint>
#include <span>

namespace parcelink::parcel {

std::uint32_t checksum(std::span<const std::uint8_t> data) {
  uLong crc = crc32(0L, Z_NULL, 0);
  // crc32() takes a uInt length, so feed very large buffers in slices.
  constexpr std::size_t kSlice = 1U << 30;
  std::size_t offset = 0;
  while (offset < data.size()) {
    const std::size_t len = std::min(kSlice, data.size() - offset);
    crc = crc32(crc, data.data() + offset, static_cast<uInt>(len));
    offset += len;
  }
  return static_cast<std::uint32_t>(crc);
}

}  // namespace parcelink::parcel
