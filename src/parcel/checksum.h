#pragma once

#include <cstdint>
#include <span>

namespace parcelink::parcel {

// CRC-32 (IEEE 802.3, reflected polynomial 0xEDB88320) over the whole buffer.
std::uint32_t checksum(std::span<const std::uint8_t> data);

}  // namespace parcelink::parcel
