#include "parcel/parcel_codec.h"

#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "parcel/errors.h"

namespace {

void write_u16(std::vector<std::uint8_t>& out, std::uint16_t value) {
  out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
  out.push_back(static_cast<std::uint8_t>(value & 0xFF));
}

void write_u32(std::vector<std::uint8_t>& out, std::uint32_t value) {
  out.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFF));
  out.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFF));
  out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
  out.push_back(static_cast<std::uint8_t>(value & 0xFF));
}

std::uint16_t read_u16(std::span<const std::uint8_t> data, std::size_t offset) {
  return static_cast<std::uint16_t>((data[offset] << 8) | data[offset + 1]);
}

std::uint32_t read_u32(std::span<const std::uint8_t> data, std::size_t offset) {
  return (static_cast<std::uint32_t>(data[offset]) << 24) |
         (static_cast<std::uint32_t>(data[offset + 1]) << 16) |
         (static_cast<std::uint32_t>(data[offset + 2]) << 8) |
         static_cast<std::uint32_t>(data[offset + 3]);
}

void check_capacity(parcelink::parcel::ParcelKind kind, std::size_t payload_size) {
  const auto capacity = parcelink::parcel::capacity_of(kind);
  if (payload_size > capacity) {
    throw std::length_error(
        (kind == parcelink::parcel::ParcelKind::kHeader ? "header" : "data") +
        std::string(" parcel payload too large: ") + std::to_string(payload_size) + " > " +
        std::to_string(capacity));
  }
}

}  // namespace

namespace parcelink::parcel {

std::vector<std::uint8_t> ParcelCodec::encode(const Parcel& parcel) {
  if (!is_valid_message_id(parcel.message_id)) {
    throw std::invalid_argument("message id must be two printable ASCII characters");
  }
  check_capacity(parcel.kind, parcel.payload.size());

  std::vector<std::uint8_t> out;
  out.reserve(encoded_size(parcel));
  out.push_back(static_cast<std::uint8_t>(parcel.message_id[0]));
  out.push_back(static_cast<std::uint8_t>(parcel.message_id[1]));

  switch (parcel.kind) {
    case ParcelKind::kHeader: {
      write_u16(out, parcel.total_parcels);
      write_u32(out, parcel.integrity_code);
      out.push_back(parcel.flags);
      break;
    }
    case ParcelKind::kData: {
      if (parcel.index == 0) {
        throw std::invalid_argument("data parcel index 0 is reserved for the header");
      }
      write_u16(out, parcel.index);
      break;
    }
  }

  out.insert(out.end(), parcel.payload.begin(), parcel.payload.end());
  return out;
}

std::optional<Parcel> ParcelCodec::decode(std::span<const std::uint8_t> data, ParcelKind kind,
                                          std::error_code& ec) {
  const std::size_t overhead = kind == ParcelKind::kHeader ? kHeaderOverhead : kDataOverhead;
  if (data.size() < overhead) {
    ec = ParcelError::kTruncated;
    return std::nullopt;
  }

  Parcel parcel{};
  parcel.kind = kind;
  parcel.message_id.assign(reinterpret_cast<const char*>(data.data()), kMessageIdSize);
  if (!is_valid_message_id(parcel.message_id)) {
    ec = ParcelError::kInvalidMessageId;
    return std::nullopt;
  }

  switch (kind) {
    case ParcelKind::kHeader: {
      parcel.index = 0;
      parcel.total_parcels = read_u16(data, 2);
      parcel.integrity_code = read_u32(data, 4);
      parcel.flags = data[8];
      if (parcel.total_parcels == 0) {
        ec = ParcelError::kIndexOutOfRange;
        return std::nullopt;
      }
      if (!is_known_compression(parcel.compression_id())) {
        ec = ParcelError::kUnsupportedCompression;
        return std::nullopt;
      }
      break;
    }
    case ParcelKind::kData: {
      parcel.index = read_u16(data, 2);
      if (parcel.index == 0) {
        ec = ParcelError::kReservedIndex;
        return std::nullopt;
      }
      break;
    }
  }

  if (data.size() - overhead > capacity_of(kind)) {
    ec = ParcelError::kCapacityExceeded;
    return std::nullopt;
  }
  parcel.payload.assign(data.begin() + static_cast<std::ptrdiff_t>(overhead), data.end());
  return parcel;
}

std::optional<Parcel> ParcelCodec::decode(std::span<const std::uint8_t> data, ParcelKind kind) {
  std::error_code ec;
  return decode(data, kind, ec);
}

std::size_t ParcelCodec::encoded_size(const Parcel& parcel) {
  const std::size_t overhead =
      parcel.kind == ParcelKind::kHeader ? kHeaderOverhead : kDataOverhead;
  return overhead + parcel.payload.size();
}

std::optional<std::string> ParcelCodec::peek_message_id(std::span<const std::uint8_t> data) {
  if (data.size() < kMessageIdSize) {
    return std::nullopt;
  }
  std::string id(reinterpret_cast<const char*>(data.data()), kMessageIdSize);
  if (!is_valid_message_id(id)) {
    return std::nullopt;
  }
  return id;
}

Parcel make_header_parcel(std::string message_id, std::uint16_t total_parcels,
                          std::uint32_t integrity_code, std::uint8_t flags,
                          std::vector<std::uint8_t> payload) {
  check_capacity(ParcelKind::kHeader, payload.size());
  Parcel parcel{};
  parcel.kind = ParcelKind::kHeader;
  parcel.message_id = std::move(message_id);
  parcel.index = 0;
  parcel.total_parcels = total_parcels;
  parcel.integrity_code = integrity_code;
  parcel.flags = flags;
  parcel.payload = std::move(payload);
  return parcel;
}

Parcel make_data_parcel(std::string message_id, std::uint16_t index,
                        std::vector<std::uint8_t> payload) {
  if (index == 0) {
    throw std::invalid_argument("data parcel index must be >= 1");
  }
  check_capacity(ParcelKind::kData, payload.size());
  Parcel parcel{};
  parcel.kind = ParcelKind::kData;
  parcel.message_id = std::move(message_id);
  parcel.index = index;
  parcel.payload = std::move(payload);
  return parcel;
}

}  // namespace parcelink::parcel
