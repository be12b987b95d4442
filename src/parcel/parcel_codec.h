#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <vector>

#include "parcel/parcel.h"

namespace parcelink::parcel {

// Serializes and parses parcels for the BLE link.
// Wire format (all integers big-endian):
//   Header parcel:
//     [message_id: 2 bytes ASCII]
//     [total_parcels: 2 bytes]
//     [integrity_code: 4 bytes]
//     [flags: 1 byte, low nibble = compression id]
//     [payload: 0..271 bytes]
//   Data parcel:
//     [message_id: 2 bytes ASCII]
//     [index: 2 bytes, >= 1]
//     [payload: 0..276 bytes]
// The two layouts share offsets, so the kind cannot be recovered from the bytes;
// decode() always takes it from the caller.
class ParcelCodec {
 public:
  // Serialize a parcel. Throws std::length_error when the payload exceeds the
  // kind's capacity and std::invalid_argument for a malformed id or a data
  // parcel with index 0.
  static std::vector<std::uint8_t> encode(const Parcel& parcel);

  // Parse bytes as the given kind. Returns nullopt and sets ec on malformed input.
  static std::optional<Parcel> decode(std::span<const std::uint8_t> data, ParcelKind kind,
                                      std::error_code& ec);

  static std::optional<Parcel> decode(std::span<const std::uint8_t> data, ParcelKind kind);

  static std::size_t encoded_size(const Parcel& parcel);

  // Reads only the id field; used to route a buffer before its kind is known.
  static std::optional<std::string> peek_message_id(std::span<const std::uint8_t> data);
};

Parcel make_header_parcel(std::string message_id, std::uint16_t total_parcels,
                          std::uint32_t integrity_code, std::uint8_t flags,
                          std::vector<std::uint8_t> payload);

Parcel make_data_parcel(std::string message_id, std::uint16_t index,
                        std::vector<std::uint8_t> payload);

}  // namespace parcelink::parcel
