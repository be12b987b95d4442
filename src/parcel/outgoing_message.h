#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "parcel/compression.h"
#include "parcel/parcel.h"

namespace parcelink::parcel {

// A send request. The payload is the uncompressed application data.
struct OutgoingMessage {
  std::string message_id;
  std::vector<std::uint8_t> payload;
  std::string target_peer_id;
  TimePoint enqueued_at{};
  // Bumped each time parcels are resent for this message.
  std::uint32_t retry_count{0};
  // Capability discovered by the transport; never negotiated here.
  bool peer_supports_compression{false};
};

// Bytes that travel on the wire for one message, before slicing.
struct TransmitPlan {
  std::vector<std::uint8_t> data;
  std::uint8_t flags{0};
  std::uint32_t integrity_code{0};
  std::uint16_t total_parcels{1};
};

// Compression decision and checksum for a message. Deflate is kept only when it
// strictly shrinks the payload. Throws std::length_error when the payload exceeds
// kMaxDecompressedSize or the transmitted bytes would need more parcels than the
// 16-bit count allows.
TransmitPlan plan_transmission(const OutgoingMessage& message,
                               std::size_t compression_threshold = kDefaultCompressionThreshold);

// Parcels needed to carry `transmitted_bytes`: 1 + ceil(rest / data capacity).
std::size_t total_parcels_for(std::size_t transmitted_bytes);

// Splits a message into its header parcel followed by data parcels 1..N-1 in order.
std::vector<Parcel> split_message(const OutgoingMessage& message,
                                  std::size_t compression_threshold = kDefaultCompressionThreshold);

// Header chunk up to kHeaderCapacity, then data chunks up to kDataCapacity.
std::vector<Parcel> slice_plan(const std::string& message_id, const TransmitPlan& plan);

}  // namespace parcelink::parcel
