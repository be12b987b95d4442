#include "parcel/outgoing_message.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "common/logging/logger.h"
#include "parcel/checksum.h"
#include "parcel/parcel_codec.h"

namespace parcelink::parcel {

std::size_t total_parcels_for(std::size_t transmitted_bytes) {
  if (transmitted_bytes <= kHeaderCapacity) {
    return 1;
  }
  const std::size_t rest = transmitted_bytes - kHeaderCapacity;
  return 1 + (rest + kDataCapacity - 1) / kDataCapacity;
}

TransmitPlan plan_transmission(const OutgoingMessage& message,
                               std::size_t compression_threshold) {
  // The receiver refuses to inflate past this, so a larger payload could never arrive.
  if (message.payload.size() > kMaxDecompressedSize) {
    throw std::length_error("message of " + std::to_string(message.payload.size()) +
                            " bytes exceeds the " + std::to_string(kMaxDecompressedSize) +
                            " byte limit");
  }

  TransmitPlan plan;
  plan.flags = static_cast<std::uint8_t>(CompressionAlgorithm::kNone);

  bool compressed = false;
  if (message.peer_supports_compression && should_compress(message.payload, compression_threshold)) {
    auto deflated = compress(message.payload, CompressionAlgorithm::kDeflate);
    if (deflated.size() < message.payload.size()) {
      LOG_DEBUG("Message {} compressed {} -> {} bytes", message.message_id,
                message.payload.size(), deflated.size());
      plan.data = std::move(deflated);
      plan.flags = static_cast<std::uint8_t>(CompressionAlgorithm::kDeflate);
      compressed = true;
    }
  }
  if (!compressed) {
    plan.data = message.payload;
  }

  const auto total = total_parcels_for(plan.data.size());
  if (total > kMaxTotalParcels) {
    throw std::length_error("message of " + std::to_string(plan.data.size()) +
                            " bytes needs more than " + std::to_string(kMaxTotalParcels) +
                            " parcels");
  }
  plan.total_parcels = static_cast<std::uint16_t>(total);
  plan.integrity_code = checksum(plan.data);
  return plan;
}

std::vector<Parcel> slice_plan(const std::string& message_id, const TransmitPlan& plan) {
  std::vector<Parcel> parcels;
  parcels.reserve(plan.total_parcels);

  const auto begin = plan.data.begin();
  const std::size_t header_len = std::min(plan.data.size(), kHeaderCapacity);
  parcels.push_back(make_header_parcel(
      message_id, plan.total_parcels, plan.integrity_code, plan.flags,
      std::vector<std::uint8_t>(begin, begin + static_cast<std::ptrdiff_t>(header_len))));

  std::size_t offset = header_len;
  std::uint16_t index = 1;
  while (offset < plan.data.size()) {
    const std::size_t len = std::min(plan.data.size() - offset, kDataCapacity);
    const auto first = begin + static_cast<std::ptrdiff_t>(offset);
    parcels.push_back(make_data_parcel(
        message_id, index, std::vector<std::uint8_t>(first, first + static_cast<std::ptrdiff_t>(len))));
    offset += len;
    ++index;
  }
  return parcels;
}

std::vector<Parcel> split_message(const OutgoingMessage& message,
                                  std::size_t compression_threshold) {
  if (!is_valid_message_id(message.message_id)) {
    throw std::invalid_argument("message id must be two printable ASCII characters");
  }
  const auto plan = plan_transmission(message, compression_threshold);
  auto parcels = slice_plan(message.message_id, plan);
  LOG_DEBUG("Split message {} for {}: {} bytes in {} parcels (flags={:#04x})",
            message.message_id, message.target_peer_id, plan.data.size(), parcels.size(),
            plan.flags);
  return parcels;
}

}  // namespace parcelink::parcel
