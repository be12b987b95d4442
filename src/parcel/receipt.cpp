#include "parcel/receipt.h"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "parcel/errors.h"
#include "parcel/parcel.h"

using json = nlohmann::json;

namespace parcelink::parcel {

Receipt Receipt::complete(std::string message_id) {
  return Receipt{std::move(message_id), ReceiptStatus::kComplete, {}};
}

Receipt Receipt::missing(std::string message_id, std::vector<std::uint16_t> indices) {
  return Receipt{std::move(message_id), ReceiptStatus::kMissing, std::move(indices)};
}

Receipt Receipt::checksum_failed(std::string message_id) {
  return Receipt{std::move(message_id), ReceiptStatus::kChecksumFailed, {}};
}

const char* receipt_status_to_string(ReceiptStatus status) {
  switch (status) {
    case ReceiptStatus::kComplete: return "complete";
    case ReceiptStatus::kMissing: return "missing";
    case ReceiptStatus::kChecksumFailed: return "checksumFailed";
  }
  return "unknown";
}

std::optional<ReceiptStatus> receipt_status_from_string(const std::string& str) {
  if (str == "complete") return ReceiptStatus::kComplete;
  if (str == "missing") return ReceiptStatus::kMissing;
  if (str == "checksumFailed") return ReceiptStatus::kChecksumFailed;
  return std::nullopt;
}

namespace {

json receipt_to_json(const Receipt& receipt) {
  json j{
    {"msg_id", receipt.message_id},
    {"status", receipt_status_to_string(receipt.status)}
  };
  if (receipt.status == ReceiptStatus::kMissing) {
    j["parcels"] = receipt.missing_indices;
  }
  return j;
}

}  // namespace

std::vector<std::uint8_t> encode_receipt(const Receipt& receipt) {
  const auto text = receipt_to_json(receipt).dump();
  return std::vector<std::uint8_t>(text.begin(), text.end());
}

std::optional<Receipt> decode_receipt(std::span<const std::uint8_t> data, std::error_code& ec) {
  try {
    const auto j = json::parse(data.begin(), data.end());
    if (!j.is_object()) {
      ec = ParcelError::kMalformedReceipt;
      return std::nullopt;
    }

    Receipt receipt;
    receipt.message_id = j.at("msg_id").get<std::string>();
    if (!is_valid_message_id(receipt.message_id)) {
      ec = ParcelError::kMalformedReceipt;
      return std::nullopt;
    }

    const auto status = receipt_status_from_string(j.at("status").get<std::string>());
    if (!status) {
      ec = ParcelError::kMalformedReceipt;
      return std::nullopt;
    }
    receipt.status = *status;

    if (receipt.status == ReceiptStatus::kMissing) {
      const auto& parcels = j.at("parcels");
      if (!parcels.is_array()) {
        ec = ParcelError::kMalformedReceipt;
        return std::nullopt;
      }
      for (const auto& item : parcels) {
        if (!item.is_number_integer()) {
          ec = ParcelError::kMalformedReceipt;
          return std::nullopt;
        }
        const auto value = item.get<std::int64_t>();
        if (value < 0 || value > std::numeric_limits<std::uint16_t>::max()) {
          ec = ParcelError::kMalformedReceipt;
          return std::nullopt;
        }
        receipt.missing_indices.push_back(static_cast<std::uint16_t>(value));
      }
    }
    return receipt;
  } catch (const json::exception&) {
    ec = ParcelError::kMalformedReceipt;
    return std::nullopt;
  }
}

bool looks_like_receipt(std::span<const std::uint8_t> data) {
  return !data.empty() && data.front() == '{';
}

std::vector<std::uint16_t> resend_indices(const Receipt& receipt, std::uint16_t total_parcels) {
  std::vector<std::uint16_t> indices;
  switch (receipt.status) {
    case ReceiptStatus::kComplete:
      break;
    case ReceiptStatus::kMissing:
      for (const auto index : receipt.missing_indices) {
        if (index < total_parcels) {
          indices.push_back(index);
        }
      }
      std::sort(indices.begin(), indices.end());
      indices.erase(std::unique(indices.begin(), indices.end()), indices.end());
      break;
    case ReceiptStatus::kChecksumFailed:
      indices.reserve(total_parcels);
      for (std::uint32_t i = 0; i < total_parcels; ++i) {
        indices.push_back(static_cast<std::uint16_t>(i));
      }
      break;
  }
  return indices;
}

}  // namespace parcelink::parcel
