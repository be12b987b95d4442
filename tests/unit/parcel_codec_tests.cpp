#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <system_error>
#include <vector>

#include "parcel/errors.h"
#include "parcel/parcel_codec.h"

namespace parcelink::tests {

TEST(ParcelCodecTests, HeaderWireLayout) {
  auto parcel = parcel::make_header_parcel("AB", 0x0102, 0xDEADBEEF, 0x01, {0xAA, 0xBB});
  auto encoded = parcel::ParcelCodec::encode(parcel);
  const std::vector<std::uint8_t> expected{'A', 'B', 0x01, 0x02, 0xDE, 0xAD,
                                           0xBE, 0xEF, 0x01, 0xAA, 0xBB};
  EXPECT_EQ(encoded, expected);
}

TEST(ParcelCodecTests, DataWireLayout) {
  auto parcel = parcel::make_data_parcel("QZ", 0x0203, {0x10, 0x20, 0x30});
  auto encoded = parcel::ParcelCodec::encode(parcel);
  const std::vector<std::uint8_t> expected{'Q', 'Z', 0x02, 0x03, 0x10, 0x20, 0x30};
  EXPECT_EQ(encoded, expected);
}

TEST(ParcelCodecTests, HeaderRoundTrip) {
  std::vector<std::uint8_t> payload(parcel::kHeaderCapacity, 0x5A);
  auto parcel = parcel::make_header_parcel("XY", 4, 0x12345678, 0x00, payload);
  auto encoded = parcel::ParcelCodec::encode(parcel);
  EXPECT_EQ(encoded.size(), parcel::kMaxParcelSize);

  std::error_code ec;
  auto decoded = parcel::ParcelCodec::decode(encoded, parcel::ParcelKind::kHeader, ec);
  ASSERT_TRUE(decoded.has_value()) << ec.message();
  EXPECT_TRUE(decoded->is_header());
  EXPECT_EQ(decoded->message_id, "XY");
  EXPECT_EQ(decoded->index, 0U);
  EXPECT_EQ(decoded->total_parcels, 4U);
  EXPECT_EQ(decoded->integrity_code, 0x12345678U);
  EXPECT_FALSE(decoded->is_compressed());
  EXPECT_EQ(decoded->payload, payload);
}

TEST(ParcelCodecTests, DataRoundTripAtCapacity) {
  std::vector<std::uint8_t> payload(parcel::kDataCapacity, 0x33);
  auto parcel = parcel::make_data_parcel("XY", 3, payload);
  auto encoded = parcel::ParcelCodec::encode(parcel);
  EXPECT_EQ(encoded.size(), parcel::kMaxParcelSize);

  auto decoded = parcel::ParcelCodec::decode(encoded, parcel::ParcelKind::kData);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_FALSE(decoded->is_header());
  EXPECT_EQ(decoded->index, 3U);
  EXPECT_EQ(decoded->payload, payload);
}

TEST(ParcelCodecTests, CapacityConstants) {
  EXPECT_EQ(parcel::kHeaderCapacity, 271U);
  EXPECT_EQ(parcel::kDataCapacity, 276U);
}

TEST(ParcelCodecTests, EncodeRejectsOversizedPayload) {
  std::vector<std::uint8_t> header_payload(parcel::kHeaderCapacity + 1, 0);
  EXPECT_THROW(parcel::make_header_parcel("AB", 1, 0, 0, header_payload), std::length_error);

  std::vector<std::uint8_t> data_payload(parcel::kDataCapacity + 1, 0);
  EXPECT_THROW(parcel::make_data_parcel("AB", 1, data_payload), std::length_error);

  parcel::Parcel raw;
  raw.kind = parcel::ParcelKind::kData;
  raw.message_id = "AB";
  raw.index = 1;
  raw.payload = data_payload;
  EXPECT_THROW(parcel::ParcelCodec::encode(raw), std::length_error);
}

TEST(ParcelCodecTests, EncodeRejectsReservedDataIndex) {
  EXPECT_THROW(parcel::make_data_parcel("AB", 0, {}), std::invalid_argument);

  parcel::Parcel raw;
  raw.kind = parcel::ParcelKind::kData;
  raw.message_id = "AB";
  raw.index = 0;
  EXPECT_THROW(parcel::ParcelCodec::encode(raw), std::invalid_argument);
}

TEST(ParcelCodecTests, EncodeRejectsInvalidMessageId) {
  auto parcel = parcel::make_data_parcel("ABC", 1, {});
  EXPECT_THROW(parcel::ParcelCodec::encode(parcel), std::invalid_argument);
}

TEST(ParcelCodecTests, DecodeTruncatedBuffer) {
  const std::vector<std::uint8_t> short_header{'A', 'B', 0x00, 0x01, 0x00, 0x00, 0x00, 0x00};
  std::error_code ec;
  EXPECT_FALSE(parcel::ParcelCodec::decode(short_header, parcel::ParcelKind::kHeader, ec));
  EXPECT_EQ(ec, parcel::ParcelError::kTruncated);

  const std::vector<std::uint8_t> short_data{'A', 'B', 0x00};
  ec.clear();
  EXPECT_FALSE(parcel::ParcelCodec::decode(short_data, parcel::ParcelKind::kData, ec));
  EXPECT_EQ(ec, parcel::ParcelError::kTruncated);
}

TEST(ParcelCodecTests, DecodeEmptyPayloadParcels) {
  const std::vector<std::uint8_t> header{'A', 'B', 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00};
  auto decoded_header = parcel::ParcelCodec::decode(header, parcel::ParcelKind::kHeader);
  ASSERT_TRUE(decoded_header.has_value());
  EXPECT_TRUE(decoded_header->payload.empty());

  const std::vector<std::uint8_t> data{'A', 'B', 0x00, 0x01};
  auto decoded_data = parcel::ParcelCodec::decode(data, parcel::ParcelKind::kData);
  ASSERT_TRUE(decoded_data.has_value());
  EXPECT_TRUE(decoded_data->payload.empty());
}

TEST(ParcelCodecTests, DecodeRejectsReservedDataIndex) {
  const std::vector<std::uint8_t> data{'A', 'B', 0x00, 0x00, 0x42};
  std::error_code ec;
  EXPECT_FALSE(parcel::ParcelCodec::decode(data, parcel::ParcelKind::kData, ec));
  EXPECT_EQ(ec, parcel::ParcelError::kReservedIndex);
}

TEST(ParcelCodecTests, DecodeRejectsNonPrintableMessageId) {
  const std::vector<std::uint8_t> data{0x01, 'B', 0x00, 0x01, 0x42};
  std::error_code ec;
  EXPECT_FALSE(parcel::ParcelCodec::decode(data, parcel::ParcelKind::kData, ec));
  EXPECT_EQ(ec, parcel::ParcelError::kInvalidMessageId);
}

TEST(ParcelCodecTests, DecodeRejectsReservedCompressionId) {
  const std::vector<std::uint8_t> header{'A', 'B', 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x02};
  std::error_code ec;
  EXPECT_FALSE(parcel::ParcelCodec::decode(header, parcel::ParcelKind::kHeader, ec));
  EXPECT_EQ(ec, parcel::ParcelError::kUnsupportedCompression);
}

TEST(ParcelCodecTests, DecodeIgnoresReservedHighFlagBits) {
  const std::vector<std::uint8_t> header{'A', 'B', 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0xF1};
  auto decoded = parcel::ParcelCodec::decode(header, parcel::ParcelKind::kHeader);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->compression_id(), 0x01);
  EXPECT_TRUE(decoded->is_compressed());
}

TEST(ParcelCodecTests, DecodeRejectsZeroTotal) {
  const std::vector<std::uint8_t> header{'A', 'B', 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
  std::error_code ec;
  EXPECT_FALSE(parcel::ParcelCodec::decode(header, parcel::ParcelKind::kHeader, ec));
  EXPECT_EQ(ec, parcel::ParcelError::kIndexOutOfRange);
}

TEST(ParcelCodecTests, DecodeRejectsOversizedBuffer) {
  std::vector<std::uint8_t> data{'A', 'B', 0x00, 0x01};
  data.resize(parcel::kMaxParcelSize + 1, 0x00);
  std::error_code ec;
  EXPECT_FALSE(parcel::ParcelCodec::decode(data, parcel::ParcelKind::kData, ec));
  EXPECT_EQ(ec, parcel::ParcelError::kCapacityExceeded);
}

TEST(ParcelCodecTests, PeekMessageId) {
  const std::vector<std::uint8_t> data{'K', 'M', 0x00, 0x01};
  EXPECT_EQ(parcel::ParcelCodec::peek_message_id(data), "KM");
  const std::vector<std::uint8_t> too_short{'K'};
  EXPECT_FALSE(parcel::ParcelCodec::peek_message_id(too_short).has_value());
}

TEST(ParcelCodecTests, GeneratedIdsAreUppercaseLetters) {
  for (int i = 0; i < 200; ++i) {
    const auto id = parcel::generate_message_id();
    ASSERT_EQ(id.size(), 2U);
    for (const char c : id) {
      EXPECT_GE(c, 'A');
      EXPECT_LE(c, 'Z');
    }
    EXPECT_TRUE(parcel::is_valid_message_id(id));
  }
}

}  // namespace parcelink::tests
