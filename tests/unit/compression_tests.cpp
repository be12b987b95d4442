#include <gtest/gtest.h>

#include <cstdint>
#include <random>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include "parcel/compression.h"
#include "parcel/errors.h"

namespace parcelink::tests {

namespace {

std::vector<std::uint8_t> random_payload(std::size_t size, std::uint32_t seed) {
  std::mt19937 rng(seed);
  std::uniform_int_distribution<int> dist(0, 255);
  std::vector<std::uint8_t> out(size);
  for (auto& b : out) {
    b = static_cast<std::uint8_t>(dist(rng));
  }
  return out;
}

std::vector<std::uint8_t> text_payload(std::size_t size) {
  const std::string line = "{\"item\":\"widget\",\"qty\":12,\"location\":\"shelf-4\"}\n";
  std::vector<std::uint8_t> out;
  while (out.size() < size) {
    out.insert(out.end(), line.begin(), line.end());
  }
  out.resize(size);
  return out;
}

}  // namespace

TEST(CompressionTests, NoneIsIdentity) {
  const auto data = text_payload(1000);
  EXPECT_EQ(parcel::compress(data, parcel::CompressionAlgorithm::kNone), data);
}

TEST(CompressionTests, DeflateShrinksRepetitiveData) {
  const auto data = text_payload(4000);
  const auto compressed = parcel::compress(data, parcel::CompressionAlgorithm::kDeflate);
  EXPECT_LT(compressed.size(), data.size());

  std::error_code ec;
  auto restored = parcel::decompress(
      compressed, static_cast<std::uint8_t>(parcel::CompressionAlgorithm::kDeflate), ec);
  ASSERT_TRUE(restored.has_value()) << ec.message();
  EXPECT_EQ(*restored, data);
}

TEST(CompressionTests, DeflateReturnsInputWhenNotSmaller) {
  const auto data = random_payload(1000, 7);
  const auto result = parcel::compress(data, parcel::CompressionAlgorithm::kDeflate);
  EXPECT_EQ(result, data);
}

TEST(CompressionTests, DeflateOfEmptyInputIsEmpty) {
  std::vector<std::uint8_t> empty;
  EXPECT_TRUE(parcel::compress(empty, parcel::CompressionAlgorithm::kDeflate).empty());
}

TEST(CompressionTests, CompressRejectsUnknownAlgorithm) {
  const auto data = text_payload(500);
  EXPECT_THROW(parcel::compress(data, static_cast<parcel::CompressionAlgorithm>(0x07)),
               std::invalid_argument);
}

TEST(CompressionTests, DecompressUnknownIdFails) {
  const auto data = text_payload(100);
  std::error_code ec;
  auto result = parcel::decompress(data, 0x05, ec);
  EXPECT_FALSE(result.has_value());
  EXPECT_EQ(ec, parcel::ParcelError::kUnsupportedCompression);
}

TEST(CompressionTests, DecompressCorruptStreamFails) {
  // '{' is not a valid zlib header byte.
  const auto data = text_payload(300);
  std::error_code ec;
  auto result = parcel::decompress(data, 0x01, ec);
  EXPECT_FALSE(result.has_value());
  EXPECT_EQ(ec, parcel::ParcelError::kCorruptStream);
}

TEST(CompressionTests, DecompressTruncatedStreamFails) {
  auto compressed = parcel::compress(text_payload(4000), parcel::CompressionAlgorithm::kDeflate);
  compressed.resize(compressed.size() / 2);
  std::error_code ec;
  EXPECT_FALSE(parcel::decompress(compressed, 0x01, ec).has_value());
  EXPECT_EQ(ec, parcel::ParcelError::kCorruptStream);
}

TEST(CompressionTests, DecompressTrailingBytesFails) {
  auto compressed = parcel::compress(text_payload(4000), parcel::CompressionAlgorithm::kDeflate);
  compressed.push_back(0x00);
  std::error_code ec;
  EXPECT_FALSE(parcel::decompress(compressed, 0x01, ec).has_value());
  EXPECT_EQ(ec, parcel::ParcelError::kCorruptStream);
}

TEST(CompressionTests, DecompressEnforcesOutputLimit) {
  const auto data = text_payload(64 * 1024);
  const auto compressed = parcel::compress(data, parcel::CompressionAlgorithm::kDeflate);
  std::error_code ec;
  EXPECT_FALSE(parcel::decompress(compressed, 0x01, ec, 1024).has_value());
  EXPECT_EQ(ec, parcel::ParcelError::kCorruptStream);
}

TEST(CompressionTests, ShouldCompressRespectsThreshold) {
  EXPECT_FALSE(parcel::should_compress(text_payload(299)));
  EXPECT_TRUE(parcel::should_compress(text_payload(300)));
  EXPECT_TRUE(parcel::should_compress(text_payload(50), 10));
}

TEST(CompressionTests, ShouldCompressSkipsKnownContainers) {
  auto png = text_payload(1000);
  png[0] = 0x89;
  png[1] = 0x50;
  png[2] = 0x4E;
  png[3] = 0x47;
  EXPECT_FALSE(parcel::should_compress(png));

  auto jpeg = text_payload(1000);
  jpeg[0] = 0xFF;
  jpeg[1] = 0xD8;
  jpeg[2] = 0xFF;
  EXPECT_FALSE(parcel::should_compress(jpeg));

  auto gzip = text_payload(1000);
  gzip[0] = 0x1F;
  gzip[1] = 0x8B;
  EXPECT_FALSE(parcel::should_compress(gzip));

  auto zip = text_payload(1000);
  zip[0] = 0x50;
  zip[1] = 0x4B;
  zip[2] = 0x03;
  zip[3] = 0x04;
  EXPECT_FALSE(parcel::should_compress(zip));

  const auto zlib = parcel::compress(text_payload(5000), parcel::CompressionAlgorithm::kDeflate);
  EXPECT_TRUE(parcel::looks_like_compressed(zlib));
}

TEST(CompressionTests, PlainTextIsNotMistakenForContainer) {
  EXPECT_FALSE(parcel::looks_like_compressed(text_payload(1000)));
  std::vector<std::uint8_t> tiny{0x1F};
  EXPECT_FALSE(parcel::looks_like_compressed(tiny));
}

}  // namespace parcelink::tests
