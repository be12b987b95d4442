#include "sim/lossy_link.h"

#include "common/crypto/random.h"
#include "parcel/parcel.h"

namespace parcelink::sim {

namespace {
constexpr std::uint32_t kUnitResolution = 1U << 24;
}  // namespace

LossyLink::LossyLink(double drop_rate, double corrupt_rate, std::uint64_t seed)
    : drop_rate_(drop_rate), corrupt_rate_(corrupt_rate), deterministic_(seed != 0), rng_(seed) {}

double LossyLink::next_unit() {
  return static_cast<double>(next_below(kUnitResolution)) / static_cast<double>(kUnitResolution);
}

std::uint32_t LossyLink::next_below(std::uint32_t upper_bound) {
  if (deterministic_) {
    std::uniform_int_distribution<std::uint32_t> dist(0, upper_bound - 1);
    return dist(rng_);
  }
  return crypto::random_uniform(upper_bound);
}

std::optional<std::vector<std::uint8_t>> LossyLink::carry(std::vector<std::uint8_t> bytes) {
  if (drop_rate_ > 0.0 && next_unit() < drop_rate_) {
    ++stats_.dropped;
    return std::nullopt;
  }
  if (corrupt_rate_ > 0.0 && bytes.size() > parcel::kHeaderOverhead && next_unit() < corrupt_rate_) {
    const auto body = static_cast<std::uint32_t>(bytes.size() - parcel::kHeaderOverhead);
    const auto offset = parcel::kHeaderOverhead + next_below(body);
    bytes[offset] ^= static_cast<std::uint8_t>(1U << next_below(8));
    ++stats_.corrupted;
  }
  ++stats_.carried;
  return bytes;
}

}  // namespace parcelink::sim
