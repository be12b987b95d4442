#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <vector>

namespace parcelink::sim {

struct LinkStats {
  std::uint64_t carried{0};
  std::uint64_t dropped{0};
  std::uint64_t corrupted{0};
};

// One direction of a simulated radio link. Bit errors only hit the parcel body
// past the header framing; the radio's own CRC is assumed to protect the rest.
class LossyLink {
 public:
  // seed == 0 draws from libsodium, any other value from a seeded Mersenne Twister.
  LossyLink(double drop_rate, double corrupt_rate, std::uint64_t seed);

  // Returns the bytes as they arrive, or nullopt when lost.
  std::optional<std::vector<std::uint8_t>> carry(std::vector<std::uint8_t> bytes);

  const LinkStats& stats() const { return stats_; }

 private:
  // Uniform in [0, 1).
  double next_unit();
  std::uint32_t next_below(std::uint32_t upper_bound);

  double drop_rate_;
  double corrupt_rate_;
  bool deterministic_;
  std::mt19937_64 rng_;
  LinkStats stats_;
};

}  // namespace parcelink::sim
