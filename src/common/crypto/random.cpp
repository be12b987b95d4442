#include "common/crypto/random.h"

#include <sodium.h>

#include <cstdint>
#include <stdexcept>
#include <vector>

namespace {
void ensure_sodium_ready() {
  static const bool ready = [] { return sodium_init() >= 0; }();
  if (!ready) {
    throw std::runtime_error("libsodium initialization failed");
  }
}
}  // namespace

namespace parcelink::crypto {

std::uint32_t random_uniform(std::uint32_t upper_bound) {
  if (upper_bound == 0) {
    throw std::invalid_argument("random_uniform upper bound must be non-zero");
  }
  ensure_sodium_ready();
  return randombytes_uniform(upper_bound);
}

std::vector<std::uint8_t> random_bytes(std::size_t n) {
  ensure_sodium_ready();
  std::vector<std::uint8_t> out(n);
  if (n > 0) {
    randombytes_buf(out.data(), out.size());
  }
  return out;
}

}  // namespace parcelink::crypto
