#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace parcelink::crypto {

// Uniformly distributed value in [0, upper_bound). upper_bound must be non-zero.
std::uint32_t random_uniform(std::uint32_t upper_bound);

// Fill a new buffer with n cryptographically secure random bytes.
std::vector<std::uint8_t> random_bytes(std::size_t n);

}  // namespace parcelink::crypto
