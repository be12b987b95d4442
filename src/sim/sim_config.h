#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>

#include "parcel/transfer_policy.h"

namespace parcelink::sim {

// Simulated radio link between the two peers.
struct LinkConfig {
  // Probability that a parcel is lost.
  double drop_rate{0.0};
  // Probability that a delivered parcel has one payload bit flipped.
  double corrupt_rate{0.0};
  // Probability that a receipt is lost on the way back.
  double receipt_drop_rate{0.0};
  // One-way latency.
  std::chrono::milliseconds latency{20};
};

// Loopback simulator configuration.
struct SimConfig {
  // General settings.
  std::string config_file;
  bool verbose{false};
  // Used when verbose is off.
  std::string log_level{"warn"};
  std::string log_file;

  // Workload.
  std::size_t messages{10};
  std::size_t payload_size{2000};
  bool compressible{false};
  bool compression_enabled{true};

  // 0 draws link randomness from libsodium; anything else makes the run repeatable.
  std::uint64_t seed{0};
  std::chrono::seconds max_sim_time{3600};

  LinkConfig link;
  parcel::TransferPolicy policy;
};

// Parse command-line arguments into configuration. Values given on the command
// line take precedence over the configuration file.
bool parse_args(int argc, char* argv[], SimConfig& config, std::error_code& ec);

// Load configuration from INI file (sections [sim], [link], [policy]).
bool load_config_file(const std::string& path, SimConfig& config, std::error_code& ec);

// Validate configuration.
bool validate_config(const SimConfig& config, std::string& error);

}  // namespace parcelink::sim
