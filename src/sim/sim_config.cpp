#include "sim/sim_config.h"

#include <cerrno>
#include <charconv>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <CLI/CLI.hpp>

#include "common/logging/logger.h"
#include "parcel/parcel.h"

namespace parcelink::sim {

namespace {

// Upper bound on simultaneously queued messages: every one needs a distinct id.
constexpr std::size_t kMaxMessages = 500;

bool fail(const std::string& field_name, const std::string& value, const char* problem,
          std::errc code, std::error_code& ec) {
  LOG_ERROR("Configuration error: {} value '{}' {}", field_name, value, problem);
  ec = std::make_error_code(code);
  return false;
}

// Every integer setting is a count, a size or a duration, so only unsigned values parse.
template <typename T>
bool parse_unsigned(const std::string& value, T& out, const std::string& field_name,
                    std::error_code& ec) {
  static_assert(std::is_unsigned_v<T>);
  if (!value.empty() && value.front() == '-') {
    return fail(field_name, value, "cannot be negative", std::errc::result_out_of_range, ec);
  }
  const char* last = value.data() + value.size();
  T parsed{};
  const auto [ptr, err] = std::from_chars(value.data(), last, parsed);
  if (err == std::errc::result_out_of_range) {
    return fail(field_name, value, "is out of range", std::errc::result_out_of_range, ec);
  }
  if (err != std::errc() || ptr != last) {
    return fail(field_name, value, "is not a valid number", std::errc::invalid_argument, ec);
  }
  out = parsed;
  return true;
}

bool safe_parse_double(const std::string& value, double& out, const std::string& field_name,
                       std::error_code& ec) {
  try {
    std::size_t consumed = 0;
    out = std::stod(value, &consumed);
    if (consumed != value.size()) {
      throw std::invalid_argument(value);
    }
    return true;
  } catch (const std::invalid_argument&) {
    return fail(field_name, value, "is not a valid number", std::errc::invalid_argument, ec);
  } catch (const std::out_of_range&) {
    return fail(field_name, value, "is out of range", std::errc::result_out_of_range, ec);
  }
}

bool parse_millis(const std::string& value, std::chrono::milliseconds& out,
                  const std::string& field_name, std::error_code& ec) {
  std::uint32_t ms = 0;
  if (!parse_unsigned(value, ms, field_name, ec)) {
    return false;
  }
  out = std::chrono::milliseconds(ms);
  return true;
}

bool parse_bool(const std::string& value) {
  return value == "true" || value == "1" || value == "yes";
}

bool is_probability(double value) { return value >= 0.0 && value <= 1.0; }

std::string trim(const std::string& text) {
  const auto first = text.find_first_not_of(" \t\r");
  if (first == std::string::npos) {
    return "";
  }
  return text.substr(first, text.find_last_not_of(" \t\r") - first + 1);
}

// "key = value" lines only; comments and section headers yield false.
bool parse_ini_value(const std::string& line, std::string& key, std::string& value) {
  const std::string text = trim(line);
  if (text.empty() || text.front() == '#' || text.front() == ';' || text.front() == '[') {
    return false;
  }
  const auto eq = text.find('=');
  if (eq == std::string::npos) {
    return false;
  }
  key = trim(text.substr(0, eq));
  value = trim(text.substr(eq + 1));
  return !key.empty();
}

std::string get_current_section(const std::string& line) {
  const std::string text = trim(line);
  if (text.size() >= 2 && text.front() == '[' && text.back() == ']') {
    return trim(text.substr(1, text.size() - 2));
  }
  return "";
}

bool apply_policy_key(const std::string& key, const std::string& value,
                      parcel::TransferPolicy& policy, std::error_code& ec) {
  if (key == "inter_parcel_delay_ms") {
    return parse_millis(value, policy.inter_parcel_delay, key, ec);
  }
  if (key == "intra_chunk_delay_ms") {
    return parse_millis(value, policy.intra_chunk_delay, key, ec);
  }
  if (key == "parcels_before_pause") {
    return parse_unsigned(value, policy.parcels_before_pause, key, ec);
  }
  if (key == "listen_window_ms") {
    return parse_millis(value, policy.listen_window, key, ec);
  }
  if (key == "receipt_timeout_ms") {
    return parse_millis(value, policy.receipt_timeout, key, ec);
  }
  if (key == "max_retries") {
    return parse_unsigned(value, policy.max_retries, key, ec);
  }
  if (key == "retry_backoff_ms") {
    return parse_millis(value, policy.retry_backoff, key, ec);
  }
  if (key == "sent_message_retention_ms") {
    return parse_millis(value, policy.sent_message_retention, key, ec);
  }
  if (key == "missing_request_delay_ms") {
    return parse_millis(value, policy.missing_request_delay, key, ec);
  }
  if (key == "incomplete_message_timeout_ms") {
    return parse_millis(value, policy.incomplete_message_timeout, key, ec);
  }
  if (key == "housekeeping_interval_ms") {
    return parse_millis(value, policy.housekeeping_interval, key, ec);
  }
  if (key == "duplicate_window_ms") {
    return parse_millis(value, policy.duplicate_window, key, ec);
  }
  if (key == "compression_threshold") {
    return parse_unsigned(value, policy.compression_threshold, key, ec);
  }
  LOG_WARN("Ignoring unknown policy key '{}'", key);
  return true;
}

}  // namespace

bool parse_args(int argc, char* argv[], SimConfig& config, std::error_code& ec) {
  CLI::App app{"parcelink loopback simulator"};

  // General options.
  app.add_option("-c,--config", config.config_file, "Configuration file path");
  app.add_flag("-v,--verbose", config.verbose, "Enable verbose logging");
  app.add_option("--log-level", config.log_level,
                 "Log level: trace, debug, info, warn, error, critical or off");
  app.add_option("--log-file", config.log_file, "Log file path");

  // Workload.
  app.add_option("--messages", config.messages, "Number of messages to send");
  app.add_option("--size", config.payload_size, "Payload size in bytes");
  app.add_flag("--compressible", config.compressible, "Send repetitive text instead of random bytes");
  bool no_compression = false;
  app.add_flag("--no-compression", no_compression, "Peer does not support compression");

  // Link.
  app.add_option("--drop-rate", config.link.drop_rate, "Parcel loss probability");
  app.add_option("--corrupt-rate", config.link.corrupt_rate, "Parcel bit-flip probability");
  app.add_option("--receipt-drop-rate", config.link.receipt_drop_rate,
                 "Receipt loss probability");
  app.add_option("--seed", config.seed, "Link RNG seed (0 = non-deterministic)");
  std::int64_t max_sim_seconds = config.max_sim_time.count();
  app.add_option("--max-sim-time", max_sim_seconds, "Simulated time limit in seconds");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    app.exit(e);
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }

  if (!config.config_file.empty()) {
    if (!load_config_file(config.config_file, config, ec)) {
      return false;
    }
    // Re-apply the command line so it wins over the file. Options absent from
    // argv leave the loaded values alone.
    max_sim_seconds = config.max_sim_time.count();
    try {
      app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
      app.exit(e);
      ec = std::make_error_code(std::errc::invalid_argument);
      return false;
    }
  }

  config.max_sim_time = std::chrono::seconds(max_sim_seconds);
  if (no_compression) {
    config.compression_enabled = false;
  }
  return true;
}

bool load_config_file(const std::string& path, SimConfig& config, std::error_code& ec) {
  std::ifstream file(path);
  if (!file) {
    ec = std::error_code(errno, std::generic_category());
    LOG_ERROR("Failed to open config file: {}", path);
    return false;
  }

  std::string line;
  std::string section;

  while (std::getline(file, line)) {
    std::string new_section = get_current_section(line);
    if (!new_section.empty()) {
      section = new_section;
      continue;
    }

    std::string key;
    std::string value;
    if (!parse_ini_value(line, key, value)) {
      continue;
    }

    if (section == "sim" || section.empty()) {
      if (key == "messages") {
        if (!parse_unsigned(value, config.messages, key, ec)) {
          return false;
        }
      } else if (key == "size") {
        if (!parse_unsigned(value, config.payload_size, key, ec)) {
          return false;
        }
      } else if (key == "compressible") {
        config.compressible = parse_bool(value);
      } else if (key == "compression") {
        config.compression_enabled = parse_bool(value);
      } else if (key == "verbose") {
        config.verbose = parse_bool(value);
      } else if (key == "log_level") {
        config.log_level = value;
      } else if (key == "log_file") {
        config.log_file = value;
      } else if (key == "seed") {
        if (!parse_unsigned(value, config.seed, key, ec)) {
          return false;
        }
      } else if (key == "max_sim_time") {
        std::uint32_t seconds = 0;
        if (!parse_unsigned(value, seconds, key, ec)) {
          return false;
        }
        config.max_sim_time = std::chrono::seconds(seconds);
      }
    } else if (section == "link") {
      if (key == "drop_rate") {
        if (!safe_parse_double(value, config.link.drop_rate, key, ec)) {
          return false;
        }
      } else if (key == "corrupt_rate") {
        if (!safe_parse_double(value, config.link.corrupt_rate, key, ec)) {
          return false;
        }
      } else if (key == "receipt_drop_rate") {
        if (!safe_parse_double(value, config.link.receipt_drop_rate, key, ec)) {
          return false;
        }
      } else if (key == "latency_ms") {
        if (!parse_millis(value, config.link.latency, key, ec)) {
          return false;
        }
      }
    } else if (section == "policy") {
      if (!apply_policy_key(key, value, config.policy, ec)) {
        return false;
      }
    }
  }

  LOG_DEBUG("Loaded configuration from {}", path);
  return true;
}

bool validate_config(const SimConfig& config, std::string& error) {
  if (config.messages == 0) {
    error = "At least one message must be sent";
    return false;
  }
  if (config.messages > kMaxMessages) {
    error = "Messages cannot exceed " + std::to_string(kMaxMessages);
    return false;
  }
  if (config.payload_size > parcel::kMaxTransmittedBytes) {
    error = "Payload size cannot exceed " + std::to_string(parcel::kMaxTransmittedBytes) + " bytes";
    return false;
  }
  if (!is_probability(config.link.drop_rate) || !is_probability(config.link.corrupt_rate) ||
      !is_probability(config.link.receipt_drop_rate)) {
    error = "Link rates must be between 0 and 1";
    return false;
  }
  // A link that loses everything never finishes.
  if (config.link.drop_rate >= 1.0 || config.link.receipt_drop_rate >= 1.0) {
    error = "Drop rates must be below 1";
    return false;
  }
  if (config.link.latency.count() < 0) {
    error = "Link latency cannot be negative";
    return false;
  }
  if (config.max_sim_time.count() <= 0) {
    error = "Simulated time limit must be positive";
    return false;
  }
  return parcel::validate_policy(config.policy, error);
}

}  // namespace parcelink::sim
