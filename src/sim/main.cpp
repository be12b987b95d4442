#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

#include "common/logging/logger.h"
#include "common/version.h"
#include "sim/loopback_simulation.h"
#include "sim/sim_config.h"

using namespace parcelink;

namespace {

void print_row(const std::string& label, const std::string& value) {
  std::cout << "  " << label;
  for (std::size_t i = label.size(); i < 24; ++i) {
    std::cout << ' ';
  }
  std::cout << value << '\n';
}

void print_configuration(const sim::SimConfig& config) {
  std::cout << kFullVersionString << " loopback simulator (" << kBuildType << ")\n\n";
  print_row("Messages", std::to_string(config.messages));
  print_row("Payload size", std::to_string(config.payload_size) + " bytes");
  print_row("Payload", config.compressible ? "compressible text" : "random bytes");
  print_row("Compression", config.compression_enabled ? "supported" : "disabled");
  print_row("Drop rate", std::to_string(config.link.drop_rate));
  print_row("Corrupt rate", std::to_string(config.link.corrupt_rate));
  print_row("Receipt drop rate", std::to_string(config.link.receipt_drop_rate));
  print_row("Seed", config.seed == 0 ? "random" : std::to_string(config.seed));
  std::cout << '\n';
}

void print_report(const sim::SimReport& report) {
  std::cout << "Results\n";
  print_row("Delivered", std::to_string(report.delivered) + " / " + std::to_string(report.messages));
  print_row("Failed", std::to_string(report.failed));
  print_row("Wrong content", std::to_string(report.payload_mismatches));
  print_row("Simulated time", std::to_string(report.elapsed.count()) + " ms");
  print_row("Parcels sent", std::to_string(report.sender.parcels_sent));
  print_row("Parcels resent", std::to_string(report.sender.parcels_resent));
  print_row("Receipt timeouts", std::to_string(report.sender.receipt_timeouts));
  print_row("Parcels lost", std::to_string(report.forward.dropped));
  print_row("Parcels corrupted", std::to_string(report.forward.corrupted));
  print_row("Receipts lost", std::to_string(report.backward.dropped));
  print_row("Checksum failures", std::to_string(report.receiver.checksum_failures));
  print_row("Missing requests", std::to_string(report.receiver.missing_requests));
  print_row("Duplicates ignored", std::to_string(report.receiver.duplicates_ignored));
  if (report.timed_out) {
    std::cout << "\nSimulated time limit reached before every message settled.\n";
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  sim::SimConfig config;
  std::error_code ec;

  if (!sim::parse_args(argc, argv, config, ec)) {
    std::cerr << "Failed to parse arguments: " << ec.message() << '\n';
    return EXIT_FAILURE;
  }

  std::string validation_error;
  if (!sim::validate_config(config, validation_error)) {
    std::cerr << "Configuration error: " << validation_error << '\n';
    return EXIT_FAILURE;
  }

  logging::configure_logging(
      config.verbose ? logging::LogLevel::debug : logging::log_level_from_string(config.log_level),
      true, config.log_file);
  print_configuration(config);
  LOG_INFO("Simulation starting");

  try {
    sim::LoopbackSimulation simulation(config);
    const auto report = simulation.run();
    print_report(report);
    return report.success() ? EXIT_SUCCESS : EXIT_FAILURE;
  } catch (const std::exception& e) {
    LOG_ERROR("Simulation aborted: {}", e.what());
    std::cerr << "Simulation aborted: " << e.what() << '\n';
    return EXIT_FAILURE;
  }
}
