#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "common/logging/logger.h"
#include "parcel/parcel.h"
#include "sim/sim_config.h"

namespace parcelink::tests {

namespace {

using namespace std::chrono_literals;

class Argv {
 public:
  explicit Argv(std::vector<std::string> args) : args_(std::move(args)) {
    for (auto& a : args_) {
      pointers_.push_back(a.data());
    }
    pointers_.push_back(nullptr);
  }

  int argc() const { return static_cast<int>(args_.size()); }
  char** argv() { return pointers_.data(); }

 private:
  std::vector<std::string> args_;
  std::vector<char*> pointers_;
};

}  // namespace

class SimConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    path_ = std::filesystem::temp_directory_path() /
            ("parcelink_sim_config_" +
             std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) + ".ini");
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }

  void write(const std::string& contents) {
    std::ofstream out(path_);
    out << contents;
  }

  std::filesystem::path path_;
};

TEST_F(SimConfigTest, LoadsAllSections) {
  write(
      "# loopback run\n"
      "[sim]\n"
      "messages = 25\n"
      "size = 4096\n"
      "compressible = true\n"
      "compression = false\n"
      "seed = 77\n"
      "log_level = info\n"
      "max_sim_time = 600\n"
      "\n"
      "[link]\n"
      "drop_rate = 0.05\n"
      "corrupt_rate = 0.01\n"
      "receipt_drop_rate = 0.1\n"
      "latency_ms = 35\n"
      "\n"
      "[policy]\n"
      "inter_parcel_delay_ms = 50\n"
      "parcels_before_pause = 8\n"
      "receipt_timeout_ms = 4000\n"
      "max_retries = 6\n"
      "missing_request_delay_ms = 2000\n"
      "compression_threshold = 512\n"
      "not_a_real_key = 1\n");

  sim::SimConfig config;
  std::error_code ec;
  ASSERT_TRUE(sim::load_config_file(path_.string(), config, ec)) << ec.message();

  EXPECT_EQ(config.messages, 25U);
  EXPECT_EQ(config.payload_size, 4096U);
  EXPECT_TRUE(config.compressible);
  EXPECT_FALSE(config.compression_enabled);
  EXPECT_EQ(config.seed, 77U);
  EXPECT_EQ(config.log_level, "info");
  EXPECT_EQ(config.max_sim_time, 600s);
  EXPECT_DOUBLE_EQ(config.link.drop_rate, 0.05);
  EXPECT_DOUBLE_EQ(config.link.corrupt_rate, 0.01);
  EXPECT_DOUBLE_EQ(config.link.receipt_drop_rate, 0.1);
  EXPECT_EQ(config.link.latency, 35ms);
  EXPECT_EQ(config.policy.inter_parcel_delay, 50ms);
  EXPECT_EQ(config.policy.parcels_before_pause, 8U);
  EXPECT_EQ(config.policy.receipt_timeout, 4000ms);
  EXPECT_EQ(config.policy.max_retries, 6U);
  EXPECT_EQ(config.policy.missing_request_delay, 2000ms);
  EXPECT_EQ(config.policy.compression_threshold, 512U);
  // Untouched keys keep their defaults.
  EXPECT_EQ(config.policy.listen_window, 200ms);
}

TEST_F(SimConfigTest, RejectsBadNumbers) {
  sim::SimConfig config;
  std::error_code ec;

  write("[sim]\nmessages = lots\n");
  EXPECT_FALSE(sim::load_config_file(path_.string(), config, ec));
  EXPECT_TRUE(ec == std::errc::invalid_argument);

  ec.clear();
  write("[policy]\nmax_retries = -2\n");
  EXPECT_FALSE(sim::load_config_file(path_.string(), config, ec));
  EXPECT_TRUE(ec == std::errc::result_out_of_range);

  ec.clear();
  write("[link]\nlatency_ms = -40\n");
  EXPECT_FALSE(sim::load_config_file(path_.string(), config, ec));
  EXPECT_TRUE(ec == std::errc::result_out_of_range);

  ec.clear();
  write("[sim]\nmax_sim_time = -5\n");
  EXPECT_FALSE(sim::load_config_file(path_.string(), config, ec));
  EXPECT_TRUE(ec == std::errc::result_out_of_range);

  ec.clear();
  write("[sim]\nmessages = 12abc\n");
  EXPECT_FALSE(sim::load_config_file(path_.string(), config, ec));
  EXPECT_TRUE(ec == std::errc::invalid_argument);

  ec.clear();
  write("[link]\ndrop_rate = 0.1x\n");
  EXPECT_FALSE(sim::load_config_file(path_.string(), config, ec));
  EXPECT_TRUE(ec == std::errc::invalid_argument);
}

TEST_F(SimConfigTest, MissingFile) {
  sim::SimConfig config;
  std::error_code ec;
  EXPECT_FALSE(sim::load_config_file((path_ / "absent.ini").string(), config, ec));
  EXPECT_TRUE(ec);
}

TEST_F(SimConfigTest, CommandLineOverridesFile) {
  write("[sim]\nmessages = 40\nsize = 100\n[link]\ndrop_rate = 0.2\n");
  Argv args({"parcelink-sim", "-c", path_.string(), "--messages", "3", "--no-compression",
             "--max-sim-time", "90"});

  sim::SimConfig config;
  std::error_code ec;
  ASSERT_TRUE(sim::parse_args(args.argc(), args.argv(), config, ec)) << ec.message();
  EXPECT_EQ(config.messages, 3U);
  EXPECT_EQ(config.payload_size, 100U);
  EXPECT_DOUBLE_EQ(config.link.drop_rate, 0.2);
  EXPECT_FALSE(config.compression_enabled);
  EXPECT_EQ(config.max_sim_time, 90s);
}

TEST_F(SimConfigTest, ValidateConfig) {
  std::string error;
  sim::SimConfig config;
  EXPECT_TRUE(sim::validate_config(config, error)) << error;

  config.messages = 0;
  EXPECT_FALSE(sim::validate_config(config, error));

  config = {};
  config.messages = 501;
  EXPECT_FALSE(sim::validate_config(config, error));

  config = {};
  config.payload_size = parcel::kMaxTransmittedBytes + 1;
  EXPECT_FALSE(sim::validate_config(config, error));

  config = {};
  config.link.corrupt_rate = 1.5;
  EXPECT_FALSE(sim::validate_config(config, error));

  config = {};
  config.link.drop_rate = 1.0;
  EXPECT_FALSE(sim::validate_config(config, error));

  config = {};
  config.max_sim_time = 0s;
  EXPECT_FALSE(sim::validate_config(config, error));

  config = {};
  config.policy.parcels_before_pause = 0;
  EXPECT_FALSE(sim::validate_config(config, error));
  EXPECT_NE(error.find("parcels_before_pause"), std::string::npos);
}

TEST(LogLevelTest, ParsesNames) {
  EXPECT_EQ(logging::log_level_from_string("debug"), logging::LogLevel::debug);
  EXPECT_EQ(logging::log_level_from_string("warning"), logging::LogLevel::warn);
  EXPECT_EQ(logging::log_level_from_string("off"), logging::LogLevel::off);
  EXPECT_EQ(logging::log_level_from_string("loud"), logging::LogLevel::info);
}

}  // namespace parcelink::tests
