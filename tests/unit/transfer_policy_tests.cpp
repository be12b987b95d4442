#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

#include "parcel/transfer_policy.h"

namespace parcelink::tests {

using namespace std::chrono_literals;

TEST(TransferPolicyTest, Defaults) {
  const parcel::TransferPolicy policy;
  EXPECT_EQ(policy.inter_parcel_delay, 500ms);
  EXPECT_EQ(policy.intra_chunk_delay, 30ms);
  EXPECT_EQ(policy.parcels_before_pause, 5U);
  EXPECT_EQ(policy.listen_window, 200ms);
  EXPECT_EQ(policy.receipt_timeout, 10s);
  EXPECT_EQ(policy.max_retries, 3U);
  EXPECT_EQ(policy.missing_request_delay, 5s);
  EXPECT_EQ(policy.incomplete_message_timeout, 60s);
  EXPECT_EQ(policy.housekeeping_interval, 10s);
  EXPECT_EQ(policy.compression_threshold, 300U);

  std::string error;
  EXPECT_TRUE(parcel::validate_policy(policy, error)) << error;
}

TEST(TransferPolicyTest, RejectsInconsistentValues) {
  std::string error;

  parcel::TransferPolicy policy;
  policy.parcels_before_pause = 0;
  EXPECT_FALSE(parcel::validate_policy(policy, error));
  EXPECT_NE(error.find("parcels_before_pause"), std::string::npos);

  policy = {};
  policy.receipt_timeout = 0ms;
  EXPECT_FALSE(parcel::validate_policy(policy, error));

  policy = {};
  policy.missing_request_delay = 60s;
  EXPECT_FALSE(parcel::validate_policy(policy, error));
  EXPECT_NE(error.find("shorter"), std::string::npos);

  policy = {};
  policy.duplicate_window = 3min;
  EXPECT_FALSE(parcel::validate_policy(policy, error));
  EXPECT_NE(error.find("sent_message_retention"), std::string::npos);
  policy.sent_message_retention = 3min;
  EXPECT_TRUE(parcel::validate_policy(policy, error)) << error;

  policy = {};
  policy.inter_parcel_delay = -1ms;
  EXPECT_FALSE(parcel::validate_policy(policy, error));

  policy = {};
  policy.inter_parcel_delay = 0ms;
  policy.listen_window = 0ms;
  EXPECT_TRUE(parcel::validate_policy(policy, error));
}

TEST(TransferPolicyTest, PacingSchedule) {
  const parcel::TransferPolicy policy;
  EXPECT_TRUE(parcel::pacing_schedule(0, policy).empty());
  EXPECT_EQ(parcel::pacing_schedule(1, policy), (std::vector<std::chrono::milliseconds>{0ms}));

  const auto delays = parcel::pacing_schedule(11, policy);
  ASSERT_EQ(delays.size(), 11U);
  EXPECT_EQ(delays[0], 0ms);
  EXPECT_EQ(delays[1], 500ms);
  EXPECT_EQ(delays[4], 500ms);
  // Listen window after every fifth parcel.
  EXPECT_EQ(delays[5], 700ms);
  EXPECT_EQ(delays[6], 500ms);
  EXPECT_EQ(delays[10], 700ms);
}

TEST(TransferPolicyTest, PacingWithoutPauses) {
  parcel::TransferPolicy policy;
  policy.parcels_before_pause = 1000;
  policy.inter_parcel_delay = 20ms;
  for (const auto d : parcel::pacing_schedule(50, policy)) {
    EXPECT_LE(d, 20ms);
  }
}

}  // namespace parcelink::tests
