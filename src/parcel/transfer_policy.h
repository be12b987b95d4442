#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace parcelink::parcel {

// Timing and retry policy consumed by the sender engine and the reassembly table.
// The codec itself never sleeps; these values only shape what the transport is told
// to do and when state is expired.
struct TransferPolicy {
  // Delay between successive parcels on the link.
  std::chrono::milliseconds inter_parcel_delay{500};
  // Delay between ATT-sized chunks of a single parcel, for transports that split one.
  std::chrono::milliseconds intra_chunk_delay{30};
  // A listen window follows every N parcels so the peer can answer on a
  // half-duplex link.
  std::uint32_t parcels_before_pause{5};
  std::chrono::milliseconds listen_window{200};
  // How long the sender waits for a receipt before retransmitting.
  std::chrono::milliseconds receipt_timeout{10000};
  // A message is abandoned once its retry count exceeds this.
  std::uint32_t max_retries{3};
  // Pause before a retry round that follows a receipt timeout.
  std::chrono::milliseconds retry_backoff{1000};

  // Sent messages kept for late retransmission requests.
  std::chrono::milliseconds sent_message_retention{std::chrono::minutes(2)};
  // Quiet time on an incomplete message before the receiver asks for missing parcels.
  std::chrono::milliseconds missing_request_delay{5000};
  // Incomplete messages that received no parcel for this long are evicted.
  std::chrono::milliseconds incomplete_message_timeout{60000};
  // Suggested period for calling housekeeping().
  std::chrono::milliseconds housekeeping_interval{10000};
  // Completed messages remembered to absorb duplicate retransmissions. Must not
  // exceed sent_message_retention.
  std::chrono::milliseconds duplicate_window{30000};

  // Payloads smaller than this are never compressed.
  std::size_t compression_threshold{300};
};

bool validate_policy(const TransferPolicy& policy, std::string& error);

// Delay to wait before each of `count` parcels sent back to back in one round:
// nothing before the first, inter_parcel_delay before the others, plus a listen
// window after every parcels_before_pause parcels.
std::vector<std::chrono::milliseconds> pacing_schedule(std::size_t count,
                                                       const TransferPolicy& policy);

}  // namespace parcelink::parcel
