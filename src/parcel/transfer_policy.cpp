#include "parcel/transfer_policy.h"

#include <chrono>
#include <string>
#include <vector>

namespace parcelink::parcel {

bool validate_policy(const TransferPolicy& policy, std::string& error) {
  if (policy.parcels_before_pause == 0) {
    error = "parcels_before_pause must be at least 1";
    return false;
  }
  if (policy.receipt_timeout.count() <= 0) {
    error = "receipt_timeout must be positive";
    return false;
  }
  if (policy.incomplete_message_timeout.count() <= 0) {
    error = "incomplete_message_timeout must be positive";
    return false;
  }
  if (policy.missing_request_delay.count() <= 0) {
    error = "missing_request_delay must be positive";
    return false;
  }
  if (policy.missing_request_delay >= policy.incomplete_message_timeout) {
    error = "missing_request_delay must be shorter than incomplete_message_timeout";
    return false;
  }
  // The sender must not reuse an id the receiver still remembers as completed.
  if (policy.sent_message_retention < policy.duplicate_window) {
    error = "sent_message_retention must be at least duplicate_window";
    return false;
  }
  if (policy.inter_parcel_delay.count() < 0 || policy.listen_window.count() < 0 ||
      policy.retry_backoff.count() < 0) {
    error = "delays cannot be negative";
    return false;
  }
  return true;
}

std::vector<std::chrono::milliseconds> pacing_schedule(std::size_t count,
                                                       const TransferPolicy& policy) {
  std::vector<std::chrono::milliseconds> delays;
  delays.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    if (i == 0) {
      delays.emplace_back(0);
      continue;
    }
    auto delay = policy.inter_parcel_delay;
    if (policy.parcels_before_pause > 0 && i % policy.parcels_before_pause == 0) {
      delay += policy.listen_window;
    }
    delays.push_back(delay);
  }
  return delays;
}

}  // namespace parcelink::parcel
