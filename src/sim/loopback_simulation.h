#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <queue>
#include <string>
#include <vector>

#include "parcel/parcel_sender.h"
#include "parcel/reassembly_table.h"
#include "sim/lossy_link.h"
#include "sim/sim_config.h"

namespace parcelink::sim {

struct SimReport {
  std::size_t messages{0};
  std::size_t delivered{0};
  std::size_t failed{0};
  // Completed at the receiver with bytes different from what was sent.
  std::size_t payload_mismatches{0};
  std::size_t decompression_failures{0};
  bool timed_out{false};
  std::chrono::milliseconds elapsed{0};

  parcel::SenderStats sender;
  parcel::ReassemblyStats receiver;
  LinkStats forward;
  LinkStats backward;

  [[nodiscard]] bool success() const {
    return !timed_out && failed == 0 && payload_mismatches == 0 && delivered == messages;
  }
};

// Drives one ParcelSender and one ReassemblyTable over a pair of lossy links on a
// simulated clock. Parcels are paced the way a real transport would pace them.
class LoopbackSimulation {
 public:
  explicit LoopbackSimulation(SimConfig config);

  SimReport run();

 private:
  struct InFlight {
    parcel::TimePoint arrival;
    std::uint64_t sequence{0};
    bool to_receiver{true};
    std::vector<std::uint8_t> bytes;

    bool operator>(const InFlight& other) const {
      return arrival != other.arrival ? arrival > other.arrival : sequence > other.sequence;
    }
  };

  std::vector<std::uint8_t> make_payload(std::size_t n);
  void dispatch(parcel::SenderActions actions, parcel::TimePoint now, SimReport& report);
  void send_receipt(const parcel::Receipt& receipt, parcel::TimePoint now);
  void deliver(InFlight item, parcel::TimePoint now, SimReport& report);

  SimConfig config_;
  parcel::ParcelSender sender_;
  parcel::ReassemblyTable receiver_;
  LossyLink forward_;
  LossyLink backward_;
  std::priority_queue<InFlight, std::vector<InFlight>, std::greater<>> in_flight_;
  std::map<std::string, std::vector<std::uint8_t>> expected_;
  parcel::TimePoint link_free_at_{};
  std::uint64_t next_sequence_{0};
  std::size_t reports_{0};
};

}  // namespace parcelink::sim
