#include "syncplay/syncplay.h"

#include <algorithm>
#include <utility>

namespace syncplay {

int64_t ClockSample::round_trip_ms() const {
  return local_receive_ms - local_send_ms;
}

int64_t ClockSample::offset_ms() const {
  // Host time at the midpoint of the round trip, projected to receive time.
  const int64_t estimated_host_ms = remote_ms + round_trip_ms() / 2;
  return estimated_host_ms - local_receive_ms;
}

std::optional<int64_t> MedianOffset(std::vector<int64_t> offsets) {
  if (offsets.empty()) {
    return std::nullopt;
  }
  std::sort(offsets.begin(), offsets.end());
  return offsets[offsets.size() / 2];
}

std::optional<int64_t> EstimateClockOffset(const std::vector<ClockSample>& samples) {
  std::vector<int64_t> offsets;
  offsets.reserve(samples.size());
  for (const auto& sample : samples) {
    offsets.push_back(sample.offset_ms());
  }
  return MedianOffset(std::move(offsets));
}

}  // namespace syncplay
