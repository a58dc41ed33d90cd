#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include "l3merge/event_types.hpp"

namespace l3merge {

// Running per-source checks applied to every event as it is drained:
//   - all events carry the channel of the first one
//   - sequence numbers never decrease (repeats are allowed)
class StreamValidator {
 public:
  explicit StreamValidator(std::string source) : source_(std::move(source)) {}

  // Throws ChannelConsistencyError or MonotonicityError.
  void check(const Event& ev);

  // Channel of the source, or nullopt if no event was checked.
  std::optional<int32_t> channel() const { return seen_channel_; }
  std::optional<int64_t> last_sequence() const { return last_sequence_; }
  uint64_t events() const { return events_; }

 private:
  std::string source_;
  std::optional<int32_t> seen_channel_;
  std::optional<int64_t> last_sequence_;
  uint64_t events_ = 0;
};

}  // namespace l3merge
