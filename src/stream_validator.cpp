#include "l3merge/stream_validator.hpp"

#include "l3merge/errors.hpp"

namespace l3merge {

void StreamValidator::check(const Event& ev) {
  if (!seen_channel_) {
    seen_channel_ = ev.channel;
  } else if (ev.channel != *seen_channel_) {
    throw ChannelConsistencyError(source_, *seen_channel_, ev.channel);
  }

  if (last_sequence_ && ev.sequence < *last_sequence_) {
    throw MonotonicityError(source_, ev.sequence, *last_sequence_);
  }
  last_sequence_ = ev.sequence;
  ++events_;
}

}  // namespace l3merge
