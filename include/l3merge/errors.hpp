#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace l3merge {

// Base of every failure raised by the merge pipeline.
class Error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Mutually exclusive or missing settings, detected before any processing.
class ConfigurationError : public Error {
 public:
  using Error::Error;
};

// A source root or entry could not be listed or opened.
class SourceAccessError : public Error {
 public:
  using Error::Error;
};

// Malformed raw row or missing column.
class ParseError : public Error {
 public:
  ParseError(const std::string& source, const std::string& detail)
      : Error("parse error in " + source + ": " + detail), source_(source) {}

  const std::string& source() const { return source_; }

 private:
  std::string source_;
};

// A source produced rows for two different channels.
class ChannelConsistencyError : public Error {
 public:
  ChannelConsistencyError(const std::string& source, int32_t seen,
                          int32_t got)
      : Error("multiple ChannelNo values in " + source + ": " +
              std::to_string(seen) + " vs " + std::to_string(got)),
        source_(source),
        seen_(seen),
        got_(got) {}

  const std::string& source() const { return source_; }
  int32_t seen_channel() const { return seen_; }
  int32_t offending_channel() const { return got_; }

 private:
  std::string source_;
  int32_t seen_;
  int32_t got_;
};

// A source's sequence numbers went backwards.
class MonotonicityError : public Error {
 public:
  MonotonicityError(const std::string& source, int64_t seq, int64_t prev)
      : Error("stream not monotonic: " + source + " seq " +
              std::to_string(seq) + " < " + std::to_string(prev)),
        source_(source),
        seq_(seq),
        prev_(prev) {}

  const std::string& source() const { return source_; }
  int64_t sequence() const { return seq_; }
  int64_t previous_sequence() const { return prev_; }

 private:
  std::string source_;
  int64_t seq_;
  int64_t prev_;
};

// Read/write failure while merging intermediate event files.
class MergeIOError : public Error {
 public:
  using Error::Error;
};

}  // namespace l3merge
