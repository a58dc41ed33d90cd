#pragma once
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

#include "l3merge/event_types.hpp"

namespace l3merge {

// Split one CSV line into fields. Handles double-quoted fields ("" escapes a
// quote), strips a trailing '\r' and trims surrounding blanks of unquoted fields.
void split_csv_line(std::string_view line, std::vector<std::string>& out);

// Strict field parsers: the whole string must be consumed. Doubles are plain
// decimal (no nan, inf or hex).
bool parse_int32(std::string_view s, int32_t& out);
bool parse_int64(std::string_view s, int64_t& out);
bool parse_double(std::string_view s, double& out);

// "ChannelNo,ApplSeqNum,...,Source" without line terminator.
std::string event_header_line();

// Render an Event in canonical column order; unset optionals are empty.
void format_event_row(const Event& ev, std::string& out);

// Inverse of format_event_row. Returns false on malformed input.
bool parse_event_row(std::string_view line, Event& ev);

// Reads only the (ChannelNo, ApplSeqNum) prefix of a canonical row.
bool parse_event_key(std::string_view line, int32_t& channel,
                     int64_t& sequence);

// Buffered writer for one canonical event file.
class EventCsvWriter {
 public:
  explicit EventCsvWriter(const std::filesystem::path& path);

  void append(const Event& ev);

  // Flush and close; throws MergeIOError if any write failed.
  void close();

  const std::filesystem::path& path() const { return path_; }
  uint64_t rows() const { return rows_; }

 private:
  std::filesystem::path path_;
  std::vector<char> buf_;
  std::ofstream out_;
  std::string line_;
  uint64_t rows_ = 0;
};

}  // namespace l3merge
