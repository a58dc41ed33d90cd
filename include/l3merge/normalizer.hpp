#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "l3merge/event_types.hpp"
#include "l3merge/source.hpp"

namespace l3merge {

struct NormalizeOptions {
  // Rows of other channels are dropped before validation.
  std::optional<int32_t> only_channel;

  // Stop after this many rows of the selected channel (0 = unlimited).
  uint64_t limit_rows = 0;
};

// Maps raw order or tick rows of one source to canonical Events, one row at
// a time and in input order.
class RecordNormalizer {
 public:
  RecordNormalizer(std::unique_ptr<LineSource> src, SourceFamily family,
                   std::string symbol, NormalizeOptions opts = {});

  // Produces the next event; false once the source is exhausted.
  // Throws ParseError on malformed rows or a missing column.
  bool next(Event& ev);

  const std::string& source_name() const { return src_->name(); }
  uint64_t rows_read() const { return rows_read_; }
  uint64_t rows_filtered() const { return rows_filtered_; }

 private:
  struct Columns {
    int channel = -1;
    int seq = -1;
    int price = -1;
    int transact_time = -1;
    int sending_time = -1;
    // order stream
    int side = -1;
    int order_qty = -1;
    int ord_type = -1;
    // tick stream
    int bid_seq = -1;
    int offer_seq = -1;
    int qty = -1;
    int amt = -1;
    int exec_type = -1;
  };

  void read_header();
  void map_order_row(Event& ev);
  void map_tick_row(Event& ev);

  const std::string& field(int idx) const;
  int64_t required_int64(int idx, const char* column) const;
  double required_double(int idx, const char* column) const;
  std::optional<int64_t> optional_int64(int idx, const char* column) const;
  std::optional<double> optional_double(int idx, const char* column) const;
  std::optional<std::string> optional_text(int idx) const;

  std::unique_ptr<LineSource> src_;
  SourceFamily family_;
  std::string symbol_;
  NormalizeOptions opts_;

  bool have_header_ = false;
  std::size_t header_width_ = 0;
  Columns col_;

  std::string line_;
  std::vector<std::string> fields_;
  uint64_t rows_read_ = 0;
  uint64_t rows_filtered_ = 0;
};

}  // namespace l3merge
