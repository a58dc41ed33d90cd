#include "l3merge/normalizer.hpp"

#include <string_view>

#include "l3merge/errors.hpp"
#include "l3merge/event_csv.hpp"

namespace l3merge {

namespace {

const std::string kEmpty;

bool is_blank_line(const std::string& l) {
  for (char c : l) {
    if (c != ' ' && c != '\t' && c != '\r') return false;
  }
  return true;
}

}  // namespace

RecordNormalizer::RecordNormalizer(std::unique_ptr<LineSource> src,
                                   SourceFamily family, std::string symbol,
                                   NormalizeOptions opts)
    : src_(std::move(src)),
      family_(family),
      symbol_(std::move(symbol)),
      opts_(opts) {}

void RecordNormalizer::read_header() {
  have_header_ = true;
  while (src_->next_line(line_)) {
    if (is_blank_line(line_)) continue;
    // tolerate a UTF-8 byte order mark
    if (line_.size() >= 3 && line_.compare(0, 3, "\xEF\xBB\xBF") == 0) {
      line_.erase(0, 3);
    }
    split_csv_line(line_, fields_);
    header_width_ = fields_.size();

    auto lookup = [&](const char* name, bool required) {
      for (std::size_t i = 0; i < fields_.size(); ++i) {
        if (fields_[i] == name) return static_cast<int>(i);
      }
      if (required) {
        throw ParseError(source_name(),
                         std::string("missing csv column: ") + name);
      }
      return -1;
    };

    col_.channel = lookup("ChannelNo", true);
    col_.seq = lookup("ApplSeqNum", true);
    col_.price = lookup("Price", true);
    col_.transact_time = lookup("TransactTime", true);
    col_.sending_time = lookup("SendingTime", true);
    if (family_ == SourceFamily::OrderStream) {
      col_.side = lookup("Side", true);
      col_.order_qty = lookup("OrderQty", true);
      col_.ord_type = lookup("OrdType", true);
    } else {
      col_.bid_seq = lookup("BidApplSeqNum", true);
      col_.offer_seq = lookup("OfferApplSeqNum", true);
      col_.qty = lookup("Qty", true);
      col_.amt = lookup("Amt", true);
      col_.exec_type = lookup("ExecType", true);
    }
    return;
  }
  // no header at all: an empty source
}

bool RecordNormalizer::next(Event& ev) {
  if (!have_header_) read_header();
  if (header_width_ == 0) return false;

  while (true) {
    // rows dropped by the channel filter do not use up the cap
    if (opts_.limit_rows && rows_read_ - rows_filtered_ >= opts_.limit_rows) {
      return false;
    }
    if (!src_->next_line(line_)) return false;
    if (is_blank_line(line_)) continue;
    ++rows_read_;

    split_csv_line(line_, fields_);
    if (fields_.size() < header_width_) {
      throw ParseError(source_name(),
                       "row " + std::to_string(rows_read_) + " has " +
                           std::to_string(fields_.size()) + " fields, header has " +
                           std::to_string(header_width_));
    }

    int32_t channel = 0;
    if (!parse_int32(field(col_.channel), channel)) {
      throw ParseError(source_name(), "bad ChannelNo '" +
                                          field(col_.channel) + "' at row " +
                                          std::to_string(rows_read_));
    }
    if (opts_.only_channel && channel != *opts_.only_channel) {
      ++rows_filtered_;
      continue;
    }

    Event e;
    e.channel = channel;
    e.sequence = required_int64(col_.seq, "ApplSeqNum");
    e.symbol = symbol_;
    e.price = required_double(col_.price, "Price");
    e.transact_time = required_int64(col_.transact_time, "TransactTime");
    e.sending_time = required_int64(col_.sending_time, "SendingTime");
    e.source_family = family_;
    if (family_ == SourceFamily::OrderStream) {
      map_order_row(e);
    } else {
      map_tick_row(e);
    }
    ev = std::move(e);
    return true;
  }
}

void RecordNormalizer::map_order_row(Event& ev) {
  // an order is identified by its own sequence number
  ev.kind = EventKind::Order;
  ev.order_id = ev.sequence;
  ev.side = optional_text(col_.side);
  ev.quantity = required_int64(col_.order_qty, "OrderQty");
  ev.order_type = optional_text(col_.ord_type);
}

void RecordNormalizer::map_tick_row(Event& ev) {
  const std::string& exec = field(col_.exec_type);
  ev.kind = kind_from_exec_type(exec);
  ev.exec_type = optional_text(col_.exec_type);
  ev.bid_order_id = optional_int64(col_.bid_seq, "BidApplSeqNum");
  ev.offer_order_id = optional_int64(col_.offer_seq, "OfferApplSeqNum");
  ev.quantity = required_int64(col_.qty, "Qty");
  ev.amount = optional_double(col_.amt, "Amt");
}

const std::string& RecordNormalizer::field(int idx) const {
  if (idx < 0 || static_cast<std::size_t>(idx) >= fields_.size()) return kEmpty;
  return fields_[static_cast<std::size_t>(idx)];
}

int64_t RecordNormalizer::required_int64(int idx, const char* column) const {
  int64_t v = 0;
  if (!parse_int64(field(idx), v)) {
    throw ParseError(source_name(), std::string("bad ") + column + " '" +
                                        field(idx) + "' at row " +
                                        std::to_string(rows_read_));
  }
  return v;
}

double RecordNormalizer::required_double(int idx, const char* column) const {
  double v = 0.0;
  if (!parse_double(field(idx), v)) {
    throw ParseError(source_name(), std::string("bad ") + column + " '" +
                                        field(idx) + "' at row " +
                                        std::to_string(rows_read_));
  }
  return v;
}

std::optional<int64_t> RecordNormalizer::optional_int64(
    int idx, const char* column) const {
  if (field(idx).empty()) return std::nullopt;
  return required_int64(idx, column);
}

std::optional<double> RecordNormalizer::optional_double(
    int idx, const char* column) const {
  if (field(idx).empty()) return std::nullopt;
  return required_double(idx, column);
}

std::optional<std::string> RecordNormalizer::optional_text(int idx) const {
  const std::string& f = field(idx);
  if (f.empty()) return std::nullopt;
  return f;
}

}  // namespace l3merge
