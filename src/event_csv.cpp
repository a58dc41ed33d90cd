#include "l3merge/event_csv.hpp"

#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <system_error>

#include "l3merge/errors.hpp"

namespace l3merge {

namespace {

bool is_blank(char c) { return c == ' ' || c == '\t'; }

std::string_view trim(std::string_view s) {
  while (!s.empty() && is_blank(s.front())) s.remove_prefix(1);
  while (!s.empty() && is_blank(s.back())) s.remove_suffix(1);
  return s;
}

void append_text(std::string& out, std::string_view s) {
  bool needs_quotes = s.find_first_of(",\"\r\n") != std::string_view::npos;
  if (!needs_quotes) {
    out.append(s);
    return;
  }
  out.push_back('"');
  for (char c : s) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
}

template <typename T>
void append_number(std::string& out, T v) {
  char buf[32];
  auto r = std::to_chars(buf, buf + sizeof(buf), v);
  out.append(buf, r.ptr);
}

template <typename T>
void append_opt(std::string& out, const std::optional<T>& v) {
  if (v) append_number(out, *v);
}

void append_opt(std::string& out, const std::optional<std::string>& v) {
  if (v) append_text(out, *v);
}

bool opt_int64(std::string_view s, std::optional<int64_t>& out) {
  if (s.empty()) {
    out.reset();
    return true;
  }
  int64_t v = 0;
  if (!parse_int64(s, v)) return false;
  out = v;
  return true;
}

bool opt_double(std::string_view s, std::optional<double>& out) {
  if (s.empty()) {
    out.reset();
    return true;
  }
  double v = 0.0;
  if (!parse_double(s, v)) return false;
  out = v;
  return true;
}

std::optional<std::string> opt_text(const std::string& s) {
  if (s.empty()) return std::nullopt;
  return s;
}

}  // namespace

std::optional<EventKind> parse_event_kind(std::string_view s) {
  if (s == "ORDER") return EventKind::Order;
  if (s == "TRADE") return EventKind::Trade;
  if (s == "CANCEL") return EventKind::Cancel;
  if (s == "TICK") return EventKind::Tick;
  return std::nullopt;
}

std::optional<SourceFamily> parse_source_family(std::string_view s) {
  if (s == "order") return SourceFamily::OrderStream;
  if (s == "tick") return SourceFamily::TickStream;
  return std::nullopt;
}

void split_csv_line(std::string_view line, std::vector<std::string>& out) {
  out.clear();
  if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

  std::string field;
  bool quoted = false;     // inside a quoted section
  bool was_quoted = false; // field had quotes, keep blanks verbatim
  for (std::size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (quoted) {
      if (c == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') {
          field.push_back('"');
          ++i;
        } else {
          quoted = false;
        }
      } else {
        field.push_back(c);
      }
    } else if (c == '"') {
      quoted = true;
      was_quoted = true;
    } else if (c == ',') {
      out.emplace_back(was_quoted ? field : std::string(trim(field)));
      field.clear();
      was_quoted = false;
    } else {
      field.push_back(c);
    }
  }
  out.emplace_back(was_quoted ? field : std::string(trim(field)));
}

bool parse_int32(std::string_view s, int32_t& out) {
  const char* b = s.data();
  const char* e = b + s.size();
  if (b != e && *b == '+') {
    ++b;
    if (b != e && *b == '-') return false;
  }
  auto r = std::from_chars(b, e, out);
  return b != e && r.ec == std::errc() && r.ptr == e;
}

bool parse_int64(std::string_view s, int64_t& out) {
  const char* b = s.data();
  const char* e = b + s.size();
  if (b != e && *b == '+') {
    ++b;
    if (b != e && *b == '-') return false;
  }
  auto r = std::from_chars(b, e, out);
  return b != e && r.ec == std::errc() && r.ptr == e;
}

bool parse_double(std::string_view s, double& out) {
  char buf[64];
  if (s.empty() || s.size() >= sizeof(buf)) return false;
  // plain decimal only: strtod would also take nan, inf and hex floats
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c)) && c != '.' &&
        c != '-' && c != '+' && c != 'e' && c != 'E') {
      return false;
    }
  }
  std::memcpy(buf, s.data(), s.size());
  buf[s.size()] = '\0';
  char* end = nullptr;
  errno = 0;
  double v = std::strtod(buf, &end);
  if (errno != 0 || end != buf + s.size()) return false;
  out = v;
  return true;
}

std::string event_header_line() {
  std::string h;
  for (std::size_t i = 0; i < kEventHeader.size(); ++i) {
    if (i) h.push_back(',');
    h.append(kEventHeader[i]);
  }
  return h;
}

void format_event_row(const Event& ev, std::string& out) {
  out.clear();
  append_number(out, ev.channel);
  out.push_back(',');
  append_number(out, ev.sequence);
  out.push_back(',');
  out.append(to_string(ev.kind));
  out.push_back(',');
  append_text(out, ev.symbol);
  out.push_back(',');
  append_opt(out, ev.order_id);
  out.push_back(',');
  append_opt(out, ev.bid_order_id);
  out.push_back(',');
  append_opt(out, ev.offer_order_id);
  out.push_back(',');
  append_opt(out, ev.side);
  out.push_back(',');
  append_number(out, ev.price);
  out.push_back(',');
  append_number(out, ev.quantity);
  out.push_back(',');
  append_opt(out, ev.amount);
  out.push_back(',');
  append_opt(out, ev.order_type);
  out.push_back(',');
  append_opt(out, ev.exec_type);
  out.push_back(',');
  append_number(out, ev.transact_time);
  out.push_back(',');
  append_number(out, ev.sending_time);
  out.push_back(',');
  out.append(to_string(ev.source_family));
}

bool parse_event_row(std::string_view line, Event& ev) {
  thread_local std::vector<std::string> f;
  split_csv_line(line, f);
  if (f.size() != kEventHeader.size()) return false;

  auto kind = parse_event_kind(f[2]);
  auto family = parse_source_family(f[15]);
  if (!kind || !family) return false;

  Event e;
  e.kind = *kind;
  e.source_family = *family;
  e.symbol = f[3];
  e.side = opt_text(f[7]);
  e.order_type = opt_text(f[11]);
  e.exec_type = opt_text(f[12]);
  if (!parse_int32(f[0], e.channel) || !parse_int64(f[1], e.sequence) ||
      !opt_int64(f[4], e.order_id) || !opt_int64(f[5], e.bid_order_id) ||
      !opt_int64(f[6], e.offer_order_id) || !parse_double(f[8], e.price) ||
      !parse_int64(f[9], e.quantity) || !opt_double(f[10], e.amount) ||
      !parse_int64(f[13], e.transact_time) ||
      !parse_int64(f[14], e.sending_time)) {
    return false;
  }
  ev = std::move(e);
  return true;
}

bool parse_event_key(std::string_view line, int32_t& channel,
                     int64_t& sequence) {
  auto c1 = line.find(',');
  if (c1 == std::string_view::npos) return false;
  auto c2 = line.find(',', c1 + 1);
  std::string_view seq = (c2 == std::string_view::npos)
                             ? line.substr(c1 + 1)
                             : line.substr(c1 + 1, c2 - c1 - 1);
  return parse_int32(line.substr(0, c1), channel) &&
         parse_int64(seq, sequence);
}

EventCsvWriter::EventCsvWriter(const std::filesystem::path& path)
    : path_(path), buf_(1 << 20) {
  out_.rdbuf()->pubsetbuf(buf_.data(), static_cast<std::streamsize>(buf_.size()));
  out_.open(path_, std::ios::binary | std::ios::trunc);
  if (!out_) {
    throw MergeIOError("open event file for write failed: " + path_.string());
  }
  out_ << event_header_line() << '\n';
}

void EventCsvWriter::append(const Event& ev) {
  format_event_row(ev, line_);
  line_.push_back('\n');
  out_.write(line_.data(), static_cast<std::streamsize>(line_.size()));
  ++rows_;
}

void EventCsvWriter::close() {
  if (!out_.is_open()) return;
  out_.flush();
  bool ok = static_cast<bool>(out_);
  out_.close();
  if (!ok || out_.fail()) {
    throw MergeIOError("write failed: " + path_.string());
  }
}

}  // namespace l3merge
