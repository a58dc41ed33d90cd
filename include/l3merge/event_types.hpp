#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace l3merge {

enum class EventKind { Order, Trade, Cancel, Tick };

enum class SourceFamily { OrderStream, TickStream };

// One normalized record from an order or tick stream.
// All events produced from one source share the same channel.
struct Event {
  int32_t channel = 0;   // ChannelNo
  int64_t sequence = 0;  // ApplSeqNum, ordering key within a channel
  EventKind kind = EventKind::Order;
  std::string symbol;    // taken from the source name, not from the row

  std::optional<int64_t> order_id;        // ORDER: equals sequence
  std::optional<int64_t> bid_order_id;    // tick family
  std::optional<int64_t> offer_order_id;  // tick family

  std::optional<std::string> side;        // ORDER only
  double price = 0.0;
  int64_t quantity = 0;
  std::optional<double> amount;           // tick family only
  std::optional<std::string> order_type;  // ORDER only
  std::optional<std::string> exec_type;   // tick family only

  int64_t transact_time = 0;
  int64_t sending_time = 0;

  SourceFamily source_family = SourceFamily::OrderStream;
};

// Canonical header of every event file, in column order.
inline constexpr std::array<std::string_view, 16> kEventHeader = {
    "ChannelNo",    "ApplSeqNum",  "Event",    "Symbol",
    "OrderID",      "BidOrderID",  "OfferOrderID", "Side",
    "Price",        "Qty",         "Amt",      "OrdType",
    "ExecType",     "TransactTime", "SendingTime", "Source",
};

inline const char* to_string(EventKind k) {
  switch (k) {
    case EventKind::Order:
      return "ORDER";
    case EventKind::Trade:
      return "TRADE";
    case EventKind::Cancel:
      return "CANCEL";
    case EventKind::Tick:
      return "TICK";
  }
  return "TICK";
}

inline const char* to_string(SourceFamily f) {
  return f == SourceFamily::OrderStream ? "order" : "tick";
}

std::optional<EventKind> parse_event_kind(std::string_view s);
std::optional<SourceFamily> parse_source_family(std::string_view s);

// "F" is a fill, "4" a cancel; every other code is a generic tick.
inline EventKind kind_from_exec_type(std::string_view exec_type) {
  if (exec_type == "F") return EventKind::Trade;
  if (exec_type == "4") return EventKind::Cancel;
  return EventKind::Tick;
}

}  // namespace l3merge
