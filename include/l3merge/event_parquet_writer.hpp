#pragma once

#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "l3merge/arrow_utils.hpp"
#include "l3merge/event_types.hpp"

namespace l3merge {

// Column layout of the Parquet mirror; names follow kEventHeader.
inline std::shared_ptr<arrow::Schema> event_schema() {
  return arrow::schema({
      arrow::field("ChannelNo", arrow::int32(), false),
      arrow::field("ApplSeqNum", arrow::int64(), false),
      arrow::field("Event", arrow::utf8(), false),
      arrow::field("Symbol", arrow::utf8(), false),
      arrow::field("OrderID", arrow::int64()),
      arrow::field("BidOrderID", arrow::int64()),
      arrow::field("OfferOrderID", arrow::int64()),
      arrow::field("Side", arrow::utf8()),
      arrow::field("Price", arrow::float64(), false),
      arrow::field("Qty", arrow::int64(), false),
      arrow::field("Amt", arrow::float64()),
      arrow::field("OrdType", arrow::utf8()),
      arrow::field("ExecType", arrow::utf8()),
      arrow::field("TransactTime", arrow::int64(), false),
      arrow::field("SendingTime", arrow::int64(), false),
      arrow::field("Source", arrow::utf8(), false),
  });
}

// Writes Events into a Parquet file in record batches of BATCH rows.
class EventParquetWriter {
 public:
  explicit EventParquetWriter(const std::string& out_path)
      : schema_(event_schema()) {
    auto of_res = arrow::io::FileOutputStream::Open(out_path);
    if (!of_res.ok()) {
      throw MergeIOError("open output failed: " + of_res.status().ToString());
    }
    out_ = *of_res;

    auto fw_res = parquet::arrow::FileWriter::Open(
        *schema_, arrow::default_memory_pool(), out_);
    if (!fw_res.ok()) {
      throw MergeIOError("create writer failed: " +
                         fw_res.status().ToString());
    }
    writer_ = std::move(fw_res).ValueOrDie();
  }

  void append(const Event& ev) {
    ARROW_OK(channelb_.Append(ev.channel));
    ARROW_OK(seqb_.Append(ev.sequence));
    ARROW_OK(eventb_.Append(std::string_view(to_string(ev.kind))));
    ARROW_OK(symbolb_.Append(ev.symbol));
    append_opt(order_idb_, ev.order_id);
    append_opt(bid_idb_, ev.bid_order_id);
    append_opt(offer_idb_, ev.offer_order_id);
    append_opt(sideb_, ev.side);
    ARROW_OK(priceb_.Append(ev.price));
    ARROW_OK(qtyb_.Append(ev.quantity));
    append_opt(amtb_, ev.amount);
    append_opt(ord_typeb_, ev.order_type);
    append_opt(exec_typeb_, ev.exec_type);
    ARROW_OK(transactb_.Append(ev.transact_time));
    ARROW_OK(sendingb_.Append(ev.sending_time));
    ARROW_OK(sourceb_.Append(std::string_view(to_string(ev.source_family))));

    if (++batch_rows_ >= BATCH) {
      flush_batch();
    }
  }

  void close() {
    flush_batch();
    if (writer_) {
      ARROW_OK(writer_->Close());
      writer_.reset();
    }
    if (out_ && !out_->closed()) {
      ARROW_OK(out_->Close());
    }
  }

  uint64_t total_rows() const { return total_rows_; }

 private:
  template <typename B, typename T>
  static void append_opt(B& b, const std::optional<T>& v) {
    if (v) {
      ARROW_OK(b.Append(*v));
    } else {
      ARROW_OK(b.AppendNull());
    }
  }

  static std::shared_ptr<arrow::Array> finish(arrow::ArrayBuilder& b) {
    std::shared_ptr<arrow::Array> arr;
    ARROW_OK(b.Finish(&arr));
    return arr;
  }

  void flush_batch() {
    if (batch_rows_ == 0) return;

    auto batch = arrow::RecordBatch::Make(
        schema_, batch_rows_,
        {finish(channelb_), finish(seqb_), finish(eventb_), finish(symbolb_),
         finish(order_idb_), finish(bid_idb_), finish(offer_idb_),
         finish(sideb_), finish(priceb_), finish(qtyb_), finish(amtb_),
         finish(ord_typeb_), finish(exec_typeb_), finish(transactb_),
         finish(sendingb_), finish(sourceb_)});

    ARROW_OK(writer_->WriteRecordBatch(*batch));
    total_rows_ += static_cast<uint64_t>(batch_rows_);
    batch_rows_ = 0;
  }

  static constexpr int64_t BATCH = 1'000'000;

  std::shared_ptr<arrow::Schema> schema_;
  std::shared_ptr<arrow::io::FileOutputStream> out_;
  std::unique_ptr<parquet::arrow::FileWriter> writer_;

  arrow::Int32Builder channelb_;
  arrow::Int64Builder seqb_, order_idb_, bid_idb_, offer_idb_, qtyb_,
      transactb_, sendingb_;
  arrow::StringBuilder eventb_, symbolb_, sideb_, ord_typeb_, exec_typeb_,
      sourceb_;
  arrow::DoubleBuilder priceb_, amtb_;

  int64_t batch_rows_ = 0;
  uint64_t total_rows_ = 0;
};

// Converts a merged canonical CSV file into a Parquet file with the
// event_schema() layout. Returns rows written.
uint64_t export_parquet(const std::filesystem::path& csv_path,
                        const std::filesystem::path& parquet_path);

}  // namespace l3merge
