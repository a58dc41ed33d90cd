#pragma once
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>

#include <memory>
#include <string>

#include "l3merge/errors.hpp"

namespace l3merge {

// Arrow status -> MergeIOError
inline void ARROW_OK(const arrow::Status& st) {
  if (!st.ok()) throw MergeIOError(st.ToString());
}

inline std::unique_ptr<parquet::arrow::FileReader> open_parquet_reader(
    const std::string& path, std::shared_ptr<arrow::Schema>& out_schema) {
  auto readable_file_result = arrow::io::ReadableFile::Open(path);
  if (!readable_file_result.ok()) {
    throw MergeIOError("open input failed: " +
                       readable_file_result.status().ToString());
  }

  auto parquet_read_result = parquet::arrow::OpenFile(
      *readable_file_result, arrow::default_memory_pool());
  if (!parquet_read_result.ok()) {
    throw MergeIOError("open parquet reader failed: " +
                       parquet_read_result.status().ToString());
  }

  auto reader = std::move(parquet_read_result).ValueOrDie();
  ARROW_OK(reader->GetSchema(&out_schema));
  return reader;
}

}  // namespace l3merge
