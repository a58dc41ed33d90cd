#pragma once
#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "l3merge/channel_partitioner.hpp"

namespace l3merge {

// Worker default: one per hardware thread.
int default_workers();

struct MergeConfig {
  // Extracted order / tick archives: per-symbol .csv or .csv.gz entries
  std::string order_root;
  std::string tick_root;

  // Exactly one of these selects the output mode
  std::string out_path;  // single combined file
  std::string out_dir;   // one channel_<N>.csv per channel

  // Intermediate files. Empty: a fresh temp dir, removed unless keep_work.
  std::string work_dir;
  bool keep_work = false;

  // Handle budget per merge batch; values below 2 are raised to 2
  std::size_t max_open = 64;

  // Sampling aids: entries per family, rows per source (0 = no cap)
  std::size_t limit_files = 0;
  uint64_t limit_rows = 0;

  std::string symbol_regex;
  std::optional<int32_t> channel;

  int workers = default_workers();
  int merge_workers = 1;

  // Also write <output>.parquet next to every merged CSV
  bool parquet = false;

  std::string manifest_path;
  std::string timing_log;
  uint64_t log_every_rows = 5'000'000;

  OutputMode output_mode() const {
    return out_dir.empty() ? OutputMode::Combined : OutputMode::PerChannel;
  }

  // Throws ConfigurationError. Clamps max_open.
  void validate();
};

// Overlay the keys of a flat JSON object onto `base`. Unknown keys and
// wrongly typed values are ConfigurationErrors.
MergeConfig config_from_json(const nlohmann::json& j, MergeConfig base = {});
MergeConfig load_config_file(const std::string& path, MergeConfig base = {});
nlohmann::json config_to_json(const MergeConfig& cfg);

}  // namespace l3merge
