#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "l3merge/event_files.hpp"
#include "l3merge/kway_merger.hpp"

namespace l3merge {

enum class OutputMode { Combined, PerChannel };

// Event files that end up in one output artifact.
struct MergeGroup {
  std::string label;              // "all" or "channel_<N>"
  std::optional<int32_t> channel; // set in per-channel mode
  std::vector<std::filesystem::path> inputs;  // in source order
  std::filesystem::path output;
  uint64_t expected_events = 0;
};

struct GroupResult {
  MergeGroup group;
  MergeStats stats;
  bool ok = false;
  std::string error;              // one line, set when !ok
  std::filesystem::path parquet;  // set when a Parquet mirror was written
};

struct PartitionOptions {
  OutputMode mode = OutputMode::Combined;
  std::filesystem::path out_path;     // Combined
  std::filesystem::path out_dir;      // PerChannel
  std::filesystem::path scratch_dir;  // round files, one subdir per group
  std::size_t max_open = 64;
  int workers = 1;        // groups merged concurrently
  int merge_workers = 1;  // batches per round merged concurrently
  bool parquet = false;
};

// "channel_<N>.csv"
std::filesystem::path channel_file_name(int32_t channel);

// Decides how event files are grouped and where each group's merge lands.
class ChannelPartitioner {
 public:
  explicit ChannelPartitioner(PartitionOptions opts);

  // Sources without a channel (no events) are left out. Per-channel groups
  // come in ascending channel order.
  std::vector<MergeGroup> plan(const std::vector<SourceOutcome>& sources) const;

  // Merges every group. A failing group is reported in its GroupResult and
  // leaves no output; the other groups still run and keep their results.
  std::vector<GroupResult> run(const std::vector<MergeGroup>& groups) const;

 private:
  GroupResult run_group(const MergeGroup& group) const;

  PartitionOptions opts_;
};

}  // namespace l3merge
