#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <vector>

#include "l3merge/channel_partitioner.hpp"
#include "l3merge/event_files.hpp"
#include "l3merge/merge_config.hpp"

namespace l3merge {

struct FamilyCounts {
  std::size_t listed = 0;  // entries normalized (regex, then limit_files)
  std::size_t empty = 0;   // sources that produced no events
  std::size_t kept = 0;    // sources that went into a merge group
  uint64_t events = 0;
};

struct RunSummary {
  FamilyCounts order;
  FamilyCounts tick;
  std::vector<SourceOutcome> sources;  // order sources, then tick sources
  std::vector<GroupResult> groups;
  uint64_t events = 0;                 // rows in successful outputs
  std::filesystem::path work_dir;
};

// Source catalogs -> event files -> merge groups -> output artifacts.
class Pipeline {
 public:
  explicit Pipeline(MergeConfig cfg);

  // Validates the config, then runs every stage. Throws the first source
  // failure, or a MergeIOError naming the failed groups once all groups have
  // run. A temporary work dir is removed on every exit unless keep_work.
  RunSummary run();

  const MergeConfig& config() const { return cfg_; }

 private:
  std::filesystem::path prepare_work_dir();
  void write_manifest(const RunSummary& s) const;

  MergeConfig cfg_;
  bool owns_work_dir_ = false;
};

nlohmann::json summary_to_json(const MergeConfig& cfg, const RunSummary& s);

}  // namespace l3merge
