#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

#include "l3merge/normalizer.hpp"
#include "l3merge/source.hpp"

namespace l3merge {

// What one source turned into after normalization and validation.
struct SourceOutcome {
  SourceEntry entry;
  std::filesystem::path path;      // intermediate event file, empty if none
  std::optional<int32_t> channel;  // nullopt when the source had no events
  uint64_t events = 0;
  uint64_t rows_read = 0;
  uint64_t rows_filtered = 0;
};

// Drains one source through RecordNormalizer and StreamValidator into a
// canonical event file at out_path. A source without events leaves no file.
SourceOutcome build_event_file(std::unique_ptr<LineSource> src,
                               const SourceEntry& entry,
                               const std::filesystem::path& out_path,
                               const NormalizeOptions& opts,
                               uint64_t log_every_rows = 5'000'000);

// "<family>_<index>_<symbol>.events.csv"
std::filesystem::path event_file_name(const SourceEntry& entry,
                                      std::size_t index);

// Builds the event files of the entries on a worker pool. Outcomes keep the
// order of `entries`, and outcome i is always entry i. With keep_sources > 0
// entries are taken in order only until that many sources produced events;
// the outcomes end at that source. The first failure is rethrown after the
// pool drains.
std::vector<SourceOutcome> build_event_files(
    const std::vector<SourceEntry>& entries,
    const std::filesystem::path& out_dir, const NormalizeOptions& opts,
    int workers, uint64_t log_every_rows = 5'000'000,
    std::size_t keep_sources = 0);

}  // namespace l3merge
