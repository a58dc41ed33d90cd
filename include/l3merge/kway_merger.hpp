#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace l3merge {

struct MergeOptions {
  // Handle budget B: most event files open at once per batch (>= 2).
  std::size_t max_open = 64;

  // Batches of one round merged concurrently. Each holds up to max_open files.
  int workers = 1;

  // Where round files go. Defaults to the output's directory.
  std::filesystem::path scratch_dir;
};

struct MergeStats {
  std::size_t inputs = 0;
  int rounds = 0;             // 0 when a single input was moved into place
  uint64_t events = 0;        // rows written by the last round
  std::size_t peak_open = 0;  // most input files open at the same time
};

// Merges canonical event files, each sorted by (channel, sequence), into one
// file sorted the same way. Equal keys keep the order in which the inputs were
// given, so the result does not depend on max_open.
class KWayMerger {
 public:
  explicit KWayMerger(MergeOptions opts);

  // Multi-round merge of `inputs` into `output`. Round files are removed once
  // consumed; the inputs themselves are left alone, except a single input,
  // which is moved to `output`. The output only appears once complete.
  // Throws MergeIOError.
  MergeStats merge(const std::vector<std::filesystem::path>& inputs,
                   const std::filesystem::path& output);

  // One heap merge over at most max_open inputs. Returns rows written.
  uint64_t merge_batch(const std::vector<std::filesystem::path>& inputs,
                       const std::filesystem::path& output);

  std::size_t max_open() const { return max_open_; }

 private:
  MergeOptions opts_;
  std::size_t max_open_;
  std::atomic<std::size_t> open_now_{0};
  std::atomic<std::size_t> peak_open_{0};
};

// Rename, falling back to copy + remove across file systems.
void move_file(const std::filesystem::path& from,
               const std::filesystem::path& to);

}  // namespace l3merge
