#include "l3merge/kway_merger.hpp"

#include <algorithm>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <queue>
#include <sstream>
#include <string>
#include <system_error>
#include <tuple>

#include "l3merge/errors.hpp"
#include "l3merge/event_csv.hpp"
#include "l3merge/worker_pool.hpp"

namespace fs = std::filesystem;

namespace l3merge {

namespace {

// Holds one input open and remembers its next (channel, sequence) key.
class MergeCursor {
 public:
  MergeCursor(const fs::path& p, std::size_t index,
              std::atomic<std::size_t>& open_now,
              std::atomic<std::size_t>& peak)
      : path_(p), index_(index), buf_(1 << 16), open_now_(open_now) {
    in_.rdbuf()->pubsetbuf(buf_.data(), static_cast<std::streamsize>(buf_.size()));
    in_.open(p, std::ios::binary);
    if (!in_) throw MergeIOError("cannot open event file: " + p.string());
    if (!std::getline(in_, header_)) {
      throw MergeIOError("missing header in event file: " + p.string());
    }

    std::size_t now = open_now_.fetch_add(1) + 1;
    std::size_t prev = peak.load();
    while (now > prev && !peak.compare_exchange_weak(prev, now)) {
    }
  }

  ~MergeCursor() { open_now_.fetch_sub(1); }

  MergeCursor(const MergeCursor&) = delete;
  MergeCursor& operator=(const MergeCursor&) = delete;

  // Loads the next row; false at end of file.
  bool advance() {
    while (std::getline(in_, line_)) {
      if (line_.empty()) continue;
      int32_t ch = 0;
      int64_t seq = 0;
      if (!parse_event_key(line_, ch, seq)) {
        throw MergeIOError("bad event row in " + path_.string() + ": " +
                           line_.substr(0, 64));
      }
      if (have_key_ && std::tie(ch, seq) < std::tie(channel_, sequence_)) {
        throw MergeIOError("input not sorted: " + path_.string() + " key (" +
                           std::to_string(ch) + "," + std::to_string(seq) +
                           ") after (" + std::to_string(channel_) + "," +
                           std::to_string(sequence_) + ")");
      }
      channel_ = ch;
      sequence_ = seq;
      have_key_ = true;
      return true;
    }
    if (in_.bad()) throw MergeIOError("read failed: " + path_.string());
    return false;
  }

  const std::string& header() const { return header_; }
  const std::string& line() const { return line_; }
  const fs::path& path() const { return path_; }
  int32_t channel() const { return channel_; }
  int64_t sequence() const { return sequence_; }
  std::size_t index() const { return index_; }

 private:
  fs::path path_;
  std::size_t index_;
  std::vector<char> buf_;
  std::ifstream in_;
  std::string header_;
  std::string line_;
  int32_t channel_ = 0;
  int64_t sequence_ = 0;
  bool have_key_ = false;
  std::atomic<std::size_t>& open_now_;
};

// (channel, sequence, input index): the index makes the order total.
struct HeapKey {
  int32_t channel;
  int64_t sequence;
  std::size_t index;

  bool operator>(const HeapKey& o) const {
    return std::tie(channel, sequence, index) >
           std::tie(o.channel, o.sequence, o.index);
  }
};

// Removes a partially written file unless released.
struct PartialFileGuard {
  fs::path path;
  bool armed = true;
  ~PartialFileGuard() {
    if (armed) {
      std::error_code ec;
      fs::remove(path, ec);
    }
  }
};

struct RoundInput {
  fs::path path;
  bool owned = false;  // round file created by this merge
};

}  // namespace

KWayMerger::KWayMerger(MergeOptions opts)
    : opts_(std::move(opts)), max_open_(std::max<std::size_t>(2, opts_.max_open)) {}

uint64_t KWayMerger::merge_batch(const std::vector<fs::path>& inputs,
                                 const fs::path& output) {
  if (inputs.size() > max_open_) {
    throw MergeIOError("batch of " + std::to_string(inputs.size()) +
                       " files exceeds handle budget " +
                       std::to_string(max_open_));
  }

  PartialFileGuard guard{output};
  std::vector<char> obuf(1 << 20);
  std::ofstream out;
  out.rdbuf()->pubsetbuf(obuf.data(), static_cast<std::streamsize>(obuf.size()));
  out.open(output, std::ios::binary | std::ios::trunc);
  if (!out) throw MergeIOError("cannot open merge output: " + output.string());

  uint64_t rows = 0;
  {
    std::vector<std::unique_ptr<MergeCursor>> cursors;
    cursors.reserve(inputs.size());
    std::priority_queue<HeapKey, std::vector<HeapKey>, std::greater<HeapKey>>
        heap;

    for (std::size_t i = 0; i < inputs.size(); ++i) {
      cursors.push_back(
          std::make_unique<MergeCursor>(inputs[i], i, open_now_, peak_open_));
      MergeCursor& c = *cursors.back();
      if (c.header() != cursors.front()->header()) {
        throw MergeIOError("header mismatch in " + inputs[i].string());
      }
      if (c.advance()) heap.push(HeapKey{c.channel(), c.sequence(), i});
    }

    if (!cursors.empty()) out << cursors.front()->header() << '\n';

    while (!heap.empty()) {
      HeapKey top = heap.top();
      heap.pop();
      MergeCursor& c = *cursors[top.index];
      out.write(c.line().data(), static_cast<std::streamsize>(c.line().size()));
      out.put('\n');
      ++rows;
      if (c.advance()) heap.push(HeapKey{c.channel(), c.sequence(), top.index});
    }
  }

  out.flush();
  if (!out) throw MergeIOError("write failed: " + output.string());
  out.close();
  if (out.fail()) throw MergeIOError("close failed: " + output.string());
  guard.armed = false;
  return rows;
}

MergeStats KWayMerger::merge(const std::vector<fs::path>& inputs,
                             const fs::path& output) {
  if (inputs.empty()) {
    throw MergeIOError("nothing to merge into " + output.string());
  }

  MergeStats stats;
  stats.inputs = inputs.size();
  peak_open_ = 0;

  if (inputs.size() == 1) {
    move_file(inputs.front(), output);
    return stats;
  }

  const fs::path scratch =
      opts_.scratch_dir.empty() ? output.parent_path() : opts_.scratch_dir;
  if (!scratch.empty()) fs::create_directories(scratch);
  const std::string stem = output.filename().string();

  std::vector<RoundInput> paths;
  paths.reserve(inputs.size());
  for (const auto& p : inputs) paths.push_back(RoundInput{p, false});

  int round = 0;
  while (paths.size() > 1) {
    const std::size_t nb = (paths.size() + max_open_ - 1) / max_open_;
    std::vector<RoundInput> next(nb);

    {
      std::ostringstream msg;
      msg << "[merge] " << stem << " round " << round << ": " << paths.size()
          << " files -> " << nb << " batch(es)\n";
      std::cerr << msg.str();
    }

    run_indexed(nb, opts_.workers, [&](std::size_t b) {
      const std::size_t start = b * max_open_;
      const std::size_t end = std::min(start + max_open_, paths.size());
      if (end - start == 1) {
        next[b] = paths[start];
        return;
      }

      std::vector<fs::path> batch;
      batch.reserve(end - start);
      for (std::size_t i = start; i < end; ++i) batch.push_back(paths[i].path);

      fs::path out = scratch / (stem + ".merge_" + std::to_string(round) +
                                "_" + std::to_string(b) + ".tmp");
      uint64_t rows = merge_batch(batch, out);
      next[b] = RoundInput{out, true};
      if (nb == 1) stats.events = rows;

      for (std::size_t i = start; i < end; ++i) {
        if (!paths[i].owned) continue;
        std::error_code ec;
        fs::remove(paths[i].path, ec);
      }
    });

    paths = std::move(next);
    ++round;
  }

  move_file(paths.front().path, output);
  stats.rounds = round;
  stats.peak_open = peak_open_.load();
  return stats;
}

void move_file(const fs::path& from, const fs::path& to) {
  std::error_code ec;
  fs::rename(from, to, ec);
  if (!ec) return;

  // cross-device: copy then remove, never leaving a partial target
  try {
    fs::copy_file(from, to, fs::copy_options::overwrite_existing);
  } catch (const fs::filesystem_error& e) {
    std::error_code rm;
    fs::remove(to, rm);
    throw MergeIOError("move " + from.string() + " -> " + to.string() +
                       " failed: " + e.what());
  }
  fs::remove(from, ec);
}

}  // namespace l3merge
