#include "l3merge/channel_partitioner.hpp"

#include <iostream>
#include <map>
#include <sstream>
#include <system_error>

#include "l3merge/errors.hpp"
#include "l3merge/event_parquet_writer.hpp"
#include "l3merge/worker_pool.hpp"

namespace fs = std::filesystem;

namespace l3merge {

fs::path channel_file_name(int32_t channel) {
  return fs::path("channel_" + std::to_string(channel) + ".csv");
}

ChannelPartitioner::ChannelPartitioner(PartitionOptions opts)
    : opts_(std::move(opts)) {}

std::vector<MergeGroup> ChannelPartitioner::plan(
    const std::vector<SourceOutcome>& sources) const {
  std::vector<MergeGroup> groups;

  if (opts_.mode == OutputMode::Combined) {
    MergeGroup g;
    g.label = "all";
    g.output = opts_.out_path;
    for (const auto& s : sources) {
      if (!s.channel) continue;
      g.inputs.push_back(s.path);
      g.expected_events += s.events;
    }
    if (!g.inputs.empty()) groups.push_back(std::move(g));
    return groups;
  }

  std::map<int32_t, MergeGroup> by_channel;
  for (const auto& s : sources) {
    if (!s.channel) continue;
    auto [it, inserted] = by_channel.try_emplace(*s.channel);
    MergeGroup& g = it->second;
    if (inserted) {
      g.label = "channel_" + std::to_string(*s.channel);
      g.channel = *s.channel;
      g.output = opts_.out_dir / channel_file_name(*s.channel);
    }
    g.inputs.push_back(s.path);
    g.expected_events += s.events;
  }
  groups.reserve(by_channel.size());
  for (auto& [ch, g] : by_channel) groups.push_back(std::move(g));
  return groups;
}

GroupResult ChannelPartitioner::run_group(const MergeGroup& group) const {
  GroupResult r;
  r.group = group;

  try {
    if (group.output.has_parent_path()) {
      fs::create_directories(group.output.parent_path());
    }

    MergeOptions mo;
    mo.max_open = opts_.max_open;
    mo.workers = opts_.merge_workers;
    mo.scratch_dir = opts_.scratch_dir.empty()
                         ? fs::path{}
                         : opts_.scratch_dir / group.label;
    KWayMerger merger(mo);
    r.stats = merger.merge(group.inputs, group.output);

    if (r.stats.rounds > 0 && r.stats.events != group.expected_events) {
      std::error_code ec;
      fs::remove(group.output, ec);
      throw MergeIOError("merged " + std::to_string(r.stats.events) +
                         " events, expected " +
                         std::to_string(group.expected_events));
    }
    r.stats.events = group.expected_events;

    if (opts_.parquet) {
      fs::path pq = group.output;
      pq.replace_extension(".parquet");
      try {
        export_parquet(group.output, pq);
      } catch (...) {
        std::error_code ec;
        fs::remove(group.output, ec);
        throw;
      }
      r.parquet = pq;
    }
    r.ok = true;
  } catch (const std::exception& e) {
    r.ok = false;
    r.error = e.what();
  }

  std::ostringstream msg;
  msg << "[partition] " << group.label << " inputs=" << group.inputs.size()
      << " rounds=" << r.stats.rounds;
  if (r.ok) {
    msg << " events=" << r.stats.events << " -> " << group.output.string();
  } else {
    msg << " FAILED: " << r.error;
  }
  msg << "\n";
  std::cerr << msg.str();
  return r;
}

std::vector<GroupResult> ChannelPartitioner::run(
    const std::vector<MergeGroup>& groups) const {
  std::vector<GroupResult> results(groups.size());
  run_indexed(groups.size(), opts_.workers,
              [&](std::size_t i) { results[i] = run_group(groups[i]); });
  return results;
}

}  // namespace l3merge
