#include "l3merge/pipeline.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <iterator>
#include <random>
#include <sstream>
#include <system_error>

#include "l3merge/errors.hpp"
#include "l3merge/source.hpp"
#include "l3merge/timing.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

namespace l3merge {

namespace {

fs::path unique_temp_dir() {
  std::random_device rd;
  std::mt19937_64 gen(rd() ^ static_cast<uint64_t>(
      std::chrono::steady_clock::now().time_since_epoch().count()));
  const fs::path base = fs::temp_directory_path();
  for (int attempt = 0; attempt < 16; ++attempt) {
    std::ostringstream name;
    name << "l3merge-" << std::hex << gen();
    fs::path p = base / name.str();
    if (fs::create_directory(p)) return p;
  }
  throw MergeIOError("cannot create a work directory under " + base.string());
}

void count_family(const std::vector<SourceOutcome>& outs, FamilyCounts& c) {
  c.listed = outs.size();
  for (const auto& o : outs) {
    if (o.channel) {
      ++c.kept;
      c.events += o.events;
    } else {
      ++c.empty;
    }
  }
}

// Removes a work dir created for this run on every exit, unless kept.
struct WorkDirGuard {
  fs::path path;
  bool remove = false;
  ~WorkDirGuard() {
    if (path.empty()) return;
    if (!remove) {
      std::cerr << "[cfg] work files kept in " << path.string() << "\n";
      return;
    }
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
      std::cerr << "Warning: failed to remove work dir " << path.string()
                << ": " << ec.message() << "\n";
    }
  }
};

json family_to_json(const FamilyCounts& c) {
  return json{{"listed", c.listed},
              {"empty", c.empty},
              {"kept", c.kept},
              {"events", c.events}};
}

}  // namespace

Pipeline::Pipeline(MergeConfig cfg) : cfg_(std::move(cfg)) {}

fs::path Pipeline::prepare_work_dir() {
  if (cfg_.work_dir.empty()) {
    owns_work_dir_ = true;
    return unique_temp_dir();
  }
  fs::path p(cfg_.work_dir);
  fs::create_directories(p);
  return p;
}

RunSummary Pipeline::run() {
  cfg_.validate();

  std::cerr << "[cfg] order_root=" << cfg_.order_root
            << " tick_root=" << cfg_.tick_root
            << (cfg_.output_mode() == OutputMode::Combined
                    ? " out=" + cfg_.out_path
                    : " out_dir=" + cfg_.out_dir)
            << " max_open=" << cfg_.max_open << " workers=" << cfg_.workers
            << " merge_workers=" << cfg_.merge_workers;
  if (!cfg_.symbol_regex.empty()) {
    std::cerr << " symbol_regex=" << cfg_.symbol_regex;
  }
  if (cfg_.channel) std::cerr << " channel=" << *cfg_.channel;
  if (cfg_.limit_files) std::cerr << " limit_files=" << cfg_.limit_files;
  if (cfg_.limit_rows) std::cerr << " limit_rows=" << cfg_.limit_rows;
  std::cerr << "\n";

  RunSummary summary;

  // Catalogs are listed up front so an unusable root fails before any work.
  std::vector<SourceEntry> order_entries;
  std::vector<SourceEntry> tick_entries;
  {
    L3MERGE_SCOPE_TIMER("list_sources");
    order_entries = SourceCatalog(cfg_.order_root, SourceFamily::OrderStream)
                        .list(cfg_.symbol_regex);
    tick_entries = SourceCatalog(cfg_.tick_root, SourceFamily::TickStream)
                       .list(cfg_.symbol_regex);
  }
  std::cerr << "[cfg] sources: order=" << order_entries.size()
            << " tick=" << tick_entries.size() << "\n";

  summary.work_dir = prepare_work_dir();
  WorkDirGuard work_guard{summary.work_dir, owns_work_dir_ && !cfg_.keep_work};
  std::cerr << "[cfg] work_dir=" << summary.work_dir.string() << "\n";

  NormalizeOptions nopts;
  nopts.only_channel = cfg_.channel;
  nopts.limit_rows = cfg_.limit_rows;

  std::vector<SourceOutcome> order_out;
  std::vector<SourceOutcome> tick_out;
  {
    ScopeTimer t("normalize_order");
    order_out = build_event_files(order_entries,
                                  summary.work_dir / "order_events", nopts,
                                  cfg_.workers, cfg_.log_every_rows,
                                  cfg_.limit_files);
    uint64_t n = 0;
    for (const auto& o : order_out) n += o.events;
    t.set_events(n);
  }
  {
    ScopeTimer t("normalize_tick");
    tick_out = build_event_files(tick_entries,
                                 summary.work_dir / "tick_events", nopts,
                                 cfg_.workers, cfg_.log_every_rows,
                                 cfg_.limit_files);
    uint64_t n = 0;
    for (const auto& o : tick_out) n += o.events;
    t.set_events(n);
  }

  count_family(order_out, summary.order);
  count_family(tick_out, summary.tick);

  summary.sources = std::move(order_out);
  summary.sources.insert(summary.sources.end(),
                         std::make_move_iterator(tick_out.begin()),
                         std::make_move_iterator(tick_out.end()));

  if (summary.order.events + summary.tick.events == 0) {
    throw MergeIOError("no event files produced; check filters or input roots");
  }

  PartitionOptions popts;
  popts.mode = cfg_.output_mode();
  popts.out_path = cfg_.out_path;
  popts.out_dir = cfg_.out_dir;
  popts.scratch_dir = summary.work_dir / "merge";
  popts.max_open = cfg_.max_open;
  popts.workers = cfg_.workers;
  popts.merge_workers = cfg_.merge_workers;
  popts.parquet = cfg_.parquet;

  ChannelPartitioner partitioner(popts);
  {
    ScopeTimer t("merge");
    summary.groups = partitioner.run(partitioner.plan(summary.sources));
    uint64_t n = 0;
    for (const auto& g : summary.groups) {
      if (g.ok) n += g.stats.events;
    }
    t.set_events(n);
    summary.events = n;
  }

  if (!cfg_.manifest_path.empty()) write_manifest(summary);

  std::string failed;
  std::size_t n_failed = 0;
  for (const auto& g : summary.groups) {
    if (g.ok) continue;
    ++n_failed;
    if (!failed.empty()) failed += "; ";
    failed += g.group.label + ": " + g.error;
  }
  if (n_failed > 0) {
    throw MergeIOError(std::to_string(n_failed) + " of " +
                       std::to_string(summary.groups.size()) +
                       " merge group(s) failed: " + failed);
  }

  std::cout << "Merged " << summary.events << " events from "
            << summary.order.kept << " order and " << summary.tick.kept
            << " tick sources into " << summary.groups.size()
            << " file(s).\n";
  for (const auto& g : summary.groups) {
    std::cout << "  " << g.group.output.string() << " events="
              << g.stats.events << " rounds=" << g.stats.rounds << "\n";
  }
  return summary;
}

void Pipeline::write_manifest(const RunSummary& s) const {
  fs::path p(cfg_.manifest_path);
  if (p.has_parent_path()) fs::create_directories(p.parent_path());
  std::ofstream out(p);
  if (!out) throw MergeIOError("cannot open manifest: " + p.string());
  out << summary_to_json(cfg_, s).dump(2) << "\n";
  if (!out) throw MergeIOError("failed writing manifest: " + p.string());
  std::cerr << "[cfg] manifest -> " << p.string() << "\n";
}

json summary_to_json(const MergeConfig& cfg, const RunSummary& s) {
  json j;
  j["config"] = config_to_json(cfg);
  j["sources"] = json{{"order", family_to_json(s.order)},
                      {"tick", family_to_json(s.tick)}};

  json groups = json::array();
  for (const auto& g : s.groups) {
    json jg;
    jg["label"] = g.group.label;
    jg["channel"] = g.group.channel ? json(*g.group.channel) : json(nullptr);
    jg["inputs"] = g.group.inputs.size();
    jg["rounds"] = g.stats.rounds;
    jg["events"] = g.stats.events;
    jg["output"] = g.group.output.string();
    jg["ok"] = g.ok;
    if (!g.ok) jg["error"] = g.error;
    if (!g.parquet.empty()) jg["parquet"] = g.parquet.string();
    groups.push_back(std::move(jg));
  }
  j["groups"] = std::move(groups);
  j["events"] = s.events;
  return j;
}

}  // namespace l3merge
