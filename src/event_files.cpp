#include "l3merge/event_files.hpp"

#include <algorithm>
#include <cstdio>
#include <iostream>
#include <sstream>
#include <system_error>

#include "l3merge/event_csv.hpp"
#include "l3merge/stream_validator.hpp"
#include "l3merge/worker_pool.hpp"

namespace fs = std::filesystem;

namespace l3merge {

SourceOutcome build_event_file(std::unique_ptr<LineSource> src,
                               const SourceEntry& entry,
                               const fs::path& out_path,
                               const NormalizeOptions& opts,
                               uint64_t log_every_rows) {
  RecordNormalizer norm(std::move(src), entry.family, entry.symbol, opts);
  StreamValidator validator(norm.source_name());
  EventCsvWriter writer(out_path);

  Event ev;
  while (norm.next(ev)) {
    validator.check(ev);
    writer.append(ev);
    if (log_every_rows && (writer.rows() % log_every_rows) == 0) {
      std::ostringstream msg;
      msg << "[normalize] " << entry.symbol << " events=" << writer.rows()
          << "\n";
      std::cerr << msg.str();
    }
  }
  writer.close();

  SourceOutcome out;
  out.entry = entry;
  out.channel = validator.channel();
  out.events = validator.events();
  out.rows_read = norm.rows_read();
  out.rows_filtered = norm.rows_filtered();

  if (out.events == 0) {
    std::error_code ec;
    fs::remove(out_path, ec);
    out.channel.reset();
  } else {
    out.path = out_path;
  }
  return out;
}

fs::path event_file_name(const SourceEntry& entry, std::size_t index) {
  char idx[16];
  std::snprintf(idx, sizeof(idx), "%05zu", index);
  return fs::path(std::string(to_string(entry.family)) + "_" + idx + "_" +
                  entry.symbol + ".events.csv");
}

std::vector<SourceOutcome> build_event_files(
    const std::vector<SourceEntry>& entries, const fs::path& out_dir,
    const NormalizeOptions& opts, int workers, uint64_t log_every_rows,
    std::size_t keep_sources) {
  fs::create_directories(out_dir);
  std::vector<SourceOutcome> outcomes(entries.size());

  auto build_one = [&](std::size_t i) {
    const SourceEntry& e = entries[i];
    fs::path out = out_dir / event_file_name(e, i);
    outcomes[i] = build_event_file(SourceCatalog::open(e), e, out, opts,
                                   log_every_rows);

    std::ostringstream msg;
    msg << "[normalize] " << (i + 1) << "/" << entries.size() << " "
        << to_string(e.family) << " " << e.symbol
        << " rows=" << outcomes[i].rows_read
        << " events=" << outcomes[i].events;
    if (outcomes[i].channel) msg << " channel=" << *outcomes[i].channel;
    else msg << " (empty)";
    msg << "\n";
    std::cerr << msg.str();
  };

  if (keep_sources == 0) {
    run_indexed(entries.size(), workers, build_one);
    return outcomes;
  }

  // Waves of `workers` entries until keep_sources of them produced events.
  const std::size_t wave = static_cast<std::size_t>(std::max(1, workers));
  std::size_t done = 0;
  std::size_t kept = 0;
  while (done < entries.size()) {
    const std::size_t n = std::min(wave, entries.size() - done);
    run_indexed(n, workers, [&](std::size_t k) { build_one(done + k); });

    for (std::size_t i = done; i < done + n; ++i) {
      if (!outcomes[i].channel) continue;
      if (++kept < keep_sources) continue;

      // later entries of this wave are not part of the sample
      for (std::size_t j = i + 1; j < done + n; ++j) {
        if (outcomes[j].path.empty()) continue;
        std::error_code ec;
        fs::remove(outcomes[j].path, ec);
      }
      outcomes.resize(i + 1);
      return outcomes;
    }
    done += n;
  }
  return outcomes;
}

}  // namespace l3merge
