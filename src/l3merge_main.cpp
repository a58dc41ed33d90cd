#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <stdexcept>
#include <iostream>
#include <string>
#include <vector>

#include "l3merge/errors.hpp"
#include "l3merge/merge_config.hpp"
#include "l3merge/pipeline.hpp"
#include "l3merge/timing.hpp"

static void usage_and_exit(const char* argv0) {
  std::fprintf(stderr,
               R"(Usage:
  %s --order-root <dir> --tick-root <dir>
       (--out <merged.csv> | --out-dir <dir>)
       [--config <file.json>] [--work-dir <dir>] [--keep-work]
       [--max-open <n>] [--workers <n>] [--merge-workers <n>]
       [--limit-files <n>] [--limit-rows <n>]
       [--symbol-regex <re>] [--channel <n>]
       [--parquet] [--manifest <file.json>] [--timing-log <file>]
       [--log-every-rows <n>]

Description:
  Rebuilds the exchange event log of one session from per-symbol order and
  tick CSV files (plain or gzip), as found in the extracted order and tick
  archives. Every source is normalized to canonical events:
    - order rows become ORDER events keyed by their ApplSeqNum
    - tick rows become TRADE (ExecType F), CANCEL (ExecType 4) or TICK
  Each source must stay on one ChannelNo with non-decreasing ApplSeqNum.

  The per-source event files are then merged by (ChannelNo, ApplSeqNum),
  ties going to order sources before tick sources, in as many rounds as
  needed so that at most --max-open files (default 64, minimum 2) are
  open per merge batch.

  Output is either one combined CSV (--out) or one channel_<N>.csv per
  channel (--out-dir). Exactly one of the two must be given.

  --config loads a flat JSON object with the same keys as the flags
  (order_root, tick_root, out, out_dir, ...); flags override it.

Example:
  %s --order-root data/raw/20240105/order \
     --tick-root data/raw/20240105/tick \
     --out-dir data/out/20240105 --max-open 128 --workers 8
)",
               argv0, argv0);
  std::exit(2);
}

static long long parse_number(const char* argv0, const std::string& flag,
                              const char* text) {
  try {
    std::size_t pos = 0;
    long long v = std::stoll(text, &pos);
    if (pos != std::string(text).size()) throw std::invalid_argument(text);
    return v;
  } catch (const std::exception&) {
    std::fprintf(stderr, "Invalid value for %s: %s\n", flag.c_str(), text);
    usage_and_exit(argv0);
  }
  return 0;
}

static l3merge::MergeConfig parse_args(int argc, char** argv) {
  l3merge::MergeConfig cfg;

  // --config first, so the remaining flags override the file.
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--config" && i + 1 < argc) {
      cfg = l3merge::load_config_file(argv[i + 1], cfg);
    }
  }

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto next = [&]() -> const char* { return argv[++i]; };
    bool has_value = i + 1 < argc;

    if (a == "--config" && has_value) {
      ++i;
    } else if (a == "--order-root" && has_value) {
      cfg.order_root = next();
    } else if (a == "--tick-root" && has_value) {
      cfg.tick_root = next();
    } else if (a == "--out" && has_value) {
      cfg.out_path = next();
    } else if (a == "--out-dir" && has_value) {
      cfg.out_dir = next();
    } else if (a == "--work-dir" && has_value) {
      cfg.work_dir = next();
    } else if (a == "--keep-work") {
      cfg.keep_work = true;
    } else if (a == "--max-open" && has_value) {
      long long v = parse_number(argv[0], a, next());
      cfg.max_open = v < 0 ? 0 : static_cast<std::size_t>(v);
    } else if (a == "--workers" && has_value) {
      cfg.workers = static_cast<int>(parse_number(argv[0], a, next()));
    } else if (a == "--merge-workers" && has_value) {
      cfg.merge_workers = static_cast<int>(parse_number(argv[0], a, next()));
    } else if (a == "--limit-files" && has_value) {
      long long v = parse_number(argv[0], a, next());
      cfg.limit_files = v < 0 ? 0 : static_cast<std::size_t>(v);
    } else if (a == "--limit-rows" && has_value) {
      long long v = parse_number(argv[0], a, next());
      cfg.limit_rows = v < 0 ? 0 : static_cast<uint64_t>(v);
    } else if (a == "--symbol-regex" && has_value) {
      cfg.symbol_regex = next();
    } else if (a == "--channel" && has_value) {
      cfg.channel = static_cast<int32_t>(parse_number(argv[0], a, next()));
    } else if (a == "--parquet") {
      cfg.parquet = true;
    } else if (a == "--manifest" && has_value) {
      cfg.manifest_path = next();
    } else if (a == "--timing-log" && has_value) {
      cfg.timing_log = next();
    } else if (a == "--log-every-rows" && has_value) {
      long long v = parse_number(argv[0], a, next());
      cfg.log_every_rows = v < 0 ? 0 : static_cast<uint64_t>(v);
    } else if (a == "--help" || a == "-h") {
      usage_and_exit(argv[0]);
    } else {
      std::fprintf(stderr, "Unknown or incomplete arg: %s\n", a.c_str());
      usage_and_exit(argv[0]);
    }
  }
  return cfg;
}

int main(int argc, char** argv) {
  using Clock = std::chrono::steady_clock;
  const auto program_start = Clock::now();

  l3merge::MergeConfig cfg;
  try {
    cfg = parse_args(argc, argv);
    cfg.validate();
  } catch (const l3merge::ConfigurationError& e) {
    std::fprintf(stderr, "Configuration error: %s\n", e.what());
    usage_and_exit(argv[0]);
  }

  try {
    l3merge::Pipeline pipeline(cfg);
    pipeline.run();

    if (!cfg.timing_log.empty()) {
      l3merge::TimingRegistry::Instance().Add("program_wall_clock",
                                              Clock::now() - program_start);
      std::vector<std::string> args;
      args.reserve(static_cast<std::size_t>(argc > 1 ? argc - 1 : 0));
      for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
      }
      l3merge::WriteTimingReport(cfg.timing_log, argv[0], args);
    }
  } catch (const l3merge::ConfigurationError& e) {
    std::fprintf(stderr, "Configuration error: %s\n", e.what());
    return 2;
  } catch (const std::exception& e) {
    std::fprintf(stderr, "FATAL: %s\n", e.what());
    return 1;
  }
  return 0;
}
