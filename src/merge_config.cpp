// merge_config.cpp
//
// Validation of MergeConfig and its flat JSON form (--config files and the
// config echo in the run manifest).

#include "l3merge/merge_config.hpp"

#include <algorithm>
#include <fstream>
#include <regex>
#include <thread>

#include "l3merge/errors.hpp"

using nlohmann::json;

namespace l3merge {

int default_workers() {
  return static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
}

void MergeConfig::validate() {
  if (!out_path.empty() && !out_dir.empty()) {
    throw ConfigurationError("use either --out or --out-dir, not both");
  }
  if (out_path.empty() && out_dir.empty()) {
    throw ConfigurationError(
        "specify --out (single file) or --out-dir (per-channel)");
  }
  if (order_root.empty()) throw ConfigurationError("--order-root required");
  if (tick_root.empty()) throw ConfigurationError("--tick-root required");
  if (workers < 1) throw ConfigurationError("--workers must be >= 1");
  if (merge_workers < 1) {
    throw ConfigurationError("--merge-workers must be >= 1");
  }
  if (!symbol_regex.empty()) {
    try {
      std::regex probe(symbol_regex);
    } catch (const std::regex_error& e) {
      throw ConfigurationError("invalid --symbol-regex '" + symbol_regex +
                               "': " + e.what());
    }
  }
  max_open = std::max<std::size_t>(2, max_open);
}

MergeConfig config_from_json(const json& j, MergeConfig cfg) {
  if (!j.is_object()) {
    throw ConfigurationError("config must be a JSON object");
  }

  try {
    for (const auto& [key, v] : j.items()) {
      if (key == "order_root") cfg.order_root = v.get<std::string>();
      else if (key == "tick_root") cfg.tick_root = v.get<std::string>();
      else if (key == "out") cfg.out_path = v.get<std::string>();
      else if (key == "out_dir") cfg.out_dir = v.get<std::string>();
      else if (key == "work_dir") cfg.work_dir = v.get<std::string>();
      else if (key == "keep_work") cfg.keep_work = v.get<bool>();
      else if (key == "max_open") cfg.max_open = v.get<std::size_t>();
      else if (key == "limit_files") cfg.limit_files = v.get<std::size_t>();
      else if (key == "limit_rows") cfg.limit_rows = v.get<uint64_t>();
      else if (key == "symbol_regex") cfg.symbol_regex = v.get<std::string>();
      else if (key == "channel") {
        if (v.is_null()) cfg.channel.reset();
        else cfg.channel = v.get<int32_t>();
      }
      else if (key == "workers") cfg.workers = v.get<int>();
      else if (key == "merge_workers") cfg.merge_workers = v.get<int>();
      else if (key == "parquet") cfg.parquet = v.get<bool>();
      else if (key == "manifest") cfg.manifest_path = v.get<std::string>();
      else if (key == "timing_log") cfg.timing_log = v.get<std::string>();
      else if (key == "log_every_rows") cfg.log_every_rows = v.get<uint64_t>();
      else throw ConfigurationError("unknown config key: " + key);
    }
  } catch (const json::exception& e) {
    throw ConfigurationError(std::string("bad config value: ") + e.what());
  }
  return cfg;
}

MergeConfig load_config_file(const std::string& path, MergeConfig base) {
  std::ifstream in(path);
  if (!in) throw ConfigurationError("cannot open config: " + path);
  json j;
  try {
    in >> j;
  } catch (const json::parse_error& e) {
    throw ConfigurationError("cannot parse config " + path + ": " + e.what());
  }
  return config_from_json(j, std::move(base));
}

json config_to_json(const MergeConfig& cfg) {
  json j;
  j["order_root"] = cfg.order_root;
  j["tick_root"] = cfg.tick_root;
  j["out"] = cfg.out_path;
  j["out_dir"] = cfg.out_dir;
  j["work_dir"] = cfg.work_dir;
  j["keep_work"] = cfg.keep_work;
  j["max_open"] = cfg.max_open;
  j["limit_files"] = cfg.limit_files;
  j["limit_rows"] = cfg.limit_rows;
  j["symbol_regex"] = cfg.symbol_regex;
  j["channel"] = cfg.channel ? json(*cfg.channel) : json(nullptr);
  j["workers"] = cfg.workers;
  j["merge_workers"] = cfg.merge_workers;
  j["parquet"] = cfg.parquet;
  j["manifest"] = cfg.manifest_path;
  j["timing_log"] = cfg.timing_log;
  j["log_every_rows"] = cfg.log_every_rows;
  return j;
}

}  // namespace l3merge
