#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace l3merge {

struct TimingEntry {
  std::string name;
  std::chrono::steady_clock::duration duration;
  uint64_t events = 0;  // 0 when the step has no natural row count
};

class TimingRegistry {
 public:
  static TimingRegistry& Instance();

  void Add(std::string name, std::chrono::steady_clock::duration d,
           uint64_t events = 0);

  std::vector<TimingEntry> Entries() const;
  void Clear();

 private:
  TimingRegistry() = default;

  mutable std::mutex mu_;
  std::vector<TimingEntry> entries_;
};

class ScopeTimer {
 public:
  explicit ScopeTimer(std::string name)
      : name_(std::move(name)),
        start_(std::chrono::steady_clock::now()) {}

  ~ScopeTimer() {
    const auto end = std::chrono::steady_clock::now();
    TimingRegistry::Instance().Add(name_, end - start_, events_);
  }

  // Rows handled inside the scope, reported as events/s.
  void set_events(uint64_t n) { events_ = n; }

 private:
  std::string name_;
  std::chrono::steady_clock::time_point start_;
  uint64_t events_ = 0;
};

#define L3MERGE_TIMER_CAT2(a, b) a##b
#define L3MERGE_TIMER_CAT(a, b) L3MERGE_TIMER_CAT2(a, b)

/// Helper macro so you can write: L3MERGE_SCOPE_TIMER("step_name");
#define L3MERGE_SCOPE_TIMER(label) \
  ::l3merge::ScopeTimer L3MERGE_TIMER_CAT(l3merge_scope_timer_, __LINE__)(label)

/// Append a timing report for the current run to a log file.
void WriteTimingReport(const std::string& out_path,
                       const std::string& program_name,
                       const std::vector<std::string>& args,
                       bool append = true);

}  // namespace l3merge
