#pragma once
#include <zlib.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "l3merge/event_types.hpp"

namespace l3merge {

// Ordered producer of raw text lines for one symbol.
class LineSource {
 public:
  virtual ~LineSource() = default;

  // Reads the next line without its terminator. Returns false at end.
  virtual bool next_line(std::string& out) = 0;

  // Identity used in diagnostics (usually the entry path).
  virtual const std::string& name() const = 0;
};

// zlib-backed reader; gzopen reads gzip and plain files alike.
class GzLineSource final : public LineSource {
 public:
  explicit GzLineSource(const std::filesystem::path& p);
  ~GzLineSource() override;

  GzLineSource(const GzLineSource&) = delete;
  GzLineSource& operator=(const GzLineSource&) = delete;

  bool next_line(std::string& out) override;
  const std::string& name() const override { return name_; }

 private:
  gzFile f_{nullptr};
  std::string name_;
  std::string buf_;
};

// Lines held in memory, for embedding callers and tests.
class MemoryLineSource final : public LineSource {
 public:
  MemoryLineSource(std::string name, std::vector<std::string> lines)
      : name_(std::move(name)), lines_(std::move(lines)) {}

  bool next_line(std::string& out) override {
    if (pos_ >= lines_.size()) return false;
    out = lines_[pos_++];
    return true;
  }
  const std::string& name() const override { return name_; }

 private:
  std::string name_;
  std::vector<std::string> lines_;
  std::size_t pos_ = 0;
};

// One per-symbol entry of an extracted archive.
struct SourceEntry {
  std::filesystem::path path;
  std::string symbol;
  SourceFamily family = SourceFamily::OrderStream;
};

// Strip ".csv" / ".csv.gz" from a file name. Returns nullopt for other files.
std::optional<std::string> symbol_from_entry_name(const std::string& fname);

// Lists the per-symbol CSV entries below one source root.
class SourceCatalog {
 public:
  SourceCatalog(std::filesystem::path root, SourceFamily family);

  // Entries sorted by relative path, filtered by symbol regex and capped at
  // limit_files (0 = all). Throws SourceAccessError if the root is unusable.
  std::vector<SourceEntry> list(const std::string& symbol_regex = {},
                                std::size_t limit_files = 0) const;

  static std::unique_ptr<LineSource> open(const SourceEntry& entry);

  const std::filesystem::path& root() const { return root_; }
  SourceFamily family() const { return family_; }

 private:
  std::filesystem::path root_;
  SourceFamily family_;
};

}  // namespace l3merge
