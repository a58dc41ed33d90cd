#include "l3merge/source.hpp"

#include <algorithm>
#include <cstring>
#include <regex>
#include <system_error>

#include "l3merge/errors.hpp"

namespace fs = std::filesystem;

namespace l3merge {

GzLineSource::GzLineSource(const fs::path& p) : name_(p.string()) {
  f_ = gzopen(name_.c_str(), "rb");
  if (!f_) throw SourceAccessError("open source failed: " + name_);
  gzbuffer(f_, 1 << 20);
  buf_.resize(1 << 16);
}

GzLineSource::~GzLineSource() {
  if (f_) gzclose(f_);
}

bool GzLineSource::next_line(std::string& out) {
  out.clear();
  for (;;) {
    char* r = gzgets(f_, buf_.data(), static_cast<int>(buf_.size()));
    if (!r) {
      int errnum = Z_OK;
      const char* msg = gzerror(f_, &errnum);
      if (errnum != Z_OK && errnum != Z_STREAM_END) {
        throw SourceAccessError("read failed: " + name_ + ": " + msg);
      }
      return !out.empty();
    }
    std::size_t n = std::strlen(r);
    if (n && r[n - 1] == '\n') {
      out.append(r, n - 1);
      return true;
    }
    out.append(r, n);
  }
}

std::optional<std::string> symbol_from_entry_name(const std::string& fname) {
  auto ends_with = [&](const std::string& suf) {
    return fname.size() > suf.size() &&
           fname.compare(fname.size() - suf.size(), suf.size(), suf) == 0;
  };
  if (fname.empty() || fname[0] == '.') return std::nullopt;
  if (ends_with(".csv.gz")) return fname.substr(0, fname.size() - 7);
  if (ends_with(".csv")) return fname.substr(0, fname.size() - 4);
  return std::nullopt;
}

SourceCatalog::SourceCatalog(fs::path root, SourceFamily family)
    : root_(std::move(root)), family_(family) {}

std::vector<SourceEntry> SourceCatalog::list(const std::string& symbol_regex,
                                             std::size_t limit_files) const {
  std::error_code ec;
  if (root_.empty() || !fs::is_directory(root_, ec)) {
    throw SourceAccessError(std::string(to_string(family_)) +
                            " source root is not a directory: " +
                            root_.string());
  }

  std::optional<std::regex> pattern;
  if (!symbol_regex.empty()) {
    try {
      pattern.emplace(symbol_regex);
    } catch (const std::regex_error& e) {
      throw ConfigurationError("invalid symbol regex '" + symbol_regex +
                               "': " + e.what());
    }
  }

  std::vector<SourceEntry> v;
  fs::recursive_directory_iterator it(root_, ec), end;
  if (ec) {
    throw SourceAccessError("list " + root_.string() + " failed: " +
                            ec.message());
  }
  for (; it != end; it.increment(ec)) {
    if (ec) {
      throw SourceAccessError("list " + root_.string() + " failed: " +
                              ec.message());
    }
    if (!it->is_regular_file()) continue;
    auto sym = symbol_from_entry_name(it->path().filename().string());
    if (!sym) continue;
    if (pattern && !std::regex_search(*sym, *pattern)) continue;
    v.push_back(SourceEntry{it->path(), *sym, family_});
  }

  std::sort(v.begin(), v.end(), [&](const SourceEntry& a, const SourceEntry& b) {
    return a.path.lexically_relative(root_) < b.path.lexically_relative(root_);
  });
  if (limit_files && v.size() > limit_files) v.resize(limit_files);
  return v;
}

std::unique_ptr<LineSource> SourceCatalog::open(const SourceEntry& entry) {
  return std::make_unique<GzLineSource>(entry.path);
}

}  // namespace l3merge
