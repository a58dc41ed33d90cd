#pragma once
#include <unistd.h>
#include <zlib.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace l3merge::test_support {

inline constexpr const char* kOrderHeader =
    "ChannelNo,ApplSeqNum,Side,Price,OrderQty,OrdType,TransactTime,"
    "SendingTime";
inline constexpr const char* kTickHeader =
    "ChannelNo,ApplSeqNum,BidApplSeqNum,OfferApplSeqNum,Price,Qty,Amt,"
    "ExecType,TransactTime,SendingTime";

// Fresh directory under the system temp path, removed on destruction.
class TempDir {
 public:
  TempDir() {
    static std::atomic<int> counter{0};
    std::ostringstream name;
    name << "l3merge_test_" << ::getpid() << "_" << counter++;
    path_ = std::filesystem::temp_directory_path() / name.str();
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }
  std::filesystem::path operator/(const std::string& rel) const {
    return path_ / rel;
  }

 private:
  std::filesystem::path path_;
};

inline void write_file(const std::filesystem::path& p,
                       const std::vector<std::string>& lines) {
  if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());
  std::ofstream out(p, std::ios::binary | std::ios::trunc);
  if (!out) throw std::runtime_error("cannot write " + p.string());
  for (const auto& l : lines) out << l << '\n';
}

inline void write_gz_file(const std::filesystem::path& p,
                          const std::vector<std::string>& lines) {
  if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());
  gzFile f = gzopen(p.string().c_str(), "wb");
  if (!f) throw std::runtime_error("cannot write " + p.string());
  for (const auto& l : lines) {
    gzputs(f, l.c_str());
    gzputs(f, "\n");
  }
  gzclose(f);
}

inline std::vector<std::string> read_lines(const std::filesystem::path& p) {
  std::ifstream in(p, std::ios::binary);
  if (!in) throw std::runtime_error("cannot read " + p.string());
  std::vector<std::string> v;
  std::string line;
  while (std::getline(in, line)) v.push_back(line);
  return v;
}

inline std::string read_all(const std::filesystem::path& p) {
  std::ifstream in(p, std::ios::binary);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

// "<channel>,<seq>" prefix of every data row of a canonical event file.
inline std::vector<std::string> keys_of(const std::filesystem::path& p) {
  std::vector<std::string> keys;
  auto lines = read_lines(p);
  for (std::size_t i = 1; i < lines.size(); ++i) {
    const auto& l = lines[i];
    auto c1 = l.find(',');
    auto c2 = l.find(',', c1 + 1);
    keys.push_back(l.substr(0, c2));
  }
  return keys;
}

// Raw order row: ChannelNo,ApplSeqNum,Side,Price,OrderQty,OrdType,...
inline std::string order_row(int channel, long long seq,
                             const std::string& side = "1",
                             const std::string& price = "10.5",
                             const std::string& qty = "100",
                             const std::string& ord_type = "2") {
  std::ostringstream s;
  s << channel << ',' << seq << ',' << side << ',' << price << ',' << qty
    << ',' << ord_type << ",20240105093000000,20240105093000010";
  return s.str();
}

// Raw tick row: ChannelNo,ApplSeqNum,Bid,Offer,Price,Qty,Amt,ExecType,...
inline std::string tick_row(int channel, long long seq,
                            const std::string& exec_type = "F",
                            const std::string& bid = "11",
                            const std::string& offer = "12",
                            const std::string& price = "10.5",
                            const std::string& qty = "200",
                            const std::string& amt = "2100") {
  std::ostringstream s;
  s << channel << ',' << seq << ',' << bid << ',' << offer << ',' << price
    << ',' << qty << ',' << amt << ',' << exec_type
    << ",20240105093000000,20240105093000010";
  return s.str();
}

}  // namespace l3merge::test_support
