#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <system_error>

#include "l3merge/errors.hpp"
#include "l3merge/event_csv.hpp"
#include "l3merge/event_parquet_writer.hpp"

namespace fs = std::filesystem;

namespace l3merge {

uint64_t export_parquet(const fs::path& csv_path, const fs::path& parquet_path) {
  std::ifstream in(csv_path, std::ios::binary);
  if (!in) throw MergeIOError("cannot open merged file: " + csv_path.string());

  std::string line;
  if (!std::getline(in, line) || line != event_header_line()) {
    throw MergeIOError("not a canonical event file: " + csv_path.string());
  }

  // write next to the target, then move into place
  fs::path tmp = parquet_path;
  tmp += ".tmp";
  try {
    EventParquetWriter writer(tmp.string());
    Event ev;
    uint64_t row = 1;
    while (std::getline(in, line)) {
      ++row;
      if (line.empty()) continue;
      if (!parse_event_row(line, ev)) {
        throw MergeIOError("bad event row " + std::to_string(row) + " in " +
                           csv_path.string());
      }
      writer.append(ev);
    }
    if (in.bad()) throw MergeIOError("read failed: " + csv_path.string());
    writer.close();
    fs::rename(tmp, parquet_path);

    std::ostringstream msg;
    msg << "[parquet] " << parquet_path.filename().string()
        << " rows=" << writer.total_rows() << "\n";
    std::cerr << msg.str();
    return writer.total_rows();
  } catch (...) {
    std::error_code ec;
    fs::remove(tmp, ec);
    throw;
  }
}

}  // namespace l3merge
