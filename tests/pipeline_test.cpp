#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "l3merge/errors.hpp"
#include "l3merge/event_csv.hpp"
#include "l3merge/pipeline.hpp"
#include "test_support.hpp"

using namespace l3merge;
using namespace l3merge::test_support;
namespace fs = std::filesystem;

namespace {

class PipelineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    // channel 1: 600000 and 600001; channel 2: 000001
    write_file(tmp_ / "order/600000.csv",
               {kOrderHeader, order_row(1, 1), order_row(1, 4),
                order_row(1, 6)});
    write_gz_file(tmp_ / "order/600001.csv.gz",
                  {kOrderHeader, order_row(1, 2), order_row(1, 7)});
    write_file(tmp_ / "order/000001.csv",
               {kOrderHeader, order_row(2, 1), order_row(2, 3)});
    write_file(tmp_ / "tick/600000.csv",
               {kTickHeader, tick_row(1, 3, "F"), tick_row(1, 5, "4")});
    write_file(tmp_ / "tick/000001.csv",
               {kTickHeader, tick_row(2, 2, "F"), tick_row(2, 3, "F")});
    write_file(tmp_ / "tick/600001.csv", {kTickHeader});  // no trades
  }

  MergeConfig base() const {
    MergeConfig c;
    c.order_root = (tmp_ / "order").string();
    c.tick_root = (tmp_ / "tick").string();
    c.work_dir = (tmp_ / "work").string();
    c.max_open = 2;
    c.workers = 2;
    return c;
  }

  TempDir tmp_;
};

}  // namespace

TEST_F(PipelineTest, CombinedOutput) {
  MergeConfig c = base();
  c.out_path = (tmp_ / "out/all.csv").string();
  RunSummary s = Pipeline(c).run();

  EXPECT_EQ(s.events, 11u);
  EXPECT_EQ(s.order.listed, 3u);
  EXPECT_EQ(s.tick.listed, 3u);
  EXPECT_EQ(s.tick.empty, 1u);
  EXPECT_EQ(s.tick.kept, 2u);
  ASSERT_EQ(s.groups.size(), 1u);

  EXPECT_EQ(keys_of(c.out_path),
            (std::vector<std::string>{"1,1", "1,2", "1,3", "1,4", "1,5", "1,6",
                                      "1,7", "2,1", "2,2", "2,3", "2,3"}));

  // (2,3) appears in both families; the order event comes first
  auto lines = read_lines(c.out_path);
  EXPECT_EQ(lines[0], event_header_line());
  EXPECT_NE(lines[10].find(",ORDER,000001,"), std::string::npos);
  EXPECT_NE(lines[11].find(",TRADE,000001,"), std::string::npos);
}

TEST_F(PipelineTest, PerChannelOutput) {
  MergeConfig c = base();
  c.out_dir = (tmp_ / "out").string();
  RunSummary s = Pipeline(c).run();

  ASSERT_EQ(s.groups.size(), 2u);
  EXPECT_EQ(keys_of(tmp_ / "out/channel_1.csv"),
            (std::vector<std::string>{"1,1", "1,2", "1,3", "1,4", "1,5", "1,6",
                                      "1,7"}));
  EXPECT_EQ(keys_of(tmp_ / "out/channel_2.csv"),
            (std::vector<std::string>{"2,1", "2,2", "2,3", "2,3"}));
}

TEST_F(PipelineTest, ResultDoesNotDependOnBudgetOrWorkers) {
  MergeConfig small = base();
  small.out_path = (tmp_ / "small.csv").string();
  small.work_dir = (tmp_ / "work_small").string();
  small.max_open = 2;
  small.workers = 1;
  Pipeline(small).run();

  MergeConfig large = base();
  large.out_path = (tmp_ / "large.csv").string();
  large.work_dir = (tmp_ / "work_large").string();
  large.max_open = 64;
  large.workers = 4;
  large.merge_workers = 2;
  Pipeline(large).run();

  EXPECT_EQ(read_all(small.out_path), read_all(large.out_path));
}

TEST_F(PipelineTest, FiltersBySymbolAndChannel) {
  MergeConfig c = base();
  c.out_path = (tmp_ / "f.csv").string();
  c.symbol_regex = "^6000";
  RunSummary s = Pipeline(c).run();
  EXPECT_EQ(keys_of(c.out_path),
            (std::vector<std::string>{"1,1", "1,2", "1,3", "1,4", "1,5", "1,6",
                                      "1,7"}));
  EXPECT_EQ(s.order.listed, 2u);

  MergeConfig ch = base();
  ch.out_path = (tmp_ / "ch.csv").string();
  ch.channel = 2;
  RunSummary s2 = Pipeline(ch).run();
  EXPECT_EQ(s2.events, 4u);
  EXPECT_EQ(s2.order.empty, 2u);
}

TEST_F(PipelineTest, RowAndFileLimits) {
  MergeConfig c = base();
  c.out_path = (tmp_ / "lim.csv").string();
  c.limit_rows = 1;
  c.limit_files = 1;  // 000001 from each family
  RunSummary s = Pipeline(c).run();
  EXPECT_EQ(keys_of(c.out_path), (std::vector<std::string>{"2,1", "2,2"}));
  EXPECT_EQ(s.order.listed, 1u);
  EXPECT_EQ(s.tick.listed, 1u);
}

TEST(PipelineFileLimit, CountsSourcesThatProducedEvents) {
  TempDir tmp;
  write_file(tmp / "order/000001.csv", {kOrderHeader, order_row(1, 1)});
  write_file(tmp / "order/000002.csv",
             {kOrderHeader, order_row(2, 1), order_row(2, 3)});
  write_file(tmp / "order/000003.csv", {kOrderHeader, order_row(2, 2)});
  write_file(tmp / "tick/000002.csv", {kTickHeader, tick_row(2, 2, "F")});

  for (int workers : {1, 2, 4}) {
    MergeConfig c;
    c.order_root = (tmp / "order").string();
    c.tick_root = (tmp / "tick").string();
    c.work_dir = (tmp / ("work" + std::to_string(workers))).string();
    c.out_path = (tmp / ("out" + std::to_string(workers) + ".csv")).string();
    c.workers = workers;
    c.channel = 2;
    c.limit_files = 1;  // 000001 is on channel 1 and must not use it up
    RunSummary s = Pipeline(c).run();

    EXPECT_EQ(keys_of(c.out_path),
              (std::vector<std::string>{"2,1", "2,2", "2,3"}))
        << "workers=" << workers;
    EXPECT_EQ(s.order.kept, 1u);
    EXPECT_EQ(s.order.empty, 1u);
    EXPECT_EQ(s.order.listed, 2u);
    ASSERT_EQ(s.sources.size(), 3u);
    EXPECT_EQ(s.sources[1].entry.symbol, "000002");
  }
}

TEST_F(PipelineTest, NothingSelectedFails) {
  MergeConfig c = base();
  c.out_path = (tmp_ / "none.csv").string();
  c.symbol_regex = "^nomatch$";
  EXPECT_THROW(Pipeline(c).run(), MergeIOError);
  EXPECT_FALSE(fs::exists(c.out_path));
}

TEST_F(PipelineTest, NonMonotonicSourceFailsWithoutOutput) {
  write_file(tmp_ / "tick/600000.csv",
             {kTickHeader, tick_row(1, 5, "F"), tick_row(1, 3, "F")});
  MergeConfig c = base();
  c.out_path = (tmp_ / "bad.csv").string();
  try {
    Pipeline(c).run();
    FAIL() << "expected MonotonicityError";
  } catch (const MonotonicityError& e) {
    EXPECT_NE(e.source().find("600000.csv"), std::string::npos);
    EXPECT_EQ(e.sequence(), 3);
    EXPECT_EQ(e.previous_sequence(), 5);
  }
  EXPECT_FALSE(fs::exists(c.out_path));
}

TEST_F(PipelineTest, MixedChannelSourceFailsWithoutOutput) {
  write_file(tmp_ / "order/600000.csv",
             {kOrderHeader, order_row(1, 1), order_row(2, 2)});
  MergeConfig c = base();
  c.out_dir = (tmp_ / "out").string();
  EXPECT_THROW(Pipeline(c).run(), ChannelConsistencyError);
  EXPECT_FALSE(fs::exists(tmp_ / "out/channel_1.csv"));
  EXPECT_FALSE(fs::exists(tmp_ / "out/channel_2.csv"));
}

TEST_F(PipelineTest, ConfigErrorsComeFirst) {
  MergeConfig both = base();
  both.out_path = (tmp_ / "a.csv").string();
  both.out_dir = (tmp_ / "out").string();
  EXPECT_THROW(Pipeline(both).run(), ConfigurationError);

  MergeConfig neither = base();
  EXPECT_THROW(Pipeline(neither).run(), ConfigurationError);
  EXPECT_FALSE(fs::exists(tmp_ / "work"));
}

TEST_F(PipelineTest, MissingRootIsSourceAccessError) {
  MergeConfig c = base();
  c.tick_root = (tmp_ / "nowhere").string();
  c.out_path = (tmp_ / "x.csv").string();
  EXPECT_THROW(Pipeline(c).run(), SourceAccessError);
}

TEST_F(PipelineTest, ManifestDescribesRun) {
  MergeConfig c = base();
  c.out_dir = (tmp_ / "out").string();
  c.manifest_path = (tmp_ / "manifest.json").string();
  Pipeline(c).run();

  std::ifstream in(c.manifest_path);
  nlohmann::json m = nlohmann::json::parse(in);
  EXPECT_EQ(m["events"].get<uint64_t>(), 11u);
  EXPECT_EQ(m["sources"]["tick"]["empty"].get<int>(), 1);
  ASSERT_EQ(m["groups"].size(), 2u);
  EXPECT_EQ(m["groups"][0]["label"], "channel_1");
  EXPECT_EQ(m["groups"][0]["channel"].get<int>(), 1);
  EXPECT_TRUE(m["groups"][1]["ok"].get<bool>());
  EXPECT_EQ(m["config"]["max_open"].get<int>(), 2);
}

TEST_F(PipelineTest, TemporaryWorkDirIsRemoved) {
  MergeConfig c = base();
  c.work_dir.clear();
  c.out_path = (tmp_ / "t.csv").string();
  RunSummary s = Pipeline(c).run();
  EXPECT_FALSE(s.work_dir.empty());
  EXPECT_FALSE(fs::exists(s.work_dir));

  MergeConfig keep = base();
  keep.out_path = (tmp_ / "k.csv").string();
  RunSummary sk = Pipeline(keep).run();
  EXPECT_TRUE(fs::exists(sk.work_dir / "order_events"));
}

TEST_F(PipelineTest, TemporaryWorkDirIsRemovedOnFailure) {
  write_file(tmp_ / "tick/600000.csv",
             {kTickHeader, tick_row(1, 5, "F"), tick_row(1, 3, "F")});
  fs::create_directories(tmp_ / "sys_tmp");

  const char* prev = std::getenv("TMPDIR");
  const std::string saved = prev ? prev : "";
  ::setenv("TMPDIR", (tmp_ / "sys_tmp").c_str(), 1);

  MergeConfig c = base();
  c.work_dir.clear();
  c.out_path = (tmp_ / "bad.csv").string();
  EXPECT_THROW(Pipeline(c).run(), MonotonicityError);

  if (prev) {
    ::setenv("TMPDIR", saved.c_str(), 1);
  } else {
    ::unsetenv("TMPDIR");
  }

  EXPECT_TRUE(fs::is_empty(tmp_ / "sys_tmp"));
  EXPECT_FALSE(fs::exists(c.out_path));
}
