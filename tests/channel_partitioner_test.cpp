#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "l3merge/channel_partitioner.hpp"
#include "l3merge/event_csv.hpp"
#include "test_support.hpp"

using namespace l3merge;
using namespace l3merge::test_support;
namespace fs = std::filesystem;

namespace {

SourceOutcome outcome(const fs::path& p, const std::string& symbol,
                      SourceFamily family, int32_t channel,
                      const std::vector<int64_t>& seqs) {
  EventCsvWriter w(p);
  for (int64_t s : seqs) {
    Event e;
    e.channel = channel;
    e.sequence = s;
    e.symbol = symbol;
    e.source_family = family;
    e.kind = family == SourceFamily::OrderStream ? EventKind::Order
                                                 : EventKind::Trade;
    w.append(e);
  }
  w.close();

  SourceOutcome o;
  o.entry = SourceEntry{p, symbol, family};
  o.path = p;
  o.channel = channel;
  o.events = seqs.size();
  return o;
}

SourceOutcome empty_outcome(const std::string& symbol) {
  SourceOutcome o;
  o.entry.symbol = symbol;
  return o;
}

}  // namespace

TEST(ChannelPartitioner, ChannelFileName) {
  EXPECT_EQ(channel_file_name(2011).string(), "channel_2011.csv");
}

TEST(ChannelPartitioner, PlanPerChannelInAscendingOrder) {
  TempDir tmp;
  std::vector<SourceOutcome> src = {
      outcome(tmp / "o0.csv", "A", SourceFamily::OrderStream, 7, {1, 3}),
      outcome(tmp / "o1.csv", "B", SourceFamily::OrderStream, 2, {1}),
      empty_outcome("C"),
      outcome(tmp / "t0.csv", "A", SourceFamily::TickStream, 7, {2}),
  };

  PartitionOptions opts;
  opts.mode = OutputMode::PerChannel;
  opts.out_dir = tmp / "out";
  auto groups = ChannelPartitioner(opts).plan(src);

  ASSERT_EQ(groups.size(), 2u);
  EXPECT_EQ(groups[0].label, "channel_2");
  EXPECT_EQ(groups[0].channel.value_or(-1), 2);
  EXPECT_EQ(groups[0].output, tmp / "out" / "channel_2.csv");
  EXPECT_EQ(groups[0].inputs.size(), 1u);

  EXPECT_EQ(groups[1].label, "channel_7");
  ASSERT_EQ(groups[1].inputs.size(), 2u);
  EXPECT_EQ(groups[1].inputs[0], tmp / "o0.csv");
  EXPECT_EQ(groups[1].inputs[1], tmp / "t0.csv");
  EXPECT_EQ(groups[1].expected_events, 3u);
}

TEST(ChannelPartitioner, PlanCombinedIsOneGroup) {
  TempDir tmp;
  std::vector<SourceOutcome> src = {
      outcome(tmp / "o0.csv", "A", SourceFamily::OrderStream, 7, {1}),
      empty_outcome("C"),
      outcome(tmp / "t0.csv", "B", SourceFamily::TickStream, 2, {1}),
  };
  PartitionOptions opts;
  opts.out_path = tmp / "all.csv";
  auto groups = ChannelPartitioner(opts).plan(src);
  ASSERT_EQ(groups.size(), 1u);
  EXPECT_EQ(groups[0].label, "all");
  EXPECT_FALSE(groups[0].channel.has_value());
  EXPECT_EQ(groups[0].inputs.size(), 2u);
  EXPECT_EQ(groups[0].expected_events, 2u);
}

TEST(ChannelPartitioner, TwoChannelsGiveTwoFiles) {
  TempDir tmp;
  std::vector<SourceOutcome> src = {
      outcome(tmp / "o0.csv", "A", SourceFamily::OrderStream, 1, {1, 3, 5}),
      outcome(tmp / "o1.csv", "B", SourceFamily::OrderStream, 2, {2, 4}),
      outcome(tmp / "t0.csv", "A", SourceFamily::TickStream, 1, {2, 4}),
      outcome(tmp / "t1.csv", "B", SourceFamily::TickStream, 2, {1, 3}),
  };

  PartitionOptions opts;
  opts.mode = OutputMode::PerChannel;
  opts.out_dir = tmp / "out";
  opts.scratch_dir = tmp / "merge";
  opts.max_open = 2;
  opts.workers = 2;
  ChannelPartitioner part(opts);
  auto results = part.run(part.plan(src));

  ASSERT_EQ(results.size(), 2u);
  for (const auto& r : results) EXPECT_TRUE(r.ok) << r.error;

  EXPECT_EQ(keys_of(tmp / "out" / "channel_1.csv"),
            (std::vector<std::string>{"1,1", "1,2", "1,3", "1,4", "1,5"}));
  EXPECT_EQ(keys_of(tmp / "out" / "channel_2.csv"),
            (std::vector<std::string>{"2,1", "2,2", "2,3", "2,4"}));
  EXPECT_EQ(results[0].stats.events, 5u);
  EXPECT_EQ(results[1].stats.events, 4u);
}

TEST(ChannelPartitioner, CombinedOrdersByChannelThenSequence) {
  TempDir tmp;
  std::vector<SourceOutcome> src = {
      outcome(tmp / "o0.csv", "A", SourceFamily::OrderStream, 2, {1, 2}),
      outcome(tmp / "o1.csv", "B", SourceFamily::OrderStream, 1, {5}),
      outcome(tmp / "t0.csv", "A", SourceFamily::TickStream, 2, {2}),
  };
  PartitionOptions opts;
  opts.out_path = tmp / "all.csv";
  opts.scratch_dir = tmp / "merge";
  ChannelPartitioner part(opts);
  auto results = part.run(part.plan(src));

  ASSERT_EQ(results.size(), 1u);
  ASSERT_TRUE(results[0].ok) << results[0].error;
  EXPECT_EQ(keys_of(tmp / "all.csv"),
            (std::vector<std::string>{"1,5", "2,1", "2,2", "2,2"}));

  // the order event wins the (2,2) tie
  auto lines = read_lines(tmp / "all.csv");
  EXPECT_NE(lines[3].find(",ORDER,"), std::string::npos);
  EXPECT_NE(lines[4].find(",TRADE,"), std::string::npos);
}

TEST(ChannelPartitioner, FailedGroupDoesNotStopOthers) {
  TempDir tmp;
  std::vector<SourceOutcome> src = {
      outcome(tmp / "o0.csv", "A", SourceFamily::OrderStream, 1, {1, 2}),
      outcome(tmp / "t0.csv", "A", SourceFamily::TickStream, 1, {3}),
      outcome(tmp / "o1.csv", "B", SourceFamily::OrderStream, 2, {1}),
      outcome(tmp / "t1.csv", "B", SourceFamily::TickStream, 2, {2}),
  };
  // channel 2's tick file goes out of order behind the planner's back
  write_file(tmp / "t1.csv",
             {event_header_line(), "2,9,TRADE,B,,,,,0,0,,,,0,0,tick",
              "2,3,TRADE,B,,,,,0,0,,,,0,0,tick"});

  PartitionOptions opts;
  opts.mode = OutputMode::PerChannel;
  opts.out_dir = tmp / "out";
  opts.scratch_dir = tmp / "merge";
  ChannelPartitioner part(opts);
  auto results = part.run(part.plan(src));

  ASSERT_EQ(results.size(), 2u);
  EXPECT_TRUE(results[0].ok);
  EXPECT_TRUE(fs::exists(tmp / "out" / "channel_1.csv"));
  EXPECT_FALSE(results[1].ok);
  EXPECT_FALSE(results[1].error.empty());
  EXPECT_FALSE(fs::exists(tmp / "out" / "channel_2.csv"));
}
