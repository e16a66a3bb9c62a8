#include <gtest/gtest.h>

#include <phosg/JSON.hh>
#include <string>

#include "PlatformProfile.hh"
#include "SaveContext.hh"
#include "SaveFileFormats.hh"

using namespace std;

static StatsBlock make_stats() {
  StatsBlock stats;
  stats.ranking_points = 123456;
  stats.creature_points = 0x0A0B0C;
  stats.battles = 40;
  stats.wins = 25;
  stats.losses = 15;
  stats.sphere_attacks = 7;
  stats.double_stands = 3;
  stats.mode_counts = {1, 2, 3};
  for (size_t z = 0; z < NUM_OPPONENTS; z++) {
    stats.opponent_wins.emplace_back(z);
  }
  stats.attribute_usage = {10, 20, 30, 40, 50, 60};
  return stats;
}

TEST(StatsTest, RoundTrip) {
  auto ctx = resolve_save_context(default_platform_profile_table(), Platform::WII, 1);
  string data(13952 * 4, '\0');
  write_stats(data, ctx, make_stats());
  EXPECT_EQ(make_stats(), read_stats(data, ctx));

  size_t base = 13952 + 0x3230;
  EXPECT_EQ(string("\x0A\x0B\x0C", 3), data.substr(base + 4, 3));
  // Attribute usage entries are followed by a zero byte
  EXPECT_EQ(string("\x0A\x00\x14\x00", 4), data.substr(base + 0x20, 4));
}

TEST(StatsTest, ByteCountersAreClamped) {
  auto ctx = resolve_save_context(default_platform_profile_table(), Platform::PS3, 0);
  string data(0x3400, '\0');
  auto stats = make_stats();
  stats.battles = 300;
  stats.wins = -5;
  stats.opponent_wins[3] = 1000;
  stats.attribute_usage[0] = 256;
  write_stats(data, ctx, stats);

  auto read = read_stats(data, ctx);
  EXPECT_EQ(255, read.battles);
  EXPECT_EQ(0, read.wins);
  EXPECT_EQ(255, read.opponent_wins[3]);
  EXPECT_EQ(255, read.attribute_usage[0]);
}

TEST(StatsTest, PointCountersAreMasked) {
  auto ctx = resolve_save_context(default_platform_profile_table(), Platform::PS3, 0);
  string data(0x3400, '\0');
  auto stats = make_stats();
  stats.ranking_points = 16777300;
  write_stats(data, ctx, stats);
  EXPECT_EQ(16777300 & 0xFFFFFF, read_stats(data, ctx).ranking_points);
  EXPECT_EQ(string("\x00\x00\x54", 3), data.substr(0x3200, 3));
}

TEST(StatsTest, UnsupportedPlatforms) {
  string data(0x3400 * 4, '\0');
  auto x360 = resolve_save_context(default_platform_profile_table(), Platform::X360, 0);
  EXPECT_THROW(read_stats(data, x360), stats_unsupported);
  auto ps2 = resolve_save_context(default_platform_profile_table(), Platform::PS2, 0);
  EXPECT_THROW(write_stats(data, ps2, make_stats()), stats_unsupported);
  EXPECT_EQ(string(0x3400 * 4, '\0'), data);
}

TEST(StatsTest, UnconfiguredFieldsReadAsZeroAndAreNotWritten) {
  PlatformProfileTable table(phosg::JSON::parse(R"({
    "x360": {"Stats": {"RankingPoints": 16, "CreaturePoints": 20, "Wins": 24}}
  })"));
  auto ctx = resolve_save_context(table, Platform::X360, 0);
  string data(0x40, '\x09');
  write_stats(data, ctx, make_stats());

  auto read = read_stats(data, ctx);
  EXPECT_EQ(123456, read.ranking_points);
  EXPECT_EQ(25, read.wins);
  EXPECT_EQ(0, read.battles);
  EXPECT_EQ(0, read.mode_counts[1]);
  EXPECT_TRUE(read.opponent_wins.empty());
  EXPECT_TRUE(read.attribute_usage.empty());
  // Nothing outside the configured fields was changed
  EXPECT_EQ(string(16, '\x09'), data.substr(0, 16));
  EXPECT_EQ('\x09', data[19]);
  EXPECT_EQ(string(0x40 - 25, '\x09'), data.substr(25));
}

TEST(StatsTest, AllOffsetsAreCheckedBeforeWriting) {
  auto ctx = resolve_save_context(default_platform_profile_table(), Platform::PS3, 0);
  // Everything except the last attribute usage entry fits
  string data(0x3200 + 0x2B, '\0');
  EXPECT_THROW(write_stats(data, ctx, make_stats()), offset_out_of_range);
  EXPECT_EQ(string(0x3200 + 0x2B, '\0'), data);
  EXPECT_THROW(read_stats(data, ctx), offset_out_of_range);
}

TEST(StatsTest, EmptyArraysAreNotWritten) {
  auto ctx = resolve_save_context(default_platform_profile_table(), Platform::PS3, 0);
  string data(0x3400, '\x07');
  StatsBlock stats;
  write_stats(data, ctx, stats);
  auto read = read_stats(data, ctx);
  EXPECT_EQ(0, read.battles);
  ASSERT_EQ(NUM_OPPONENTS, read.opponent_wins.size());
  EXPECT_EQ(7, read.opponent_wins[0]);
  ASSERT_EQ(NUM_ATTRIBUTE_USAGE_ENTRIES, read.attribute_usage.size());
  EXPECT_EQ(7, read.attribute_usage[5]);
}

TEST(StatsTest, JSONConversion) {
  auto stats = make_stats();
  EXPECT_EQ(stats, StatsBlock(stats.json()));

  StatsBlock parsed(phosg::JSON::parse(R"({"Battles": "lots", "Wins": 2.6, "ModeCounts": [4]})"));
  EXPECT_EQ(0, parsed.battles);
  EXPECT_EQ(3, parsed.wins);
  EXPECT_EQ(4, parsed.mode_counts[0]);
  EXPECT_EQ(0, parsed.mode_counts[1]);
  EXPECT_EQ(0, parsed.ranking_points);
  EXPECT_TRUE(parsed.opponent_wins.empty());
}
