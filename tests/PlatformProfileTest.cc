#include <gtest/gtest.h>

#include <phosg/JSON.hh>
#include <stdexcept>

#include "Platform.hh"
#include "PlatformProfile.hh"

using namespace std;

TEST(PlatformProfileTest, PlatformNames) {
  EXPECT_EQ(Platform::PS3, phosg::enum_for_name<Platform>("ps3"));
  EXPECT_EQ(Platform::WII, phosg::enum_for_name<Platform>("Wii"));
  EXPECT_EQ(Platform::X360, phosg::enum_for_name<Platform>("xbox360"));
  EXPECT_EQ(Platform::PS2, phosg::enum_for_name<Platform>("PS2"));
  for (Platform platform : ALL_PLATFORMS) {
    EXPECT_EQ(platform, phosg::enum_for_name<Platform>(phosg::name_for_enum(platform)));
  }
  EXPECT_THROW(phosg::enum_for_name<Platform>("gamecube"), unknown_platform);
  EXPECT_THROW(phosg::enum_for_name<Platform>(""), invalid_argument);
}

TEST(PlatformProfileTest, BuiltInProfiles) {
  const auto& table = default_platform_profile_table();

  const auto& ps3 = table.get(Platform::PS3);
  EXPECT_FALSE(ps3.save_size.has_value());
  EXPECT_EQ(227, ps3.base_offset);
  EXPECT_EQ(-48, ps3.card_base_offset);
  EXPECT_EQ(0xC5, ps3.player_name_offset);
  EXPECT_EQ(0x31BF, ps3.styling_offset);
  EXPECT_EQ(0x2908, ps3.deck_offsets[0]);
  EXPECT_EQ(0x2954, ps3.deck_offsets[1]);
  EXPECT_EQ(Endianness::BIG, ps3.endianness);
  EXPECT_TRUE(ps3.stats_offsets.has_value());

  const auto& wii = table.get("wii");
  ASSERT_TRUE(wii.save_size.has_value());
  EXPECT_EQ(13952u, *wii.save_size);
  EXPECT_EQ(4u, wii.num_slots);
  EXPECT_EQ(275, wii.base_offset);
  EXPECT_EQ(0, wii.card_base_offset);
  EXPECT_EQ(0xF5, wii.player_name_offset);
  EXPECT_EQ(0x31EF, wii.styling_offset);
  EXPECT_EQ(0x2938, wii.deck_offsets[0]);
  EXPECT_EQ(0x2984, wii.deck_offsets[1]);

  EXPECT_TRUE(table.get(Platform::X360).provisional);
  EXPECT_FALSE(table.get(Platform::X360).stats_offsets.has_value());

  const auto& ps2 = table.get(Platform::PS2);
  EXPECT_TRUE(ps2.provisional);
  EXPECT_EQ(Endianness::LITTLE, ps2.endianness);
  EXPECT_FALSE(ps2.deck_name_back_offset.has_value());
  EXPECT_FALSE(ps2.stats_offsets.has_value());

  EXPECT_THROW(table.get("dreamcast"), unknown_platform);
}

TEST(PlatformProfileTest, OverridesReplaceOnlyGivenFields) {
  PlatformProfileTable table(phosg::JSON::parse(R"({
    "ps3": {"CardBaseOffset": -64, "DeckNameBackOffset": null},
    "x360": {"Provisional": false, "Stats": {"RankingPoints": 4096, "CreaturePoints": 4100}},
    "ps2": {"Endianness": "big", "SaveSize": 16384}
  })"));

  const auto& ps3 = table.get(Platform::PS3);
  EXPECT_EQ(-64, ps3.card_base_offset);
  EXPECT_FALSE(ps3.deck_name_back_offset.has_value());
  EXPECT_EQ(227, ps3.base_offset);
  EXPECT_TRUE(ps3.stats_offsets.has_value());

  const auto& x360 = table.get(Platform::X360);
  EXPECT_FALSE(x360.provisional);
  ASSERT_TRUE(x360.stats_offsets.has_value());
  EXPECT_EQ(4096, x360.stats_offsets->ranking_points);
  EXPECT_EQ(4100, x360.stats_offsets->creature_points);
  EXPECT_FALSE(x360.stats_offsets->battles.has_value());
  EXPECT_FALSE(x360.stats_offsets->opponent_wins.has_value());

  const auto& ps2 = table.get(Platform::PS2);
  EXPECT_EQ(Endianness::BIG, ps2.endianness);
  EXPECT_EQ(16384u, *ps2.save_size);

  // Platforms without overrides keep their built-in values
  EXPECT_EQ(275, table.get(Platform::WII).base_offset);
}

TEST(PlatformProfileTest, InvalidOverrides) {
  EXPECT_THROW(PlatformProfileTable(phosg::JSON::parse(R"({"n64": {}})")), unknown_platform);
  EXPECT_THROW(PlatformProfileTable(phosg::JSON::parse(R"({"wii": {"SaveSize": null}})")), runtime_error);
  EXPECT_THROW(PlatformProfileTable(phosg::JSON::parse(R"({"wii": {"NumSlots": 0}})")), runtime_error);
  EXPECT_THROW(PlatformProfileTable(phosg::JSON::parse(R"({"ps3": {"DeckOffsets": [1, 2, 3]}})")), runtime_error);
  EXPECT_THROW(PlatformProfileTable(phosg::JSON::parse(R"({"ps3": {"Endianness": "sideways"}})")), invalid_argument);
}

TEST(PlatformProfileTest, ExportedJSONCanBeReapplied) {
  PlatformProfileTable modified(phosg::JSON::parse(R"({"wii": {"BaseOffset": 300}})"));
  PlatformProfileTable reloaded(modified.json());
  EXPECT_EQ(300, reloaded.get(Platform::WII).base_offset);
  EXPECT_EQ(modified.json(), reloaded.json());
}

TEST(PlatformProfileTest, AssumedRegionsAreFlagged) {
  const auto& table = default_platform_profile_table();
  for (Platform platform : {Platform::PS3, Platform::WII}) {
    const auto& profile = table.get(platform);
    EXPECT_FALSE(profile.provisional);
    EXPECT_TRUE(profile.stats_provisional);
    EXPECT_TRUE(profile.deck_names_provisional);
  }
  EXPECT_FALSE(table.get(Platform::PS2).deck_names_provisional);

  PlatformProfileTable verified(phosg::JSON::parse(R"({"ps3": {"StatsProvisional": false}})"));
  EXPECT_FALSE(verified.get(Platform::PS3).stats_provisional);
  EXPECT_TRUE(verified.get(Platform::PS3).deck_names_provisional);
  EXPECT_TRUE(verified.get(Platform::WII).stats_provisional);

  auto ps3_json = table.get(Platform::PS3).json();
  EXPECT_TRUE(ps3_json.at("StatsProvisional").as_bool());
  EXPECT_TRUE(ps3_json.at("DeckNamesProvisional").as_bool());
}
