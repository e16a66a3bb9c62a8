#include <gtest/gtest.h>

#include <phosg/JSON.hh>
#include <stdexcept>
#include <string>

#include "SaveContext.hh"
#include "SaveFileFormats.hh"

using namespace std;

static CreatureEntry make_entry() {
  CreatureEntry entry;
  entry.id = 7;
  entry.attribute = 3;
  entry.power = 0x0190;
  entry.speed = 10;
  entry.defense = 20;
  entry.acceleration = 30;
  entry.endurance = 40;
  entry.jump = 50;
  entry.level = 5;
  return entry;
}

TEST(CreatureEntryTest, OffsetFormula) {
  auto ctx = resolve_save_context(default_platform_profile_table(), Platform::WII, 1);
  EXPECT_EQ(275 + 13952 + 7 * 120 + 3 * 20, creature_entry_offset(ctx, 7, 3));
}

TEST(CreatureEntryTest, RoundTrip) {
  auto ctx = resolve_save_context(default_platform_profile_table(), Platform::WII, 2);
  string data(13952 * 4, '\0');
  auto entry = make_entry();
  write_creature_entry(data, ctx, 7, 3, entry);
  EXPECT_EQ(entry, read_creature_entry(data, ctx, 7, 3));

  // Power is big-endian on Wii
  size_t offset = creature_entry_offset(ctx, 7, 3);
  EXPECT_EQ(0x01, static_cast<uint8_t>(data[offset + 5]));
  EXPECT_EQ(0x90, static_cast<uint8_t>(data[offset + 6]));
}

TEST(CreatureEntryTest, PowerIsLittleEndianOnPS2) {
  auto ctx = resolve_save_context(default_platform_profile_table(), Platform::PS2, 0);
  string data(0x3400 * 4, '\0');
  auto entry = make_entry();
  write_creature_entry(data, ctx, 1, 0, entry);
  size_t offset = creature_entry_offset(ctx, 1, 0);
  EXPECT_EQ(0x90, static_cast<uint8_t>(data[offset + 5]));
  EXPECT_EQ(0x01, static_cast<uint8_t>(data[offset + 6]));
  EXPECT_EQ(0x0190, read_creature_entry(data, ctx, 1, 0).power);
}

TEST(CreatureEntryTest, WriteStoresPayloadIDsAndPreservesUnknownBytes) {
  auto ctx = resolve_save_context(default_platform_profile_table(), Platform::PS3, 0);
  string data(0x3400, '\xAA');
  auto entry = make_entry();
  write_creature_entry(data, ctx, 2, 1, entry);

  size_t offset = creature_entry_offset(ctx, 2, 1);
  // The record's ID and attribute bytes come from the entry, not from the
  // creature and attribute IDs used to locate it
  EXPECT_EQ(7, data[offset + 0]);
  EXPECT_EQ(3, data[offset + 4]);
  EXPECT_EQ(string("\xAA\xAA\xAA", 3), data.substr(offset + 1, 3));
  EXPECT_EQ('\xAA', data[offset + 7]);
  // Bytes outside the record are untouched
  EXPECT_EQ('\xAA', data[offset - 1]);
  EXPECT_EQ('\xAA', data[offset + CREATURE_ENTRY_SIZE]);
}

TEST(CreatureEntryTest, OutOfRangeDoesNotModifyData) {
  auto ctx = resolve_save_context(default_platform_profile_table(), Platform::PS3, 0);
  // The entry for creature 0, attribute 0 ends 1 byte past the end of this
  // buffer
  string data(227 + CREATURE_ENTRY_SIZE - 1, '\x55');
  string orig_data = data;
  EXPECT_THROW(write_creature_entry(data, ctx, 0, 0, make_entry()), offset_out_of_range);
  EXPECT_EQ(orig_data, data);
  EXPECT_THROW(read_creature_entry(data, ctx, 0, 0), out_of_range);

  data.push_back('\x55');
  write_creature_entry(data, ctx, 0, 0, make_entry());
  EXPECT_EQ(make_entry(), read_creature_entry(data, ctx, 0, 0));
}

TEST(CreatureEntryTest, JSONConversion) {
  auto entry = make_entry();
  EXPECT_EQ(entry, CreatureEntry(entry.json()));

  CreatureEntry partial(phosg::JSON::parse(R"({"Power": 500, "Level": 9})"));
  EXPECT_EQ(500, partial.power);
  EXPECT_EQ(9, partial.level);
  EXPECT_EQ(0, partial.id);
  EXPECT_EQ(0, partial.speed);
}

TEST(CreatureEntryTest, JSONValuesMustFitTheirFields) {
  EXPECT_THROW(CreatureEntry(phosg::JSON::parse(R"({"Power": 70000})")), invalid_argument);
  EXPECT_THROW(CreatureEntry(phosg::JSON::parse(R"({"Speed": 300})")), invalid_argument);
  EXPECT_THROW(CreatureEntry(phosg::JSON::parse(R"({"Level": -1})")), invalid_argument);
  EXPECT_THROW(CreatureEntry(phosg::JSON::parse(R"({"ID": 256})")), invalid_argument);

  CreatureEntry max_entry(phosg::JSON::parse(R"({"Power": 65535, "Jump": 255})"));
  EXPECT_EQ(65535, max_entry.power);
  EXPECT_EQ(255, max_entry.jump);
}
