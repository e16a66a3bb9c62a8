#include <gtest/gtest.h>
#include <stdio.h>

#include <phosg/Filesystem.hh>
#include <phosg/JSON.hh>
#include <stdexcept>
#include <string>

#include "Config.hh"
#include "Loggers.hh"

using namespace std;

TEST(ConfigTest, EmptyConfigUsesDefaults) {
  Config config(phosg::JSON::dict());
  EXPECT_EQ(275, config.profiles.get(Platform::WII).base_offset);
  EXPECT_EQ(StylingFieldList().json(), config.styling_fields.json());
  EXPECT_TRUE(config.log_levels_json.is_null());
}

TEST(ConfigTest, ParsesAllSections) {
  Config config(phosg::JSON::parse(R"({
    "LogLevels": {"SaveCodec": "warning"},
    "Platforms": {"wii": {"CardBaseOffset": 16}},
    "StylingFields": [["HairStyle", 0], ["HairColor", 2]]
  })"));
  EXPECT_EQ(16, config.profiles.get(Platform::WII).card_base_offset);
  EXPECT_EQ(2u, config.styling_fields.size());

  auto prev_level = codec_log.min_level;
  config.apply_log_levels();
  EXPECT_EQ(phosg::LogLevel::L_WARNING, codec_log.min_level);
  codec_log.min_level = prev_level;
}

TEST(ConfigTest, InvalidSectionsThrow) {
  EXPECT_THROW(Config(phosg::JSON::parse(R"({"Platforms": {"saturn": {}}})")), unknown_platform);
  EXPECT_THROW(Config(phosg::JSON::parse(R"({"StylingFields": [["Hat", 99]]})")), runtime_error);
}

TEST(ConfigTest, LoadFromFile) {
  string filename = testing::TempDir() + "bakusave-config-test.json";
  phosg::save_file(filename, R"({"Platforms": {"ps3": {"PlayerNameOffset": 200}}})");
  auto config = load_config(filename, false);
  EXPECT_EQ(filename, config.filename);
  EXPECT_EQ(200, config.profiles.get(Platform::PS3).player_name_offset);
  remove(filename.c_str());
}

TEST(ConfigTest, MissingFile) {
  string filename = testing::TempDir() + "bakusave-config-test-missing.json";
  auto config = load_config(filename, true);
  EXPECT_TRUE(config.filename.empty());
  EXPECT_EQ(227, config.profiles.get(Platform::PS3).base_offset);
  EXPECT_THROW(load_config(filename, false), phosg::cannot_open_file);
}

TEST(ConfigTest, ExportedJSONCanBeReloaded) {
  Config config(phosg::JSON::parse(R"({"Platforms": {"x360": {"Provisional": false}}})"));
  Config reloaded(config.json());
  EXPECT_FALSE(reloaded.profiles.get(Platform::X360).provisional);
  EXPECT_EQ(config.profiles.json(), reloaded.profiles.json());
  EXPECT_EQ(config.styling_fields.json(), reloaded.styling_fields.json());
}
