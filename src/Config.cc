#include "Config.hh"

#include <filesystem>
#include <phosg/Filesystem.hh>
#include <stdexcept>

#include "Loggers.hh"

using namespace std;

static PlatformProfileTable profiles_from_config_json(const phosg::JSON& json) {
  try {
    return PlatformProfileTable(json.at("Platforms"));
  } catch (const out_of_range&) {
    return PlatformProfileTable();
  }
}

static StylingFieldList styling_fields_from_config_json(const phosg::JSON& json) {
  try {
    return StylingFieldList(json.at("StylingFields"));
  } catch (const out_of_range&) {
    return StylingFieldList();
  }
}

Config::Config(const phosg::JSON& json)
    : log_levels_json(nullptr),
      profiles(profiles_from_config_json(json)),
      styling_fields(styling_fields_from_config_json(json)) {
  try {
    this->log_levels_json = json.at("LogLevels");
  } catch (const out_of_range&) {
  }
}

void Config::apply_log_levels() const {
  if (this->log_levels_json.is_dict()) {
    set_log_levels_from_json(this->log_levels_json);
  }
}

phosg::JSON Config::json() const {
  return phosg::JSON::dict({
      {"LogLevels", this->log_levels_json},
      {"Platforms", this->profiles.json()},
      {"StylingFields", this->styling_fields.json()},
  });
}

Config load_config(const string& filename, bool allow_missing) {
  if (allow_missing && !std::filesystem::is_regular_file(filename)) {
    config_log.debug_f("{} does not exist; using built-in defaults", filename);
    return Config();
  }

  config_log.info_f("Loading configuration from {}", filename);
  Config ret(phosg::JSON::parse(phosg::load_file(filename)));
  ret.filename = filename;
  ret.apply_log_levels();
  return ret;
}
