#pragma once

#include <phosg/JSON.hh>
#include <string>

#include "PlatformProfile.hh"
#include "StylingFields.hh"

constexpr const char* DEFAULT_CONFIG_FILENAME = "system/config.json";

// Everything that can be changed without rebuilding: the platform profile
// table, the styling field list, and log levels. All keys are optional.
struct Config {
  // Empty if the built-in defaults are in use
  std::string filename;
  phosg::JSON log_levels_json;
  PlatformProfileTable profiles;
  StylingFieldList styling_fields;

  Config() = default;
  explicit Config(const phosg::JSON& json);

  // Applies the LogLevels dict (if any) to the global loggers
  void apply_log_levels() const;

  phosg::JSON json() const;
};

// Loads and parses a config file. If the file doesn't exist and allow_missing
// is true, returns the built-in defaults instead of throwing.
Config load_config(const std::string& filename, bool allow_missing);
