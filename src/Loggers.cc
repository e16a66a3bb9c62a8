#include "Loggers.hh"

#include <phosg/Strings.hh>

using namespace std;

phosg::PrefixedLogger cli_log("", phosg::LogLevel::L_USE_DEFAULT);
phosg::PrefixedLogger codec_log("[SaveCodec] ", phosg::LogLevel::L_USE_DEFAULT);
phosg::PrefixedLogger config_log("[Config] ", phosg::LogLevel::L_USE_DEFAULT);

static void set_log_level_from_json(
    phosg::PrefixedLogger& log, const phosg::JSON& d, const char* json_key) {
  const auto& dict = d.as_dict();
  auto it = dict.find(json_key);
  if (it != dict.end()) {
    string name = phosg::toupper(it->second->as_string());
    log.min_level = phosg::enum_for_name<phosg::LogLevel>(name.c_str());
  }
}

void set_all_log_levels(phosg::LogLevel level) {
  cli_log.min_level = level;
  codec_log.min_level = level;
  config_log.min_level = level;
}

void set_log_levels_from_json(const phosg::JSON& json) {
  set_log_level_from_json(cli_log, json, "CLI");
  set_log_level_from_json(codec_log, json, "SaveCodec");
  set_log_level_from_json(config_log, json, "Config");
}
