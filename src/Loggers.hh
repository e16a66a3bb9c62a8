#pragma once

#include <phosg/JSON.hh>
#include <phosg/Strings.hh>

extern phosg::PrefixedLogger cli_log;
extern phosg::PrefixedLogger codec_log;
extern phosg::PrefixedLogger config_log;

void set_all_log_levels(phosg::LogLevel level);
void set_log_levels_from_json(const phosg::JSON& json);
