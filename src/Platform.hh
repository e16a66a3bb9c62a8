#pragma once

#include <inttypes.h>

#include <array>
#include <phosg/Types.hh>

enum class Platform {
  PS3 = 0,
  WII = 1,
  X360 = 2,
  PS2 = 3,
};

constexpr std::array<Platform, 4> ALL_PLATFORMS = {
    Platform::PS3,
    Platform::WII,
    Platform::X360,
    Platform::PS2,
};

constexpr size_t NUM_PLATFORMS = ALL_PLATFORMS.size();

// name_for_enum returns the short key used in config files and on the command
// line (e.g. "ps3"). enum_for_name matches case-insensitively and throws
// unknown_platform (see PlatformProfile.hh) for unrecognized names.
template <>
const char* phosg::name_for_enum<Platform>(Platform p);
template <>
Platform phosg::enum_for_name<Platform>(const char* name);
