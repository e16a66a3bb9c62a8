#include "Platform.hh"

#include <strings.h>

#include <stdexcept>

#include "PlatformProfile.hh"

using namespace std;

template <>
const char* phosg::name_for_enum<Platform>(Platform p) {
  switch (p) {
    case Platform::PS3:
      return "ps3";
    case Platform::WII:
      return "wii";
    case Platform::X360:
      return "x360";
    case Platform::PS2:
      return "ps2";
  }
  throw logic_error("invalid platform");
}

template <>
Platform phosg::enum_for_name<Platform>(const char* name) {
  if (!strcasecmp(name, "ps3")) {
    return Platform::PS3;
  } else if (!strcasecmp(name, "wii")) {
    return Platform::WII;
  } else if (!strcasecmp(name, "x360") || !strcasecmp(name, "xbox360")) {
    return Platform::X360;
  } else if (!strcasecmp(name, "ps2")) {
    return Platform::PS2;
  } else {
    throw unknown_platform(name);
  }
}
