#pragma once

#include <stdint.h>

#include <array>
#include <optional>
#include <phosg/JSON.hh>
#include <string>

#include "ByteOrder.hh"
#include "Platform.hh"
#include "PlatformProfile.hh"

// The absolute-offset view of the save layout for one (platform, slot) pair.
// Every offset here already includes the slot's shift, so field codecs only
// need to add their own per-entity offsets.
struct SaveContext {
  Platform platform = Platform::PS3;
  size_t slot = 0;
  int64_t shift = 0;
  int64_t base_offset = 0;
  int64_t card_base_offset = 0;
  int64_t player_name_offset = 0;
  int64_t styling_offset = 0;
  std::array<int64_t, 2> deck_offsets = {0, 0};
  std::optional<std::array<int64_t, 2>> deck_name_offsets;
  Endianness endianness = Endianness::BIG;
  std::optional<StatsOffsets> stats_offsets;
  // Copied from the profile so callers can warn before touching assumed
  // regions
  bool provisional = false;
  bool deck_names_provisional = false;
  bool stats_provisional = false;

  phosg::JSON json() const;
};

// Slots out of range are clamped rather than rejected: platforms with one save
// per file always use slot 0, and other platforms clamp to [0, num_slots - 1].
SaveContext resolve_save_context(const PlatformProfileTable& table, Platform platform, int64_t slot);
SaveContext resolve_save_context(const PlatformProfileTable& table, const std::string& platform_name, int64_t slot);
