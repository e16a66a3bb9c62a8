#pragma once

#include <stdint.h>

#include <array>
#include <optional>
#include <phosg/JSON.hh>
#include <stdexcept>
#include <string>

#include "ByteOrder.hh"
#include "Platform.hh"

class unknown_platform : public std::invalid_argument {
public:
  explicit unknown_platform(const std::string& name)
      : invalid_argument("unknown platform: " + name) {}
};

// Absolute offsets (relative to the start of a save) of the battle statistics
// fields. The two point counters are 24-bit values; the remaining counters
// are single bytes and may be missing on some platforms, in which case they
// read as zero and are not written.
struct StatsOffsets {
  int64_t ranking_points = 0;
  int64_t creature_points = 0;
  std::optional<int64_t> battles;
  std::optional<int64_t> wins;
  std::optional<int64_t> losses;
  std::optional<int64_t> sphere_attacks;
  std::optional<int64_t> double_stands;
  std::array<std::optional<int64_t>, 3> mode_counts;
  // Base of 16 single-byte per-opponent win counts
  std::optional<int64_t> opponent_wins;
  // Base of 6 (value, padding) byte pairs
  std::optional<int64_t> attribute_usage;

  StatsOffsets() = default;
  explicit StatsOffsets(const phosg::JSON& json);

  phosg::JSON json() const;

  StatsOffsets shifted(int64_t shift) const;
};

struct PlatformProfile {
  Platform platform = Platform::PS3;
  // True if most of the constants below have not been checked against real
  // save files from this platform
  bool provisional = false;
  // If absent, each file contains exactly one save
  std::optional<uint32_t> save_size;
  size_t num_slots = 1;
  int64_t base_offset = 0;
  // Can be negative; card IDs below -card_base_offset are not addressable
  int64_t card_base_offset = 0;
  int64_t player_name_offset = 0;
  int64_t styling_offset = 0;
  std::array<int64_t, 2> deck_offsets = {0, 0};
  // Deck names are stored this many bytes before each deck. If absent, the
  // platform doesn't store deck names.
  std::optional<uint32_t> deck_name_back_offset;
  // True if the deck name position is assumed rather than observed
  bool deck_names_provisional = false;
  Endianness endianness = Endianness::BIG;
  std::optional<StatsOffsets> stats_offsets;
  bool stats_provisional = false;

  // Replaces only the fields present in json. Throws if the result is
  // inconsistent (for example, multiple slots without a save size).
  void apply_json(const phosg::JSON& json);
  phosg::JSON json() const;
};

class PlatformProfileTable {
public:
  // Builds the table from the built-in constants
  PlatformProfileTable();
  // Builds the table from the built-in constants, then applies overrides from
  // a dict of {platform_name: {field: value, ...}}
  explicit PlatformProfileTable(const phosg::JSON& overrides_json);
  ~PlatformProfileTable() = default;

  const PlatformProfile& get(Platform platform) const;
  const PlatformProfile& get(const std::string& platform_name) const;

  phosg::JSON json() const;

protected:
  std::array<PlatformProfile, NUM_PLATFORMS> profiles;
};

// The table built from the built-in constants, without any overrides
const PlatformProfileTable& default_platform_profile_table();
