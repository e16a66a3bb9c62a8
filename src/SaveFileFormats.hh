#pragma once

#include <stdint.h>

#include <array>
#include <map>
#include <optional>
#include <phosg/JSON.hh>
#include <stdexcept>
#include <string>
#include <vector>

#include "SaveContext.hh"
#include "StylingFields.hh"
#include "Types.hh"

constexpr size_t CREATURE_BLOCK_SIZE = 120;
constexpr size_t ATTRIBUTE_BLOCK_SIZE = 20;
constexpr size_t NUM_ATTRIBUTES = 6;
constexpr size_t CREATURE_ENTRY_SIZE = 14;

constexpr size_t PLAYER_NAME_MAX_CHARS = 8;
constexpr size_t DECK_NAME_MAX_CHARS = 10;

constexpr size_t NUM_DECKS = 2;
constexpr size_t NUM_DECK_SLOTS = 3;
constexpr size_t DECK_SIZE = 36;
constexpr uint32_t DECK_CARD_BASE_ID = 10232; // 0x27F8
constexpr uint16_t EMPTY_DECK_SLOT = 0xFFFF;

constexpr size_t NUM_OPPONENTS = 16;
constexpr size_t NUM_ATTRIBUTE_USAGE_ENTRIES = 6;

////////////////////////////////////////////////////////////////////////////////
// Errors

class offset_out_of_range : public std::out_of_range {
public:
  offset_out_of_range(const std::string& what, int64_t offset, size_t size, size_t file_size);
};

class invalid_deck_index : public std::invalid_argument {
public:
  explicit invalid_deck_index(size_t deck_index);
};

class deck_names_unsupported : public std::runtime_error {
public:
  explicit deck_names_unsupported(Platform platform);
};

class stats_unsupported : public std::runtime_error {
public:
  explicit stats_unsupported(Platform platform);
};

////////////////////////////////////////////////////////////////////////////////
// On-disk structures

template <bool BE>
struct CreatureRecordT {
  /* 00 */ uint8_t id;
  /* 01 */ parray<uint8_t, 3> unknown_a1;
  /* 04 */ uint8_t attribute;
  /* 05 */ U16T<BE> power;
  /* 07 */ uint8_t unknown_a2;
  /* 08 */ uint8_t speed;
  /* 09 */ uint8_t defense;
  /* 0A */ uint8_t acceleration;
  /* 0B */ uint8_t endurance;
  /* 0C */ uint8_t jump;
  /* 0D */ uint8_t level;
  /* 0E */
} __packed__;
using CreatureRecord = CreatureRecordT<false>;
using CreatureRecordBE = CreatureRecordT<true>;
check_struct_size(CreatureRecord, CREATURE_ENTRY_SIZE);
check_struct_size(CreatureRecordBE, CREATURE_ENTRY_SIZE);

template <bool BE>
struct DeckRecordT {
  // Creature slots are 6 * creature_id + attribute_id; card slots are
  // card_id - DECK_CARD_BASE_ID. Empty slots are EMPTY_DECK_SLOT, and the
  // unused fields are always filled with FF.
  /* 00 */ parray<U16T<BE>, NUM_DECK_SLOTS> creatures;
  /* 06 */ parray<uint8_t, 6> unused1;
  /* 0C */ parray<U16T<BE>, NUM_DECK_SLOTS> gate_cards;
  /* 12 */ parray<uint8_t, 6> unused2;
  /* 18 */ parray<U16T<BE>, NUM_DECK_SLOTS> ability_cards;
  /* 1E */ parray<uint8_t, 6> unused3;
  /* 24 */
} __packed__;
using DeckRecord = DeckRecordT<false>;
using DeckRecordBE = DeckRecordT<true>;
check_struct_size(DeckRecord, DECK_SIZE);
check_struct_size(DeckRecordBE, DECK_SIZE);

////////////////////////////////////////////////////////////////////////////////
// Logical values

struct CreatureEntry {
  uint8_t id = 0;
  uint8_t attribute = 0;
  uint16_t power = 0;
  uint8_t speed = 0;
  uint8_t defense = 0;
  uint8_t acceleration = 0;
  uint8_t endurance = 0;
  uint8_t jump = 0;
  uint8_t level = 0;

  CreatureEntry() = default;
  // Missing keys are treated as zero. Throws std::invalid_argument if a value
  // doesn't fit in its field.
  explicit CreatureEntry(const phosg::JSON& json);

  phosg::JSON json() const;

  bool operator==(const CreatureEntry& other) const = default;
};

struct DeckCreatureSlot {
  std::optional<uint16_t> creature_id;
  std::optional<uint8_t> attribute_id;

  inline bool is_empty() const {
    return !this->creature_id.has_value() || !this->attribute_id.has_value();
  }

  bool operator==(const DeckCreatureSlot& other) const = default;
};

struct Deck {
  std::array<DeckCreatureSlot, NUM_DECK_SLOTS> creatures;
  std::array<std::optional<uint32_t>, NUM_DECK_SLOTS> gate_cards;
  std::array<std::optional<uint32_t>, NUM_DECK_SLOTS> ability_cards;

  Deck() = default;
  explicit Deck(const phosg::JSON& json);

  phosg::JSON json() const;

  bool operator==(const Deck& other) const = default;
};

struct StatsBlock {
  // 24-bit counters; values are masked to 24 bits when written
  int64_t ranking_points = 0;
  int64_t creature_points = 0;
  // Byte counters; values are clamped to [0, 255] when written
  int64_t battles = 0;
  int64_t wins = 0;
  int64_t losses = 0;
  int64_t sphere_attacks = 0;
  int64_t double_stands = 0;
  std::array<int64_t, 3> mode_counts = {0, 0, 0};
  // These are empty if the platform doesn't store them (when reading) or if
  // they should be left alone (when writing)
  std::vector<int64_t> opponent_wins;
  std::vector<int64_t> attribute_usage;

  StatsBlock() = default;
  // Non-numeric values (including NaN) are treated as zero
  explicit StatsBlock(const phosg::JSON& json);

  phosg::JSON json() const;

  bool operator==(const StatsBlock& other) const = default;
};

////////////////////////////////////////////////////////////////////////////////
// Field codecs. All of these check that the entire field is within data
// before reading or writing anything, so a failed write never modifies data.

int64_t creature_entry_offset(const SaveContext& ctx, size_t creature_id, size_t attribute_id);
CreatureEntry read_creature_entry(
    const std::string& data, const SaveContext& ctx, size_t creature_id, size_t attribute_id);
// Writes entry.id and entry.attribute into the record's ID and attribute bytes
// (not creature_id and attribute_id). The unknown bytes in the record are not
// modified.
void write_creature_entry(
    std::string& data, const SaveContext& ctx, size_t creature_id, size_t attribute_id, const CreatureEntry& entry);

bool read_card_flag(const std::string& data, const SaveContext& ctx, uint32_t card_id);
void write_card_flag(std::string& data, const SaveContext& ctx, uint32_t card_id, bool unlocked);
std::map<uint32_t, bool> read_card_flags(
    const std::string& data, const SaveContext& ctx, const std::vector<uint32_t>& card_ids);
// Parses a comma-separated list of card IDs (decimal or 0x-prefixed hex).
// Throws std::invalid_argument for anything that isn't a 32-bit ID.
std::vector<uint32_t> parse_card_ids(const std::string& s);
// Checks all card IDs before writing any flags
void write_card_flags(
    std::string& data, const SaveContext& ctx, const std::vector<uint32_t>& card_ids, bool unlocked);

std::string read_player_name(const std::string& data, const SaveContext& ctx);
// Names are truncated to 8 characters; characters outside of printable ASCII
// are replaced with '?'
void write_player_name(std::string& data, const SaveContext& ctx, const std::string& name);

std::map<std::string, uint8_t> read_styling(
    const std::string& data, const SaveContext& ctx, const StylingFieldList& fields);
// Only fields present in values are written; values are masked to 8 bits
void write_styling(
    std::string& data,
    const SaveContext& ctx,
    const StylingFieldList& fields,
    const std::map<std::string, int64_t>& values);
// Skips keys whose values are not numbers
std::map<std::string, int64_t> styling_values_from_json(const phosg::JSON& json);

Deck read_deck(const std::string& data, const SaveContext& ctx, size_t deck_index);
// Throws std::invalid_argument if any slot in deck can't be encoded
void write_deck(std::string& data, const SaveContext& ctx, size_t deck_index, const Deck& deck);

std::string read_deck_name(const std::string& data, const SaveContext& ctx, size_t deck_index);
void write_deck_name(std::string& data, const SaveContext& ctx, size_t deck_index, const std::string& name);

StatsBlock read_stats(const std::string& data, const SaveContext& ctx);
void write_stats(std::string& data, const SaveContext& ctx, const StatsBlock& stats);

// Decodes the save for inspection. The player name, styling and deck regions
// must be inside data (otherwise this throws offset_out_of_range), as must the
// deck names and stats block on platforms that have them. Creature records
// are included for creature IDs in [0, num_creatures), skipping any that don't
// fit in data.
phosg::JSON save_json(
    const std::string& data, const SaveContext& ctx, const StylingFieldList& fields, size_t num_creatures);
