#include "SaveFileFormats.hh"

#include <math.h>

#include <algorithm>
#include <format>
#include <phosg/Strings.hh>
#include <stdexcept>
#include <string>

#include "Loggers.hh"

using namespace std;

offset_out_of_range::offset_out_of_range(const string& what, int64_t offset, size_t size, size_t file_size)
    : out_of_range(std::format("{} at offset {} (length {}) out of range (file size: {})",
          what, offset, size, file_size)) {}

invalid_deck_index::invalid_deck_index(size_t deck_index)
    : invalid_argument(std::format("invalid deck index {}", deck_index)) {}

deck_names_unsupported::deck_names_unsupported(Platform platform)
    : runtime_error(std::format("deck names are not supported on {}", phosg::name_for_enum(platform))) {}

stats_unsupported::stats_unsupported(Platform platform)
    : runtime_error(std::format("stats are unavailable on {}", phosg::name_for_enum(platform))) {}

static size_t check_range(const string& data, int64_t offset, size_t size, const string& what) {
  if ((offset < 0) || (static_cast<uint64_t>(offset) + size > data.size())) {
    throw offset_out_of_range(what, offset, size, data.size());
  }
  return static_cast<size_t>(offset);
}

static bool is_big_endian(const SaveContext& ctx) {
  return (ctx.endianness == Endianness::BIG);
}

static phosg::JSON json_for_optional_int(const optional<int64_t>& v) {
  return v.has_value() ? phosg::JSON(*v) : phosg::JSON(nullptr);
}

static const phosg::JSON* get_key(const phosg::JSON& json, const char* key) {
  const auto& d = json.as_dict();
  auto it = d.find(key);
  return (it == d.end()) ? nullptr : it->second.get();
}

static int64_t int_or_zero(const phosg::JSON* json) {
  if (!json) {
    return 0;
  } else if (json->is_int()) {
    return json->as_int();
  } else if (json->is_float()) {
    double v = json->as_float();
    return isnan(v) ? 0 : llround(v);
  } else {
    return 0;
  }
}

static uint8_t clamp_u8(int64_t v) {
  return static_cast<uint8_t>(clamp<int64_t>(v, 0, 0xFF));
}

////////////////////////////////////////////////////////////////////////////////
// Creature entries

static int64_t creature_int_from_json(const phosg::JSON& json, const char* key, int64_t max_value) {
  int64_t v = int_or_zero(get_key(json, key));
  if ((v < 0) || (v > max_value)) {
    throw invalid_argument(std::format("creature {} {} is out of range", key, v));
  }
  return v;
}

CreatureEntry::CreatureEntry(const phosg::JSON& json)
    : id(creature_int_from_json(json, "ID", 0xFF)),
      attribute(creature_int_from_json(json, "Attribute", 0xFF)),
      power(creature_int_from_json(json, "Power", 0xFFFF)),
      speed(creature_int_from_json(json, "Speed", 0xFF)),
      defense(creature_int_from_json(json, "Defense", 0xFF)),
      acceleration(creature_int_from_json(json, "Acceleration", 0xFF)),
      endurance(creature_int_from_json(json, "Endurance", 0xFF)),
      jump(creature_int_from_json(json, "Jump", 0xFF)),
      level(creature_int_from_json(json, "Level", 0xFF)) {}

phosg::JSON CreatureEntry::json() const {
  return phosg::JSON::dict({
      {"ID", this->id},
      {"Attribute", this->attribute},
      {"Power", this->power},
      {"Speed", this->speed},
      {"Defense", this->defense},
      {"Acceleration", this->acceleration},
      {"Endurance", this->endurance},
      {"Jump", this->jump},
      {"Level", this->level},
  });
}

int64_t creature_entry_offset(const SaveContext& ctx, size_t creature_id, size_t attribute_id) {
  return ctx.base_offset +
      static_cast<int64_t>(creature_id * CREATURE_BLOCK_SIZE) +
      static_cast<int64_t>(attribute_id * ATTRIBUTE_BLOCK_SIZE);
}

template <bool BE>
static CreatureEntry read_creature_entry_t(const string& data, size_t offset) {
  const auto& rec = *reinterpret_cast<const CreatureRecordT<BE>*>(data.data() + offset);
  CreatureEntry ret;
  ret.id = rec.id;
  ret.attribute = rec.attribute;
  ret.power = rec.power.load();
  ret.speed = rec.speed;
  ret.defense = rec.defense;
  ret.acceleration = rec.acceleration;
  ret.endurance = rec.endurance;
  ret.jump = rec.jump;
  ret.level = rec.level;
  return ret;
}

template <bool BE>
static void write_creature_entry_t(string& data, size_t offset, const CreatureEntry& entry) {
  auto& rec = *reinterpret_cast<CreatureRecordT<BE>*>(data.data() + offset);
  rec.id = entry.id;
  rec.attribute = entry.attribute;
  rec.power = entry.power;
  rec.speed = entry.speed;
  rec.defense = entry.defense;
  rec.acceleration = entry.acceleration;
  rec.endurance = entry.endurance;
  rec.jump = entry.jump;
  rec.level = entry.level;
}

CreatureEntry read_creature_entry(
    const string& data, const SaveContext& ctx, size_t creature_id, size_t attribute_id) {
  size_t offset = check_range(data, creature_entry_offset(ctx, creature_id, attribute_id), CREATURE_ENTRY_SIZE,
      std::format("Creature entry {}/{}", creature_id, attribute_id));
  return is_big_endian(ctx)
      ? read_creature_entry_t<true>(data, offset)
      : read_creature_entry_t<false>(data, offset);
}

void write_creature_entry(
    string& data, const SaveContext& ctx, size_t creature_id, size_t attribute_id, const CreatureEntry& entry) {
  size_t offset = check_range(data, creature_entry_offset(ctx, creature_id, attribute_id), CREATURE_ENTRY_SIZE,
      std::format("Creature entry {}/{}", creature_id, attribute_id));
  if (is_big_endian(ctx)) {
    write_creature_entry_t<true>(data, offset, entry);
  } else {
    write_creature_entry_t<false>(data, offset, entry);
  }
  codec_log.debug_f("Wrote creature entry {}/{} at offset 0x{:X}", creature_id, attribute_id, offset);
}

////////////////////////////////////////////////////////////////////////////////
// Card flags

static size_t card_flag_offset(const string& data, const SaveContext& ctx, uint32_t card_id) {
  return check_range(data, ctx.card_base_offset + static_cast<int64_t>(card_id), 1,
      std::format("Card flag {}", card_id));
}

bool read_card_flag(const string& data, const SaveContext& ctx, uint32_t card_id) {
  return data[card_flag_offset(data, ctx, card_id)] != 0;
}

void write_card_flag(string& data, const SaveContext& ctx, uint32_t card_id, bool unlocked) {
  data[card_flag_offset(data, ctx, card_id)] = unlocked ? 1 : 0;
}

vector<uint32_t> parse_card_ids(const string& s) {
  vector<uint32_t> ret;
  for (const auto& token : phosg::split(s, ',')) {
    size_t end_pos = 0;
    unsigned long long v;
    try {
      v = stoull(token, &end_pos, 0);
    } catch (const logic_error&) {
      throw invalid_argument(std::format("invalid card ID: {}", token));
    }
    if ((end_pos != token.size()) || (token.find('-') != string::npos)) {
      throw invalid_argument(std::format("invalid card ID: {}", token));
    }
    if (v > 0xFFFFFFFF) {
      throw invalid_argument(std::format("card ID {} is out of range", token));
    }
    ret.emplace_back(v);
  }
  return ret;
}

map<uint32_t, bool> read_card_flags(const string& data, const SaveContext& ctx, const vector<uint32_t>& card_ids) {
  map<uint32_t, bool> ret;
  for (uint32_t card_id : card_ids) {
    ret.emplace(card_id, read_card_flag(data, ctx, card_id));
  }
  return ret;
}

void write_card_flags(string& data, const SaveContext& ctx, const vector<uint32_t>& card_ids, bool unlocked) {
  vector<size_t> offsets;
  offsets.reserve(card_ids.size());
  for (uint32_t card_id : card_ids) {
    offsets.emplace_back(card_flag_offset(data, ctx, card_id));
  }
  for (size_t offset : offsets) {
    data[offset] = unlocked ? 1 : 0;
  }
  codec_log.debug_f("{} {} cards", unlocked ? "Unlocked" : "Locked", offsets.size());
}

////////////////////////////////////////////////////////////////////////////////
// Names

// Names are stored as one ASCII character per 2 bytes; the second byte of each
// pair is always zero. Names shorter than the maximum length are terminated by
// a zero character byte.

static string read_padded_ascii(const string& data, size_t offset, size_t max_chars) {
  string ret;
  for (size_t z = 0; z < max_chars; z++) {
    char ch = data[offset + z * 2];
    if (ch == 0) {
      break;
    }
    ret.push_back(ch);
  }
  return ret;
}

static void write_padded_ascii(string& data, size_t offset, size_t max_chars, const string& s) {
  for (size_t z = 0; z < max_chars; z++) {
    uint8_t ch = 0;
    if (z < s.size()) {
      ch = static_cast<uint8_t>(s[z]);
      if ((ch < 0x20) || (ch > 0x7E)) {
        ch = '?';
      }
    }
    data[offset + z * 2] = ch;
    data[offset + z * 2 + 1] = 0;
  }
}

string read_player_name(const string& data, const SaveContext& ctx) {
  size_t offset = check_range(data, ctx.player_name_offset, PLAYER_NAME_MAX_CHARS * 2, "Player name");
  return read_padded_ascii(data, offset, PLAYER_NAME_MAX_CHARS);
}

void write_player_name(string& data, const SaveContext& ctx, const string& name) {
  size_t offset = check_range(data, ctx.player_name_offset, PLAYER_NAME_MAX_CHARS * 2, "Player name");
  write_padded_ascii(data, offset, PLAYER_NAME_MAX_CHARS, name);
  codec_log.debug_f("Wrote player name at offset 0x{:X}", offset);
}

////////////////////////////////////////////////////////////////////////////////
// Styling

map<string, uint8_t> read_styling(const string& data, const SaveContext& ctx, const StylingFieldList& fields) {
  size_t offset = check_range(data, ctx.styling_offset, STYLING_BLOCK_SIZE, "Styling block");
  map<string, uint8_t> ret;
  for (const auto& field : fields.all()) {
    ret.emplace(field.key, data[offset + field.sub_offset]);
  }
  return ret;
}

void write_styling(
    string& data,
    const SaveContext& ctx,
    const StylingFieldList& fields,
    const map<string, int64_t>& values) {
  size_t offset = check_range(data, ctx.styling_offset, STYLING_BLOCK_SIZE, "Styling block");
  size_t num_written = 0;
  for (const auto& field : fields.all()) {
    auto it = values.find(field.key);
    if (it == values.end()) {
      continue;
    }
    data[offset + field.sub_offset] = it->second & 0xFF;
    if (field.sub_offset + 1 < STYLING_BLOCK_SIZE) {
      data[offset + field.sub_offset + 1] = 0;
    }
    num_written++;
  }
  codec_log.debug_f("Wrote {} styling fields in block at offset 0x{:X}", num_written, offset);
}

map<string, int64_t> styling_values_from_json(const phosg::JSON& json) {
  map<string, int64_t> ret;
  for (const auto& it : json.as_dict()) {
    if (it.second->is_int()) {
      ret.emplace(it.first, it.second->as_int());
    } else if (it.second->is_float() && !isnan(it.second->as_float())) {
      ret.emplace(it.first, llround(it.second->as_float()));
    }
  }
  return ret;
}

////////////////////////////////////////////////////////////////////////////////
// Decks

static int64_t deck_int_from_json(const phosg::JSON& json, int64_t max_value, const char* what) {
  int64_t v = json.as_int();
  if ((v < 0) || (v > max_value)) {
    throw invalid_argument(std::format("{} {} is out of range", what, v));
  }
  return v;
}

static optional<uint32_t> card_id_from_json(const phosg::JSON& json) {
  if (json.is_null()) {
    return nullopt;
  }
  return deck_int_from_json(json, 0xFFFFFFFF, "card ID");
}

Deck::Deck(const phosg::JSON& json) {
  // Slots not present in the JSON are empty
  if (const auto* creatures_json = get_key(json, "Creatures")) {
    const auto& l = creatures_json->as_list();
    for (size_t z = 0; z < min<size_t>(l.size(), NUM_DECK_SLOTS); z++) {
      if (l[z]->is_null()) {
        continue;
      }
      const auto* creature_id_json = get_key(*l[z], "CreatureID");
      if (creature_id_json && !creature_id_json->is_null()) {
        this->creatures[z].creature_id = deck_int_from_json(*creature_id_json, 0xFFFF, "creature ID");
      }
      const auto* attribute_id_json = get_key(*l[z], "AttributeID");
      if (attribute_id_json && !attribute_id_json->is_null()) {
        this->creatures[z].attribute_id = deck_int_from_json(*attribute_id_json, 0xFF, "attribute ID");
      }
    }
  }
  if (const auto* gate_cards_json = get_key(json, "GateCards")) {
    const auto& l = gate_cards_json->as_list();
    for (size_t z = 0; z < min<size_t>(l.size(), NUM_DECK_SLOTS); z++) {
      this->gate_cards[z] = card_id_from_json(*l[z]);
    }
  }
  if (const auto* ability_cards_json = get_key(json, "AbilityCards")) {
    const auto& l = ability_cards_json->as_list();
    for (size_t z = 0; z < min<size_t>(l.size(), NUM_DECK_SLOTS); z++) {
      this->ability_cards[z] = card_id_from_json(*l[z]);
    }
  }
}

phosg::JSON Deck::json() const {
  auto creatures_json = phosg::JSON::list();
  for (const auto& slot : this->creatures) {
    if (slot.is_empty()) {
      creatures_json.emplace_back(phosg::JSON(nullptr));
    } else {
      creatures_json.emplace_back(phosg::JSON::dict({
          {"CreatureID", *slot.creature_id},
          {"AttributeID", *slot.attribute_id},
      }));
    }
  }
  auto gate_cards_json = phosg::JSON::list();
  for (const auto& card_id : this->gate_cards) {
    gate_cards_json.emplace_back(json_for_optional_int(card_id));
  }
  auto ability_cards_json = phosg::JSON::list();
  for (const auto& card_id : this->ability_cards) {
    ability_cards_json.emplace_back(json_for_optional_int(card_id));
  }
  return phosg::JSON::dict({
      {"Creatures", std::move(creatures_json)},
      {"GateCards", std::move(gate_cards_json)},
      {"AbilityCards", std::move(ability_cards_json)},
  });
}

static uint16_t encode_creature_slot(const DeckCreatureSlot& slot) {
  if (slot.is_empty()) {
    return EMPTY_DECK_SLOT;
  }
  if (*slot.attribute_id >= NUM_ATTRIBUTES) {
    throw invalid_argument(std::format("attribute ID {} is out of range", *slot.attribute_id));
  }
  uint32_t v = *slot.creature_id * NUM_ATTRIBUTES + *slot.attribute_id;
  if (v >= EMPTY_DECK_SLOT) {
    throw invalid_argument(std::format("creature ID {} is out of range", *slot.creature_id));
  }
  return v;
}

static uint16_t encode_card_slot(const optional<uint32_t>& card_id) {
  if (!card_id.has_value()) {
    return EMPTY_DECK_SLOT;
  }
  if ((*card_id < DECK_CARD_BASE_ID) || (*card_id - DECK_CARD_BASE_ID >= EMPTY_DECK_SLOT)) {
    throw invalid_argument(std::format("card ID {} cannot be stored in a deck", *card_id));
  }
  return *card_id - DECK_CARD_BASE_ID;
}

static optional<uint32_t> decode_card_slot(uint16_t v) {
  if (v == EMPTY_DECK_SLOT) {
    return nullopt;
  }
  return v + DECK_CARD_BASE_ID;
}

template <bool BE>
static Deck read_deck_t(const string& data, size_t offset) {
  const auto& rec = *reinterpret_cast<const DeckRecordT<BE>*>(data.data() + offset);
  Deck ret;
  for (size_t z = 0; z < NUM_DECK_SLOTS; z++) {
    uint16_t v = rec.creatures[z].load();
    if (v != EMPTY_DECK_SLOT) {
      ret.creatures[z].creature_id = v / NUM_ATTRIBUTES;
      ret.creatures[z].attribute_id = v % NUM_ATTRIBUTES;
    }
    ret.gate_cards[z] = decode_card_slot(rec.gate_cards[z].load());
    ret.ability_cards[z] = decode_card_slot(rec.ability_cards[z].load());
  }
  return ret;
}

template <bool BE>
static void write_deck_t(
    string& data,
    size_t offset,
    const array<uint16_t, NUM_DECK_SLOTS>& creatures,
    const array<uint16_t, NUM_DECK_SLOTS>& gate_cards,
    const array<uint16_t, NUM_DECK_SLOTS>& ability_cards) {
  auto& rec = *reinterpret_cast<DeckRecordT<BE>*>(data.data() + offset);
  for (size_t z = 0; z < NUM_DECK_SLOTS; z++) {
    rec.creatures[z] = creatures[z];
    rec.gate_cards[z] = gate_cards[z];
    rec.ability_cards[z] = ability_cards[z];
  }
  rec.unused1.clear(0xFF);
  rec.unused2.clear(0xFF);
  rec.unused3.clear(0xFF);
}

static size_t deck_offset(const string& data, const SaveContext& ctx, size_t deck_index) {
  if (deck_index >= ctx.deck_offsets.size()) {
    throw invalid_deck_index(deck_index);
  }
  return check_range(data, ctx.deck_offsets[deck_index], DECK_SIZE, std::format("Deck {}", deck_index + 1));
}

Deck read_deck(const string& data, const SaveContext& ctx, size_t deck_index) {
  size_t offset = deck_offset(data, ctx, deck_index);
  return is_big_endian(ctx) ? read_deck_t<true>(data, offset) : read_deck_t<false>(data, offset);
}

void write_deck(string& data, const SaveContext& ctx, size_t deck_index, const Deck& deck) {
  size_t offset = deck_offset(data, ctx, deck_index);

  // Encode everything before writing, so an unencodable slot leaves the deck
  // unmodified
  array<uint16_t, NUM_DECK_SLOTS> creatures;
  array<uint16_t, NUM_DECK_SLOTS> gate_cards;
  array<uint16_t, NUM_DECK_SLOTS> ability_cards;
  for (size_t z = 0; z < NUM_DECK_SLOTS; z++) {
    creatures[z] = encode_creature_slot(deck.creatures[z]);
    gate_cards[z] = encode_card_slot(deck.gate_cards[z]);
    ability_cards[z] = encode_card_slot(deck.ability_cards[z]);
  }

  if (is_big_endian(ctx)) {
    write_deck_t<true>(data, offset, creatures, gate_cards, ability_cards);
  } else {
    write_deck_t<false>(data, offset, creatures, gate_cards, ability_cards);
  }
  codec_log.debug_f("Wrote deck {} at offset 0x{:X}", deck_index + 1, offset);
}

static size_t deck_name_offset(const string& data, const SaveContext& ctx, size_t deck_index) {
  if (!ctx.deck_name_offsets.has_value()) {
    throw deck_names_unsupported(ctx.platform);
  }
  if (deck_index >= ctx.deck_name_offsets->size()) {
    throw invalid_deck_index(deck_index);
  }
  return check_range(data, ctx.deck_name_offsets->at(deck_index), DECK_NAME_MAX_CHARS * 2,
      std::format("Deck {} name", deck_index + 1));
}

string read_deck_name(const string& data, const SaveContext& ctx, size_t deck_index) {
  return read_padded_ascii(data, deck_name_offset(data, ctx, deck_index), DECK_NAME_MAX_CHARS);
}

void write_deck_name(string& data, const SaveContext& ctx, size_t deck_index, const string& name) {
  size_t offset = deck_name_offset(data, ctx, deck_index);
  write_padded_ascii(data, offset, DECK_NAME_MAX_CHARS, name);
  codec_log.debug_f("Wrote deck {} name at offset 0x{:X}", deck_index + 1, offset);
}

////////////////////////////////////////////////////////////////////////////////
// Stats

static vector<int64_t> int_list_from_json(const phosg::JSON* json) {
  vector<int64_t> ret;
  if (json && !json->is_null()) {
    for (const auto& it : json->as_list()) {
      ret.emplace_back(int_or_zero(it.get()));
    }
  }
  return ret;
}

static phosg::JSON json_for_int_list(const vector<int64_t>& values) {
  auto ret = phosg::JSON::list();
  for (int64_t v : values) {
    ret.emplace_back(v);
  }
  return ret;
}

StatsBlock::StatsBlock(const phosg::JSON& json)
    : ranking_points(int_or_zero(get_key(json, "RankingPoints"))),
      creature_points(int_or_zero(get_key(json, "CreaturePoints"))),
      battles(int_or_zero(get_key(json, "Battles"))),
      wins(int_or_zero(get_key(json, "Wins"))),
      losses(int_or_zero(get_key(json, "Losses"))),
      sphere_attacks(int_or_zero(get_key(json, "SphereAttacks"))),
      double_stands(int_or_zero(get_key(json, "DoubleStands"))),
      opponent_wins(int_list_from_json(get_key(json, "OpponentWins"))),
      attribute_usage(int_list_from_json(get_key(json, "AttributeUsage"))) {
  auto mode_counts = int_list_from_json(get_key(json, "ModeCounts"));
  for (size_t z = 0; z < min<size_t>(mode_counts.size(), this->mode_counts.size()); z++) {
    this->mode_counts[z] = mode_counts[z];
  }
}

phosg::JSON StatsBlock::json() const {
  return phosg::JSON::dict({
      {"RankingPoints", this->ranking_points},
      {"CreaturePoints", this->creature_points},
      {"Battles", this->battles},
      {"Wins", this->wins},
      {"Losses", this->losses},
      {"SphereAttacks", this->sphere_attacks},
      {"DoubleStands", this->double_stands},
      {"ModeCounts", json_for_int_list(vector<int64_t>(this->mode_counts.begin(), this->mode_counts.end()))},
      {"OpponentWins", json_for_int_list(this->opponent_wins)},
      {"AttributeUsage", json_for_int_list(this->attribute_usage)},
  });
}

static const StatsOffsets& stats_offsets_for_context(const string& data, const SaveContext& ctx) {
  if (!ctx.stats_offsets.has_value()) {
    throw stats_unsupported(ctx.platform);
  }
  const auto& offsets = *ctx.stats_offsets;

  check_range(data, offsets.ranking_points, 3, "Ranking points");
  check_range(data, offsets.creature_points, 3, "Creature points");
  auto check_opt = [&](const optional<int64_t>& offset, size_t size, const char* what) -> void {
    if (offset.has_value()) {
      check_range(data, *offset, size, what);
    }
  };
  check_opt(offsets.battles, 1, "Battle count");
  check_opt(offsets.wins, 1, "Win count");
  check_opt(offsets.losses, 1, "Loss count");
  check_opt(offsets.sphere_attacks, 1, "Sphere attack count");
  check_opt(offsets.double_stands, 1, "Double stand count");
  for (const auto& offset : offsets.mode_counts) {
    check_opt(offset, 1, "Game mode count");
  }
  check_opt(offsets.opponent_wins, NUM_OPPONENTS, "Opponent win counts");
  check_opt(offsets.attribute_usage, NUM_ATTRIBUTE_USAGE_ENTRIES * 2, "Attribute usage counts");
  return offsets;
}

StatsBlock read_stats(const string& data, const SaveContext& ctx) {
  const auto& offsets = stats_offsets_for_context(data, ctx);
  auto read_opt = [&](const optional<int64_t>& offset) -> int64_t {
    return offset.has_value() ? static_cast<uint8_t>(data[*offset]) : 0;
  };

  StatsBlock ret;
  ret.ranking_points = read_u24(data, offsets.ranking_points, ctx.endianness);
  ret.creature_points = read_u24(data, offsets.creature_points, ctx.endianness);
  ret.battles = read_opt(offsets.battles);
  ret.wins = read_opt(offsets.wins);
  ret.losses = read_opt(offsets.losses);
  ret.sphere_attacks = read_opt(offsets.sphere_attacks);
  ret.double_stands = read_opt(offsets.double_stands);
  for (size_t z = 0; z < ret.mode_counts.size(); z++) {
    ret.mode_counts[z] = read_opt(offsets.mode_counts[z]);
  }
  if (offsets.opponent_wins.has_value()) {
    for (size_t z = 0; z < NUM_OPPONENTS; z++) {
      ret.opponent_wins.emplace_back(static_cast<uint8_t>(data[*offsets.opponent_wins + z]));
    }
  }
  if (offsets.attribute_usage.has_value()) {
    for (size_t z = 0; z < NUM_ATTRIBUTE_USAGE_ENTRIES; z++) {
      ret.attribute_usage.emplace_back(static_cast<uint8_t>(data[*offsets.attribute_usage + z * 2]));
    }
  }
  return ret;
}

void write_stats(string& data, const SaveContext& ctx, const StatsBlock& stats) {
  const auto& offsets = stats_offsets_for_context(data, ctx);
  auto write_opt = [&](const optional<int64_t>& offset, int64_t value) -> void {
    if (offset.has_value()) {
      data[*offset] = clamp_u8(value);
    }
  };

  write_u24(data, offsets.ranking_points, stats.ranking_points & 0xFFFFFF, ctx.endianness);
  write_u24(data, offsets.creature_points, stats.creature_points & 0xFFFFFF, ctx.endianness);
  write_opt(offsets.battles, stats.battles);
  write_opt(offsets.wins, stats.wins);
  write_opt(offsets.losses, stats.losses);
  write_opt(offsets.sphere_attacks, stats.sphere_attacks);
  write_opt(offsets.double_stands, stats.double_stands);
  for (size_t z = 0; z < stats.mode_counts.size(); z++) {
    write_opt(offsets.mode_counts[z], stats.mode_counts[z]);
  }
  if (offsets.opponent_wins.has_value()) {
    for (size_t z = 0; z < min<size_t>(stats.opponent_wins.size(), NUM_OPPONENTS); z++) {
      data[*offsets.opponent_wins + z] = clamp_u8(stats.opponent_wins[z]);
    }
  }
  if (offsets.attribute_usage.has_value()) {
    for (size_t z = 0; z < min<size_t>(stats.attribute_usage.size(), NUM_ATTRIBUTE_USAGE_ENTRIES); z++) {
      data[*offsets.attribute_usage + z * 2] = clamp_u8(stats.attribute_usage[z]);
      data[*offsets.attribute_usage + z * 2 + 1] = 0;
    }
  }
  codec_log.debug_f("Wrote stats block for slot {}", ctx.slot);
}

////////////////////////////////////////////////////////////////////////////////
// Whole-save export

phosg::JSON save_json(const string& data, const SaveContext& ctx, const StylingFieldList& fields, size_t num_creatures) {
  auto ret = phosg::JSON::dict({
      {"Platform", phosg::name_for_enum(ctx.platform)},
      {"Slot", ctx.slot},
      {"PlayerName", read_player_name(data, ctx)},
  });

  auto styling_json = phosg::JSON::dict();
  for (const auto& [key, value] : read_styling(data, ctx, fields)) {
    styling_json.emplace(key, value);
  }
  ret.emplace("Styling", std::move(styling_json));

  auto decks_json = phosg::JSON::list();
  for (size_t z = 0; z < NUM_DECKS; z++) {
    auto deck_json = read_deck(data, ctx, z).json();
    if (ctx.deck_name_offsets.has_value()) {
      deck_json.emplace("Name", read_deck_name(data, ctx, z));
    }
    decks_json.emplace_back(std::move(deck_json));
  }
  ret.emplace("Decks", std::move(decks_json));

  ret.emplace("Stats", ctx.stats_offsets.has_value() ? read_stats(data, ctx).json() : phosg::JSON(nullptr));

  auto creatures_json = phosg::JSON::list();
  for (size_t creature_id = 0; creature_id < num_creatures; creature_id++) {
    for (size_t attribute_id = 0; attribute_id < NUM_ATTRIBUTES; attribute_id++) {
      int64_t offset = creature_entry_offset(ctx, creature_id, attribute_id);
      if ((offset < 0) || (static_cast<uint64_t>(offset) + CREATURE_ENTRY_SIZE > data.size())) {
        continue;
      }
      auto entry_json = read_creature_entry(data, ctx, creature_id, attribute_id).json();
      entry_json.emplace("CreatureID", creature_id);
      entry_json.emplace("AttributeID", attribute_id);
      creatures_json.emplace_back(std::move(entry_json));
    }
  }
  ret.emplace("Creatures", std::move(creatures_json));

  return ret;
}
