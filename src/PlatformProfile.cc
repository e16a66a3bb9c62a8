#include "PlatformProfile.hh"

#include <format>
#include <stdexcept>

#include "Loggers.hh"

using namespace std;

// All offsets here are for the first save in the file (slot 0). For platforms
// with multiple saves per file, the resolver adds save_size * slot to each of
// them. Comments on individual constants note which values have been verified
// against real save files.

static StatsOffsets make_stats_offsets(int64_t base) {
  StatsOffsets ret;
  ret.ranking_points = base + 0x00;
  ret.creature_points = base + 0x04;
  ret.battles = base + 0x08;
  ret.wins = base + 0x09;
  ret.losses = base + 0x0A;
  ret.sphere_attacks = base + 0x0B;
  ret.double_stands = base + 0x0C;
  ret.mode_counts = {base + 0x0D, base + 0x0E, base + 0x0F};
  ret.opponent_wins = base + 0x10;
  ret.attribute_usage = base + 0x20;
  return ret;
}

static PlatformProfile make_ps3_profile() {
  PlatformProfile ret;
  ret.platform = Platform::PS3;
  ret.provisional = false;
  ret.save_size = nullopt; // One save per file
  ret.num_slots = 1;
  ret.base_offset = 227;
  // TODO: The card flag base is a guess derived from the Wii layout; it needs
  // to be checked against a PS3 save with known unlocked cards
  ret.card_base_offset = -48;
  ret.player_name_offset = 0x00C5;
  ret.styling_offset = 0x31BF;
  ret.deck_offsets = {0x2908, 0x2954};
  // TODO: Deck names and the stats block are assumed; neither position has
  // been checked against a PS3 save with known deck names or battle records
  ret.deck_name_back_offset = 0x14;
  ret.deck_names_provisional = true;
  ret.endianness = Endianness::BIG;
  ret.stats_offsets = make_stats_offsets(0x3200);
  ret.stats_provisional = true;
  return ret;
}

static PlatformProfile make_wii_profile() {
  // Everything in a Wii save is 0x30 bytes later than the corresponding field
  // in a PS3 save, except for the card flags, which begin at the start of the
  // save.
  PlatformProfile ret;
  ret.platform = Platform::WII;
  ret.provisional = false;
  ret.save_size = 13952;
  ret.num_slots = 4;
  ret.base_offset = 275;
  ret.card_base_offset = 0x0000;
  ret.player_name_offset = 0x00F5;
  ret.styling_offset = 0x31EF;
  ret.deck_offsets = {0x2938, 0x2984};
  ret.deck_name_back_offset = 0x14; // Assumed to match PS3
  ret.deck_names_provisional = true;
  ret.endianness = Endianness::BIG;
  ret.stats_offsets = make_stats_offsets(0x3230); // Assumed: PS3 layout + 0x30
  ret.stats_provisional = true;
  return ret;
}

static PlatformProfile make_x360_profile() {
  // None of these have been verified; they assume the same layout as PS3
  // with a 0x10-byte shift.
  PlatformProfile ret;
  ret.platform = Platform::X360;
  ret.provisional = true;
  ret.save_size = nullopt;
  ret.num_slots = 1;
  ret.base_offset = 243;
  ret.card_base_offset = -32;
  ret.player_name_offset = 0x00D5;
  ret.styling_offset = 0x31CF;
  ret.deck_offsets = {0x2918, 0x2964};
  ret.deck_name_back_offset = 0x14; // Assumed to match PS3
  ret.deck_names_provisional = true;
  ret.endianness = Endianness::BIG;
  ret.stats_offsets = nullopt;
  return ret;
}

static PlatformProfile make_ps2_profile() {
  // None of these have been verified. The PS2 version stores 16-bit values in
  // little-endian order and does not appear to store deck names at all.
  PlatformProfile ret;
  ret.platform = Platform::PS2;
  ret.provisional = true;
  ret.save_size = 0x3400;
  ret.num_slots = 4;
  ret.base_offset = 163;
  ret.card_base_offset = -0x70;
  ret.player_name_offset = 0x0085;
  ret.styling_offset = 0x317F;
  ret.deck_offsets = {0x28C8, 0x2914};
  ret.deck_name_back_offset = nullopt;
  ret.endianness = Endianness::LITTLE;
  ret.stats_offsets = nullopt;
  return ret;
}

static const phosg::JSON* get_key(const phosg::JSON& json, const char* key) {
  const auto& d = json.as_dict();
  auto it = d.find(key);
  return (it == d.end()) ? nullptr : it->second.get();
}

static optional<int64_t> optional_int_from_json(const phosg::JSON* json) {
  if (!json || json->is_null()) {
    return nullopt;
  }
  return json->as_int();
}

static phosg::JSON json_for_optional_int(const optional<int64_t>& v) {
  return v.has_value() ? phosg::JSON(*v) : phosg::JSON(nullptr);
}

StatsOffsets::StatsOffsets(const phosg::JSON& json) {
  this->ranking_points = json.at("RankingPoints").as_int();
  this->creature_points = json.at("CreaturePoints").as_int();
  this->battles = optional_int_from_json(get_key(json, "Battles"));
  this->wins = optional_int_from_json(get_key(json, "Wins"));
  this->losses = optional_int_from_json(get_key(json, "Losses"));
  this->sphere_attacks = optional_int_from_json(get_key(json, "SphereAttacks"));
  this->double_stands = optional_int_from_json(get_key(json, "DoubleStands"));
  const auto* mode_counts_json = get_key(json, "ModeCounts");
  if (mode_counts_json && !mode_counts_json->is_null()) {
    const auto& l = mode_counts_json->as_list();
    if (l.size() != this->mode_counts.size()) {
      throw runtime_error("ModeCounts must have exactly 3 entries");
    }
    for (size_t z = 0; z < this->mode_counts.size(); z++) {
      this->mode_counts[z] = optional_int_from_json(l[z].get());
    }
  }
  this->opponent_wins = optional_int_from_json(get_key(json, "OpponentWins"));
  this->attribute_usage = optional_int_from_json(get_key(json, "AttributeUsage"));
}

phosg::JSON StatsOffsets::json() const {
  auto mode_counts_json = phosg::JSON::list();
  for (const auto& it : this->mode_counts) {
    mode_counts_json.emplace_back(json_for_optional_int(it));
  }
  return phosg::JSON::dict({
      {"RankingPoints", this->ranking_points},
      {"CreaturePoints", this->creature_points},
      {"Battles", json_for_optional_int(this->battles)},
      {"Wins", json_for_optional_int(this->wins)},
      {"Losses", json_for_optional_int(this->losses)},
      {"SphereAttacks", json_for_optional_int(this->sphere_attacks)},
      {"DoubleStands", json_for_optional_int(this->double_stands)},
      {"ModeCounts", std::move(mode_counts_json)},
      {"OpponentWins", json_for_optional_int(this->opponent_wins)},
      {"AttributeUsage", json_for_optional_int(this->attribute_usage)},
  });
}

StatsOffsets StatsOffsets::shifted(int64_t shift) const {
  auto shift_opt = [shift](const optional<int64_t>& v) -> optional<int64_t> {
    return v.has_value() ? optional<int64_t>(*v + shift) : nullopt;
  };
  StatsOffsets ret;
  ret.ranking_points = this->ranking_points + shift;
  ret.creature_points = this->creature_points + shift;
  ret.battles = shift_opt(this->battles);
  ret.wins = shift_opt(this->wins);
  ret.losses = shift_opt(this->losses);
  ret.sphere_attacks = shift_opt(this->sphere_attacks);
  ret.double_stands = shift_opt(this->double_stands);
  for (size_t z = 0; z < this->mode_counts.size(); z++) {
    ret.mode_counts[z] = shift_opt(this->mode_counts[z]);
  }
  ret.opponent_wins = shift_opt(this->opponent_wins);
  ret.attribute_usage = shift_opt(this->attribute_usage);
  return ret;
}

void PlatformProfile::apply_json(const phosg::JSON& json) {
  const char* platform_name = phosg::name_for_enum(this->platform);

  if (const auto* v = get_key(json, "Provisional")) {
    this->provisional = v->as_bool();
  }
  if (const auto* v = get_key(json, "DeckNamesProvisional")) {
    this->deck_names_provisional = v->as_bool();
  }
  if (const auto* v = get_key(json, "StatsProvisional")) {
    this->stats_provisional = v->as_bool();
  }
  if (const auto* v = get_key(json, "SaveSize")) {
    if (v->is_null()) {
      this->save_size = nullopt;
    } else {
      int64_t size = v->as_int();
      if (size <= 0 || size > 0xFFFFFFFF) {
        throw runtime_error(std::format("({}) SaveSize is out of range", platform_name));
      }
      this->save_size = size;
    }
  }
  if (const auto* v = get_key(json, "NumSlots")) {
    int64_t num_slots = v->as_int();
    if (num_slots < 1) {
      throw runtime_error(std::format("({}) NumSlots must be at least 1", platform_name));
    }
    this->num_slots = num_slots;
  }
  if (const auto* v = get_key(json, "BaseOffset")) {
    this->base_offset = v->as_int();
  }
  if (const auto* v = get_key(json, "CardBaseOffset")) {
    this->card_base_offset = v->as_int();
  }
  if (const auto* v = get_key(json, "PlayerNameOffset")) {
    this->player_name_offset = v->as_int();
  }
  if (const auto* v = get_key(json, "StylingOffset")) {
    this->styling_offset = v->as_int();
  }
  if (const auto* v = get_key(json, "DeckOffsets")) {
    const auto& l = v->as_list();
    if (l.size() != this->deck_offsets.size()) {
      throw runtime_error(std::format("({}) DeckOffsets must have exactly 2 entries", platform_name));
    }
    for (size_t z = 0; z < this->deck_offsets.size(); z++) {
      this->deck_offsets[z] = l[z]->as_int();
    }
  }
  if (const auto* v = get_key(json, "DeckNameBackOffset")) {
    if (v->is_null()) {
      this->deck_name_back_offset = nullopt;
    } else {
      int64_t back_offset = v->as_int();
      if (back_offset < 0 || back_offset > 0xFFFFFFFF) {
        throw runtime_error(std::format("({}) DeckNameBackOffset is out of range", platform_name));
      }
      this->deck_name_back_offset = back_offset;
    }
  }
  if (const auto* v = get_key(json, "Endianness")) {
    this->endianness = phosg::enum_for_name<Endianness>(v->as_string().c_str());
  }
  if (const auto* v = get_key(json, "Stats")) {
    if (v->is_null()) {
      this->stats_offsets = nullopt;
    } else {
      this->stats_offsets = StatsOffsets(*v);
    }
  }

  if (!this->save_size.has_value() && (this->num_slots != 1)) {
    throw runtime_error(std::format(
        "({}) NumSlots is {} but SaveSize is not set", platform_name, this->num_slots));
  }
}

phosg::JSON PlatformProfile::json() const {
  auto deck_offsets_json = phosg::JSON::list();
  for (int64_t offset : this->deck_offsets) {
    deck_offsets_json.emplace_back(offset);
  }
  return phosg::JSON::dict({
      {"Provisional", this->provisional},
      {"DeckNamesProvisional", this->deck_names_provisional},
      {"StatsProvisional", this->stats_provisional},
      {"SaveSize", this->save_size.has_value() ? phosg::JSON(*this->save_size) : phosg::JSON(nullptr)},
      {"NumSlots", this->num_slots},
      {"BaseOffset", this->base_offset},
      {"CardBaseOffset", this->card_base_offset},
      {"PlayerNameOffset", this->player_name_offset},
      {"StylingOffset", this->styling_offset},
      {"DeckOffsets", std::move(deck_offsets_json)},
      {"DeckNameBackOffset", this->deck_name_back_offset.has_value()
              ? phosg::JSON(*this->deck_name_back_offset)
              : phosg::JSON(nullptr)},
      {"Endianness", phosg::name_for_enum(this->endianness)},
      {"Stats", this->stats_offsets.has_value() ? this->stats_offsets->json() : phosg::JSON(nullptr)},
  });
}

PlatformProfileTable::PlatformProfileTable()
    : profiles{{make_ps3_profile(), make_wii_profile(), make_x360_profile(), make_ps2_profile()}} {}

PlatformProfileTable::PlatformProfileTable(const phosg::JSON& overrides_json)
    : PlatformProfileTable() {
  for (const auto& it : overrides_json.as_dict()) {
    Platform platform = phosg::enum_for_name<Platform>(it.first.c_str());
    auto& profile = this->profiles.at(static_cast<size_t>(platform));
    profile.apply_json(*it.second);
    config_log.info_f("Applied profile overrides for {}", phosg::name_for_enum(platform));
  }
}

const PlatformProfile& PlatformProfileTable::get(Platform platform) const {
  size_t index = static_cast<size_t>(platform);
  if (index >= this->profiles.size()) {
    throw unknown_platform(std::format("#{}", index));
  }
  return this->profiles[index];
}

const PlatformProfile& PlatformProfileTable::get(const string& platform_name) const {
  return this->get(phosg::enum_for_name<Platform>(platform_name.c_str()));
}

phosg::JSON PlatformProfileTable::json() const {
  auto ret = phosg::JSON::dict();
  for (const auto& profile : this->profiles) {
    ret.emplace(phosg::name_for_enum(profile.platform), profile.json());
  }
  return ret;
}

const PlatformProfileTable& default_platform_profile_table() {
  static const PlatformProfileTable table;
  return table;
}
