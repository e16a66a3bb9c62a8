#include "SaveContext.hh"

#include "Loggers.hh"

using namespace std;

phosg::JSON SaveContext::json() const {
  auto deck_offsets_json = phosg::JSON::list();
  for (int64_t offset : this->deck_offsets) {
    deck_offsets_json.emplace_back(offset);
  }
  phosg::JSON deck_name_offsets_json(nullptr);
  if (this->deck_name_offsets.has_value()) {
    deck_name_offsets_json = phosg::JSON::list();
    for (int64_t offset : *this->deck_name_offsets) {
      deck_name_offsets_json.emplace_back(offset);
    }
  }
  return phosg::JSON::dict({
      {"Platform", phosg::name_for_enum(this->platform)},
      {"Slot", this->slot},
      {"Shift", this->shift},
      {"BaseOffset", this->base_offset},
      {"CardBaseOffset", this->card_base_offset},
      {"PlayerNameOffset", this->player_name_offset},
      {"StylingOffset", this->styling_offset},
      {"DeckOffsets", std::move(deck_offsets_json)},
      {"DeckNameOffsets", std::move(deck_name_offsets_json)},
      {"Endianness", phosg::name_for_enum(this->endianness)},
      {"Stats", this->stats_offsets.has_value() ? this->stats_offsets->json() : phosg::JSON(nullptr)},
      {"Provisional", this->provisional},
      {"DeckNamesProvisional", this->deck_names_provisional},
      {"StatsProvisional", this->stats_provisional},
  });
}

SaveContext resolve_save_context(const PlatformProfileTable& table, Platform platform, int64_t slot) {
  const auto& profile = table.get(platform);

  size_t effective_slot;
  if (!profile.save_size.has_value() || (slot < 0)) {
    effective_slot = 0;
  } else if (static_cast<uint64_t>(slot) >= profile.num_slots) {
    effective_slot = profile.num_slots - 1;
  } else {
    effective_slot = slot;
  }
  int64_t shift = profile.save_size.has_value()
      ? static_cast<int64_t>(*profile.save_size) * static_cast<int64_t>(effective_slot)
      : 0;

  SaveContext ctx;
  ctx.platform = platform;
  ctx.slot = effective_slot;
  ctx.shift = shift;
  ctx.base_offset = profile.base_offset + shift;
  ctx.card_base_offset = profile.card_base_offset + shift;
  ctx.player_name_offset = profile.player_name_offset + shift;
  ctx.styling_offset = profile.styling_offset + shift;
  for (size_t z = 0; z < ctx.deck_offsets.size(); z++) {
    ctx.deck_offsets[z] = profile.deck_offsets[z] + shift;
  }
  if (profile.deck_name_back_offset.has_value()) {
    auto& offsets = ctx.deck_name_offsets.emplace();
    for (size_t z = 0; z < offsets.size(); z++) {
      offsets[z] = ctx.deck_offsets[z] - static_cast<int64_t>(*profile.deck_name_back_offset);
    }
  }
  ctx.endianness = profile.endianness;
  ctx.provisional = profile.provisional;
  ctx.deck_names_provisional = profile.deck_names_provisional;
  ctx.stats_provisional = profile.stats_provisional;
  if (profile.stats_offsets.has_value()) {
    ctx.stats_offsets = profile.stats_offsets->shifted(shift);
  }

  if (static_cast<uint64_t>(slot) != effective_slot) {
    codec_log.debug_f("Requested slot {} on {}; using slot {}", slot, phosg::name_for_enum(platform), effective_slot);
  }
  return ctx;
}

SaveContext resolve_save_context(const PlatformProfileTable& table, const string& platform_name, int64_t slot) {
  return resolve_save_context(table, phosg::enum_for_name<Platform>(platform_name.c_str()), slot);
}
