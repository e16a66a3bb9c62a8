#include <stdio.h>
#include <string.h>

#include <format>
#include <functional>
#include <phosg/Arguments.hh>
#include <phosg/Filesystem.hh>
#include <phosg/JSON.hh>
#include <phosg/Strings.hh>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "Config.hh"
#include "Loggers.hh"
#include "Platform.hh"
#include "PlatformProfile.hh"
#include "SaveContext.hh"
#include "SaveFileFormats.hh"

using namespace std;

void print_usage();

Config load_cli_config(phosg::Arguments& args) {
  string log_level = args.get<string>("log-level", false);
  if (!log_level.empty()) {
    set_all_log_levels(phosg::enum_for_name<phosg::LogLevel>(phosg::toupper(log_level).c_str()));
  }

  string config_filename = args.get<string>("config", false);
  Config config = config_filename.empty()
      ? load_config(DEFAULT_CONFIG_FILENAME, true)
      : load_config(config_filename, false);

  // --log-level overrides anything in the config file
  if (!log_level.empty()) {
    set_all_log_levels(phosg::enum_for_name<phosg::LogLevel>(phosg::toupper(log_level).c_str()));
  }
  return config;
}

SaveContext get_cli_context(phosg::Arguments& args, const Config& config) {
  string platform_name = args.get<string>("platform", false);
  if (platform_name.empty()) {
    throw invalid_argument("--platform is required");
  }
  auto ctx = resolve_save_context(config.profiles, platform_name, args.get<int64_t>("slot", 0));
  if (ctx.provisional) {
    config_log.warning_f("The offsets for {} have not been verified against real save files", phosg::name_for_enum(ctx.platform));
  }
  return ctx;
}

void warn_if_deck_names_provisional(const SaveContext& ctx) {
  if (ctx.deck_names_provisional && ctx.deck_name_offsets.has_value()) {
    config_log.warning_f("The deck name offsets for {} are assumed and may be incorrect", phosg::name_for_enum(ctx.platform));
  }
}

void warn_if_stats_provisional(const SaveContext& ctx) {
  if (ctx.stats_provisional && ctx.stats_offsets.has_value()) {
    config_log.warning_f("The stats offsets for {} are assumed and may be incorrect", phosg::name_for_enum(ctx.platform));
  }
}

string read_save_file(phosg::Arguments& args) {
  const string& input_filename = args.get<string>(1, false);
  if (input_filename.empty()) {
    throw invalid_argument("a save filename is required");
  }
  return phosg::load_file(input_filename);
}

void write_save_file(phosg::Arguments& args, const string& data) {
  const string& input_filename = args.get<string>(1, false);
  const string& output_filename = args.get<string>(2, false);
  const string& filename = output_filename.empty() ? input_filename : output_filename;
  phosg::save_file(filename, data);
  cli_log.info_f("Saved {} bytes to {}", data.size(), filename);
}

void print_json(const phosg::JSON& json) {
  string s = json.serialize(phosg::JSON::SerializeOption::FORMAT | phosg::JSON::SerializeOption::SORT_DICT_KEYS);
  phosg::fwritex(stdout, s.data(), s.size());
  fputc('\n', stdout);
  fflush(stdout);
}

phosg::JSON get_cli_json(phosg::Arguments& args) {
  string json_text = args.get<string>("json", false);
  if (json_text.empty()) {
    throw invalid_argument("--json is required");
  }
  return phosg::JSON::parse(json_text);
}

// Decks are numbered 1 and 2 on the command line
size_t get_cli_deck_index(phosg::Arguments& args) {
  size_t deck_number = args.get<size_t>("deck");
  if (deck_number < 1) {
    throw invalid_deck_index(deck_number);
  }
  return deck_number - 1;
}

struct Action;
unordered_map<string, const Action*> all_actions;
vector<const Action*> action_order;

struct Action {
  const char* name;
  const char* help_text; // May be null
  function<void(phosg::Arguments& args)> run;

  Action(
      const char* name,
      const char* help_text,
      function<void(phosg::Arguments& args)> run)
      : name(name),
        help_text(help_text),
        run(run) {
    auto emplace_ret = all_actions.emplace(this->name, this);
    if (!emplace_ret.second) {
      throw logic_error(std::format("multiple actions with the same name: {}", this->name));
    }
    action_order.emplace_back(this);
  }
};

Action a_help(
    "help", "\
  help\n\
    You\'re reading it now.\n",
    +[](phosg::Arguments&) -> void {
      print_usage();
    });

Action a_show_platforms(
    "show-platforms", "\
  show-platforms\n\
    Show the layout constants for all platforms, after applying any overrides\n\
    from the config file.\n",
    +[](phosg::Arguments& args) -> void {
      auto config = load_cli_config(args);
      print_json(config.profiles.json());
    });

Action a_show_context(
    "show-context", "\
  show-context --platform=PLATFORM [--slot=N]\n\
    Show the absolute offsets used for the given platform and save slot. No\n\
    save file is needed.\n",
    +[](phosg::Arguments& args) -> void {
      auto config = load_cli_config(args);
      print_json(get_cli_context(args, config).json());
    });

Action a_dump(
    "dump", "\
  dump SAVE-FILE --platform=PLATFORM [--slot=N] [--creatures=N]\n\
    Decode everything in the given save slot and print it as JSON. Creature\n\
    records are included for creature IDs less than N (by default none are\n\
    included).\n",
    +[](phosg::Arguments& args) -> void {
      auto config = load_cli_config(args);
      auto ctx = get_cli_context(args, config);
      string data = read_save_file(args);
      warn_if_deck_names_provisional(ctx);
      warn_if_stats_provisional(ctx);
      print_json(save_json(data, ctx, config.styling_fields, args.get<size_t>("creatures", 0)));
    });

Action a_read_creature(
    "read-creature", "\
  read-creature SAVE-FILE --platform=PLATFORM --creature=N --attribute=N\n\
    Show the stats of one creature/attribute combination.\n",
    +[](phosg::Arguments& args) -> void {
      auto config = load_cli_config(args);
      auto ctx = get_cli_context(args, config);
      string data = read_save_file(args);
      auto entry = read_creature_entry(data, ctx, args.get<size_t>("creature"), args.get<size_t>("attribute"));
      print_json(entry.json());
    });

Action a_write_creature(
    "write-creature", "\
  write-creature SAVE-FILE [OUTPUT-FILE] --platform=PLATFORM --creature=N\n\
      --attribute=N --json=JSON\n\
    Replace the stats of one creature/attribute combination. JSON is a dict\n\
    with the keys ID, Attribute, Power, Speed, Defense, Acceleration,\n\
    Endurance, Jump, and Level; missing keys are written as zero.\n",
    +[](phosg::Arguments& args) -> void {
      auto config = load_cli_config(args);
      auto ctx = get_cli_context(args, config);
      string data = read_save_file(args);
      CreatureEntry entry(get_cli_json(args));
      write_creature_entry(data, ctx, args.get<size_t>("creature"), args.get<size_t>("attribute"), entry);
      write_save_file(args, data);
    });

Action a_read_card(
    "read-card", "\
  read-card SAVE-FILE --platform=PLATFORM --card=ID\n\
    Show whether a card is unlocked.\n",
    +[](phosg::Arguments& args) -> void {
      auto config = load_cli_config(args);
      auto ctx = get_cli_context(args, config);
      string data = read_save_file(args);
      auto card_ids = parse_card_ids(args.get<string>("card", true));
      if (card_ids.size() != 1) {
        throw invalid_argument("exactly one card ID is required");
      }
      uint32_t card_id = card_ids[0];
      phosg::fwrite_fmt(stdout, "{}\n", read_card_flag(data, ctx, card_id) ? "unlocked" : "locked");
    });

Action a_write_card(
    "write-card", "\
  write-card SAVE-FILE [OUTPUT-FILE] --platform=PLATFORM --card=ID[,ID...]\n\
      (--unlock | --lock)\n\
    Unlock or lock one or more cards. If any card ID is out of range, no cards\n\
    are changed.\n",
    +[](phosg::Arguments& args) -> void {
      bool unlock = args.get<bool>("unlock");
      bool lock = args.get<bool>("lock");
      if (unlock == lock) {
        throw invalid_argument("exactly one of --unlock or --lock is required");
      }
      auto card_ids = parse_card_ids(args.get<string>("card", true));

      auto config = load_cli_config(args);
      auto ctx = get_cli_context(args, config);
      string data = read_save_file(args);
      write_card_flags(data, ctx, card_ids, unlock);
      write_save_file(args, data);
    });

Action a_read_player_name(
    "read-player-name", "\
  read-player-name SAVE-FILE --platform=PLATFORM [--slot=N]\n\
    Show the player\'s name.\n",
    +[](phosg::Arguments& args) -> void {
      auto config = load_cli_config(args);
      auto ctx = get_cli_context(args, config);
      string data = read_save_file(args);
      phosg::fwrite_fmt(stdout, "{}\n", read_player_name(data, ctx));
    });

Action a_write_player_name(
    "write-player-name", "\
  write-player-name SAVE-FILE [OUTPUT-FILE] --platform=PLATFORM --name=NAME\n\
    Change the player\'s name. Names longer than 8 characters are truncated.\n",
    +[](phosg::Arguments& args) -> void {
      auto config = load_cli_config(args);
      auto ctx = get_cli_context(args, config);
      string data = read_save_file(args);
      write_player_name(data, ctx, args.get<string>("name", true));
      write_save_file(args, data);
    });

Action a_read_styling(
    "read-styling", "\
  read-styling SAVE-FILE --platform=PLATFORM [--slot=N]\n\
    Show the avatar styling fields as JSON.\n",
    +[](phosg::Arguments& args) -> void {
      auto config = load_cli_config(args);
      auto ctx = get_cli_context(args, config);
      string data = read_save_file(args);
      auto ret = phosg::JSON::dict();
      for (const auto& [key, value] : read_styling(data, ctx, config.styling_fields)) {
        ret.emplace(key, value);
      }
      print_json(ret);
    });

Action a_write_styling(
    "write-styling", "\
  write-styling SAVE-FILE [OUTPUT-FILE] --platform=PLATFORM --json=JSON\n\
    Change avatar styling fields. JSON is a dict of field names to values;\n\
    fields not mentioned are not changed.\n",
    +[](phosg::Arguments& args) -> void {
      auto config = load_cli_config(args);
      auto ctx = get_cli_context(args, config);
      string data = read_save_file(args);
      write_styling(data, ctx, config.styling_fields, styling_values_from_json(get_cli_json(args)));
      write_save_file(args, data);
    });

Action a_read_deck(
    "read-deck", "\
  read-deck SAVE-FILE --platform=PLATFORM --deck=N\n\
    Show the contents of deck N (1 or 2) as JSON.\n",
    +[](phosg::Arguments& args) -> void {
      auto config = load_cli_config(args);
      auto ctx = get_cli_context(args, config);
      string data = read_save_file(args);
      print_json(read_deck(data, ctx, get_cli_deck_index(args)).json());
    });

Action a_write_deck(
    "write-deck", "\
  write-deck SAVE-FILE [OUTPUT-FILE] --platform=PLATFORM --deck=N --json=JSON\n\
    Replace the contents of deck N (1 or 2). JSON has the same format as the\n\
    output of read-deck; null entries are empty slots.\n",
    +[](phosg::Arguments& args) -> void {
      auto config = load_cli_config(args);
      auto ctx = get_cli_context(args, config);
      string data = read_save_file(args);
      write_deck(data, ctx, get_cli_deck_index(args), Deck(get_cli_json(args)));
      write_save_file(args, data);
    });

Action a_read_deck_name(
    "read-deck-name", "\
  read-deck-name SAVE-FILE --platform=PLATFORM --deck=N\n\
    Show the name of deck N (1 or 2).\n",
    +[](phosg::Arguments& args) -> void {
      auto config = load_cli_config(args);
      auto ctx = get_cli_context(args, config);
      string data = read_save_file(args);
      warn_if_deck_names_provisional(ctx);
      phosg::fwrite_fmt(stdout, "{}\n", read_deck_name(data, ctx, get_cli_deck_index(args)));
    });

Action a_write_deck_name(
    "write-deck-name", "\
  write-deck-name SAVE-FILE [OUTPUT-FILE] --platform=PLATFORM --deck=N\n\
      --name=NAME\n\
    Change the name of deck N (1 or 2). Names longer than 10 characters are\n\
    truncated.\n",
    +[](phosg::Arguments& args) -> void {
      auto config = load_cli_config(args);
      auto ctx = get_cli_context(args, config);
      string data = read_save_file(args);
      warn_if_deck_names_provisional(ctx);
      write_deck_name(data, ctx, get_cli_deck_index(args), args.get<string>("name", true));
      write_save_file(args, data);
    });

Action a_read_stats(
    "read-stats", "\
  read-stats SAVE-FILE --platform=PLATFORM [--slot=N]\n\
    Show the battle statistics as JSON.\n",
    +[](phosg::Arguments& args) -> void {
      auto config = load_cli_config(args);
      auto ctx = get_cli_context(args, config);
      string data = read_save_file(args);
      warn_if_stats_provisional(ctx);
      print_json(read_stats(data, ctx).json());
    });

Action a_write_stats(
    "write-stats", "\
  write-stats SAVE-FILE [OUTPUT-FILE] --platform=PLATFORM --json=JSON\n\
    Replace the battle statistics. JSON has the same format as the output of\n\
    read-stats. If OpponentWins or AttributeUsage are missing or empty, those\n\
    counters are not changed.\n",
    +[](phosg::Arguments& args) -> void {
      auto config = load_cli_config(args);
      auto ctx = get_cli_context(args, config);
      string data = read_save_file(args);
      warn_if_stats_provisional(ctx);
      write_stats(data, ctx, StatsBlock(get_cli_json(args)));
      write_save_file(args, data);
    });

void print_usage() {
  fputs("\
Usage:\n\
  bakusave ACTION [OPTIONS...] SAVE-FILE [OUTPUT-FILE]\n\
\n\
Write actions modify the save in memory, then write it to OUTPUT-FILE, or\n\
back to SAVE-FILE if OUTPUT-FILE is not given. Read actions print their\n\
results to stdout.\n\
\n\
The actions are:\n",
      stderr);
  for (const auto& a : action_order) {
    if (a->help_text) {
      fputs(a->help_text, stderr);
    }
  }
  fputs("\n\
All actions accept the following options:\n\
  --platform=PLATFORM\n\
    Which platform the save file came from. PLATFORM is ps3, wii, x360, or\n\
    ps2.\n\
  --slot=N\n\
    Which save slot to use, for platforms that store multiple saves in one\n\
    file. Out-of-range slots are clamped. Default is 0.\n\
  --config=FILENAME\n\
    Load layout overrides and log levels from this JSON file. Default is\n\
    system/config.json, which is optional.\n\
  --log-level=LEVEL\n\
    Set all log levels (DEBUG, INFO, WARNING, ERROR, or DISABLED).\n",
      stderr);
}

int main(int argc, char** argv) {
  phosg::Arguments args(&argv[1], argc - 1);
  if (args.get<bool>("help")) {
    print_usage();
    return 0;
  }

  string action_name = args.get<string>(0, false);
  const Action* a;
  try {
    a = all_actions.at(action_name);
  } catch (const out_of_range&) {
    phosg::log_error_f("Unknown or invalid action; try --help");
    return 1;
  }

  try {
    a->run(args);
  } catch (const phosg::cannot_open_file& e) {
    phosg::log_error_f("Top-level exception (cannot_open_file): {}", e.what());
    return 2;
  } catch (const invalid_argument& e) {
    phosg::log_error_f("Top-level exception (invalid_argument): {}", e.what());
    return 2;
  } catch (const out_of_range& e) {
    phosg::log_error_f("Top-level exception (out_of_range): {}", e.what());
    return 2;
  } catch (const runtime_error& e) {
    phosg::log_error_f("Top-level exception (runtime_error): {}", e.what());
    return 2;
  } catch (const exception& e) {
    phosg::log_error_f("Top-level exception: {}", e.what());
    return 2;
  }
  return 0;
}
