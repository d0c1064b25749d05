#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "starlane/core/enum_strings.h"
#include "starlane/core/jump_config.h"
#include "starlane/core/jump_manager.h"
#include "starlane/util/file_io.h"
#include "starlane/util/json.h"
#include "starlane/util/log.h"
#include "starlane/util/network_export.h"
#include "starlane/util/rng.h"
#include "starlane/util/sorted_keys.h"

namespace {

#ifndef STARLANE_VERSION
#define STARLANE_VERSION "unknown"
#endif

int get_int_arg(int argc, char** argv, const std::string& key, int def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return std::stoi(argv[i + 1]);
  }
  return def;
}

double get_double_arg(int argc, char** argv, const std::string& key, double def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return std::stod(argv[i + 1]);
  }
  return def;
}

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return argv[i + 1];
  }
  return def;
}

bool has_flag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == flag) return true;
  }
  return false;
}

void print_usage(const char* exe) {
  std::cout << "Starlane CLI v" << STARLANE_VERSION << "\n\n";
  std::cout << "Usage: " << (exe ? exe : "starlane_cli") << " [options]\n\n";
  std::cout << "Options:\n";
  std::cout << "  --seed N           RNG seed (default: 1)\n";
  std::cout << "  --systems N        Number of star systems to generate (default: 12)\n";
  std::cout << "  --fleets N         Survey fleets per faction (default: 2)\n";
  std::cout << "  --ticks N          Ticks to simulate (default: 200)\n";
  std::cout << "  --dt SECONDS       Game seconds per tick (default: 600)\n";
  std::cout << "  --connectivity X   Extra link density in [0, 1] (default: 0.3)\n";
  std::cout << "  --config PATH      Jump config JSON overlaid on the defaults\n";
  std::cout << "  --dump-network     Print the generated jump graph as JSON\n";
  std::cout << "  --export-json PATH Write tick results and faction networks as JSON\n";
  std::cout << "  --log-level LVL    debug|info|warn|error|off (default: warn)\n";
  std::cout << "  --quiet            Suppress per-tick output\n";
  std::cout << "  --version          Print version and exit\n";
  std::cout << "  -h, --help         Show this help\n";
}

const char* kSystemNames[] = {"Sol",    "Alpha Centauri", "Barnard", "Wolf",    "Lalande", "Sirius",
                              "Luyten", "Ross",           "Epsilon", "Procyon", "Struve",  "Groombridge",
                              "Tau Ceti", "Gliese",       "Kapteyn", "Kruger",  "Altair",  "Vega"};

starlane::SystemMap make_systems(int count, starlane::util::Rng& rng) {
  starlane::SystemMap systems;
  const int names = static_cast<int>(sizeof(kSystemNames) / sizeof(kSystemNames[0]));
  for (int i = 0; i < count; ++i) {
    starlane::StarSystem sys;
    sys.id = starlane::SystemId{static_cast<starlane::Id>(i + 1)};
    sys.name = kSystemNames[i % names];
    if (i >= names) sys.name += " " + std::to_string(i / names + 1);
    sys.star_mass = rng.uniform(0.1, 3.0);
    sys.planet_count = rng.range_int(0, 12);
    sys.asteroid_belt_count = rng.range_int(0, 3);
    sys.habitable_zone_inner_au = 0.7 * std::sqrt(sys.star_mass);
    sys.habitable_zone_outer_au = 1.5 * std::sqrt(sys.star_mass);
    systems.emplace(sys.id, std::move(sys));
  }
  return systems;
}

struct Scenario {
  starlane::SystemMap systems;
  starlane::FleetMap fleets;
  starlane::ShipMap ships;
  std::vector<starlane::FactionId> factions;
};

void seed_fleets(Scenario& sc, int fleets_per_faction, starlane::util::Rng& rng) {
  const std::vector<starlane::SystemId> ids = starlane::util::sorted_keys(sc.systems);
  if (ids.empty()) return;

  starlane::Id next_fleet = 1;
  starlane::Id next_ship = 1;
  sc.factions = {starlane::FactionId{1}, starlane::FactionId{2}};

  for (starlane::FactionId faction : sc.factions) {
    const starlane::SystemId home = ids[rng.index(ids.size())];
    for (int f = 0; f < fleets_per_faction; ++f) {
      starlane::Fleet fleet;
      fleet.id = starlane::FleetId{next_fleet++};
      fleet.name = "F" + std::to_string(faction.value) + "-Survey-" + std::to_string(f + 1);
      fleet.faction_id = faction;
      fleet.system_id = home;
      fleet.fuel_remaining = 2000.0;

      for (int s = 0; s < 2; ++s) {
        starlane::Ship ship;
        ship.id = starlane::ShipId{next_ship++};
        ship.name = fleet.name + "/" + std::to_string(s + 1);
        ship.current_mass_tons = rng.uniform(400.0, 1200.0);
        ship.size_class = rng.range_int(1, 2);
        ship.has_jump_drive = true;
        fleet.ships.push_back(ship.id);
        sc.ships.emplace(ship.id, std::move(ship));
      }
      sc.fleets.emplace(fleet.id, std::move(fleet));
    }
  }
}

// Minimal survey doctrine for idle fleets: jump to an unvisited system when
// a usable link is known, otherwise survey the nearest known point, otherwise
// explore the current system.
void drive_idle_fleets(starlane::JumpPointManager& mgr, Scenario& sc, double now, bool quiet) {
  for (starlane::FleetId fid : starlane::util::sorted_keys(sc.fleets)) {
    starlane::Fleet& fleet = sc.fleets.at(fid);
    if (fleet.status != starlane::FleetStatus::Idle) continue;
    auto sit = sc.systems.find(fleet.system_id);
    if (sit == sc.systems.end()) continue;
    const starlane::StarSystem& sys = sit->second;

    const starlane::FactionKnowledge* k = mgr.knowledge(fleet.faction_id);
    starlane::CommandResult r;

    for (const auto& opt : mgr.get_available_jumps_for_fleet(fleet, sc.systems, sc.ships, {})) {
      if (!opt.jump.requirements.can_jump) continue;
      if (k && k->known_systems.count(opt.jump.target_system_id) && opt.target_explored) continue;
      r = mgr.initiate_fleet_jump(fleet, opt.jump.jump_point_id, sc.systems, sc.ships, {}, now);
      if (r.ok) break;
    }

    if (!r.ok && k) {
      for (const auto& jp : sys.jump_points) {
        if (!k->known_jump_points.count(jp.id)) continue;
        if (jp.survey_level >= starlane::kMinTravelSurveyLevel) continue;
        // Stand-in for the host's movement orders: the demo has no orbital model.
        fleet.position_km = jp.position_km;
        r = mgr.survey_jump_point(fleet, jp.id, sc.systems, now);
        if (r.ok) break;
      }
    }

    if (!r.ok) {
      const auto st = mgr.get_system_exploration_status(sys.id, fleet.faction_id);
      const auto kind = st.exploration_progress < 1.0 ? starlane::MissionKind::Explore : starlane::MissionKind::DeepScan;
      r = mgr.start_exploration_mission(fleet, sys.id, sc.systems, kind, now);
    }

    if (!quiet && r.ok) std::cout << "  " << fleet.name << ": " << r.message << "\n";
  }
}

} // namespace

int main(int argc, char** argv) {
  try {
    if (has_flag(argc, argv, "--version")) {
      std::cout << STARLANE_VERSION << "\n";
      return 0;
    }
    if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
      print_usage(argv[0]);
      return 0;
    }

    const int seed = get_int_arg(argc, argv, "--seed", 1);
    const int system_count = get_int_arg(argc, argv, "--systems", 12);
    const int fleets_per_faction = get_int_arg(argc, argv, "--fleets", 2);
    const int ticks = get_int_arg(argc, argv, "--ticks", 200);
    const double dt = get_double_arg(argc, argv, "--dt", 600.0);
    const double connectivity = get_double_arg(argc, argv, "--connectivity", 0.3);
    const std::string config_path = get_str_arg(argc, argv, "--config", "");
    const std::string export_path = get_str_arg(argc, argv, "--export-json", "");
    const std::string log_level = get_str_arg(argc, argv, "--log-level", "warn");
    const bool dump_network = has_flag(argc, argv, "--dump-network");
    const bool quiet = has_flag(argc, argv, "--quiet");

    starlane::log::Level lvl = starlane::log::Level::Warn;
    if (!starlane::log::parse_level(log_level, lvl)) {
      std::cerr << "Unknown --log-level: " << log_level << "\n\n";
      print_usage(argv[0]);
      return 2;
    }
    starlane::log::set_level(lvl);

    if (system_count < 2 || ticks < 0 || dt <= 0.0) {
      std::cerr << "--systems must be >= 2, --ticks >= 0 and --dt > 0\n\n";
      print_usage(argv[0]);
      return 2;
    }

    starlane::JumpConfig cfg;
    if (!config_path.empty()) cfg = starlane::load_jump_config_from_file(config_path);
    const auto problems = starlane::validate_jump_config(cfg);
    if (!problems.empty()) {
      std::cerr << "Jump config validation failed:\n";
      for (const auto& p : problems) std::cerr << "  - " << p << "\n";
      return 1;
    }

    starlane::JumpPointManager mgr(cfg, static_cast<std::uint64_t>(seed));

    // Scenario layout uses its own stream so it stays stable when the
    // subsystem's draw order changes.
    starlane::util::Rng setup_rng(starlane::util::splitmix64(static_cast<std::uint64_t>(seed) ^ 0x5157a11eULL));
    Scenario sc;
    sc.systems = make_systems(system_count, setup_rng);
    const auto gen = mgr.generate_enhanced_jump_network(sc.systems, connectivity);
    seed_fleets(sc, fleets_per_faction, setup_rng);

    if (!quiet) {
      std::cout << "Generated " << gen.systems << " systems: " << gen.backbone_links << " backbone, "
                << gen.secondary_links << " secondary, " << gen.unstable_points << " unstable, "
                << gen.dormant_points << " dormant\n";
    }
    if (dump_network) std::cout << starlane::network_graph_to_json(mgr.network());

    starlane::json::Array tick_log;
    double now = 0.0;
    for (int t = 0; t < ticks; ++t) {
      if (!quiet) std::cout << "[tick " << t << "]\n";
      drive_idle_fleets(mgr, sc, now, quiet);

      now += dt;
      const auto res = mgr.process_turn_update(sc.fleets, sc.systems, sc.ships, now, dt);

      if (!quiet) {
        for (const auto& ev : res.travel_results) {
          std::cout << "  fleet " << ev.fleet_id.value << ": " << ev.message << "\n";
        }
        for (const auto& d : res.discoveries) {
          std::cout << "  faction " << d.faction.value << " found jump point " << d.jump_point.value
                    << (d.was_hidden ? " (hidden)" : "") << " in system " << d.system.value << "\n";
        }
      }
      if (!export_path.empty()) tick_log.push_back(starlane::turn_update_to_json(res, now));
    }

    std::cout << "\nAfter " << ticks << " ticks (" << now << " s):\n";
    for (starlane::FactionId faction : sc.factions) {
      const auto net = mgr.get_faction_jump_network(faction, sc.systems);
      std::cout << "  faction " << faction.value << ": " << net.known_systems.size() << " systems, "
                << net.known_jump_points.size() << " jump points, " << net.jumps_initiated << " jumps, "
                << net.exploration_missions << " missions\n";
    }
    for (starlane::FleetId fid : starlane::util::sorted_keys(sc.fleets)) {
      const auto& fleet = sc.fleets.at(fid);
      const auto& sys = sc.systems.at(fleet.system_id);
      std::cout << "  " << fleet.name << " in " << sys.name << " ("
                << starlane::fleet_status_to_string(fleet.status) << ", fuel " << fleet.fuel_remaining << ", "
                << mgr.get_jump_history(fid, 0).size() << " jumps)\n";
    }

    if (!export_path.empty()) {
      starlane::json::Object root;
      root["seed"] = static_cast<double>(seed);
      root["ticks"] = std::move(tick_log);
      starlane::json::Array nets;
      for (starlane::FactionId faction : sc.factions) {
        const auto net = mgr.get_faction_jump_network(faction, sc.systems);
        nets.push_back(starlane::json::parse(starlane::known_network_to_json(net, sc.systems)));
      }
      root["factions"] = std::move(nets);
      try {
        starlane::write_text_file(export_path, starlane::json::stringify(root, 2) + "\n");
        if (!quiet) std::cout << "\nWrote JSON to " << export_path << "\n";
      } catch (const std::exception& e) {
        std::cerr << "Failed to export JSON: " << e.what() << "\n";
        return 1;
      }
    }

    return 0;
  } catch (const std::exception& e) {
    starlane::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
