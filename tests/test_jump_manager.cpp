#include <iostream>
#include <set>
#include <string>

#include "starlane/core/jump_manager.h"
#include "starlane/util/json.h"
#include "starlane/util/log.h"
#include "starlane/util/network_export.h"

#define SL_ASSERT(cond, msg)                                                        \
  do {                                                                              \
    if (!(cond)) {                                                                  \
      std::cerr << "ASSERT FAIL: " << (msg) << " (" << __FILE__ << ":" << __LINE__ \
                << ")\n";                                                         \
      return 1;                                                                     \
    }                                                                               \
  } while (0)

namespace {

using namespace starlane;

const FactionId kTerrans{1};
const FactionId kOthers{2};
const SystemId kAlpha{1};
const SystemId kBeta{2};

JumpConfig test_config() {
  JumpConfig cfg;
  cfg.hidden_first_chance = 0.0;
  cfg.hidden_extra_chance = 0.0;
  cfg.mission_detection_chance = 0.0;
  cfg.mission_anomaly_chance = 0.0;
  cfg.detection_min_chance = 1.0;
  cfg.detection_max_chance = 1.0;
  cfg.travel_time_jitter = 0.0;
  return cfg;
}

JumpPoint uncharted(Id id, SystemId to, double x_au) {
  JumpPoint jp;
  jp.id = JumpPointId{id};
  jp.name = "JP-" + std::to_string(id);
  jp.connects_to = to;
  jp.position_km = Vec3{x_au * kKmPerAu, 0.0, 0.0};
  return jp;
}

struct World {
  SystemMap systems;
  FleetMap fleets;
  ShipMap ships;
};

World make_world() {
  World w;
  StarSystem a;
  a.id = kAlpha;
  a.name = "Alpha";
  a.jump_points.push_back(uncharted(10, kBeta, 1.0));
  // Out of detection range; only used for command validation.
  JumpPoint dangling = uncharted(12, SystemId{}, 20.0);
  a.jump_points.push_back(dangling);
  a.jump_points.push_back(uncharted(13, SystemId{99}, 20.0));
  w.systems[a.id] = a;

  StarSystem b;
  b.id = kBeta;
  b.name = "Beta";
  b.jump_points.push_back(uncharted(11, kAlpha, 1.0));
  w.systems[b.id] = b;

  Ship s;
  s.id = ShipId{1};
  s.name = "Pathfinder";
  s.current_mass_tons = 1000.0;
  s.size_class = 2;
  w.ships[s.id] = s;

  Fleet f;
  f.id = FleetId{1};
  f.name = "Survey Group";
  f.faction_id = kTerrans;
  f.system_id = kAlpha;
  f.ships.push_back(s.id);
  f.fuel_remaining = 500.0;
  w.fleets[f.id] = f;
  return w;
}

// Caller-assigned ids start at 1 in both systems' numbering.
World make_low_id_world() {
  World w = make_world();
  StarSystem& a = w.systems.at(kAlpha);
  a.jump_points.clear();
  a.jump_points.push_back(uncharted(1, kBeta, 1.0));
  a.jump_points.push_back(uncharted(2, kBeta, 2.0));
  a.jump_points.push_back(uncharted(3, kBeta, 3.0));
  StarSystem& b = w.systems.at(kBeta);
  b.jump_points.clear();
  b.jump_points.push_back(uncharted(4, kAlpha, 1.0));
  return w;
}

bool unique_point_ids(const SystemMap& systems) {
  std::set<JumpPointId> seen;
  for (const auto& [sid, sys] : systems) {
    (void)sid;
    for (const auto& jp : sys.jump_points) {
      if (!seen.insert(jp.id).second) return false;
    }
  }
  return true;
}

} // namespace

int test_jump_manager() {
  const auto prev_level = log::level();
  log::set_level(log::Level::Off);

  // Explore, survey, jump: the whole loop through the facade.
  {
    World w = make_world();
    JumpPointManager mgr(test_config(), 1);
    mgr.update_network(w.systems);
    SL_ASSERT(mgr.network().node_count() == 2, "global graph built");

    Fleet& fleet = w.fleets.at(FleetId{1});
    double now = 0.0;

    CommandResult r = mgr.start_exploration_mission(fleet, kAlpha, w.systems, MissionKind::Explore, now);
    SL_ASSERT(r.ok, r.message);
    SL_ASSERT(mgr.knowledge(kTerrans) && mgr.knowledge(kTerrans)->exploration_missions == 1, "mission counted");

    now += 60.0;
    TurnUpdateResult res = mgr.process_turn_update(w.fleets, w.systems, w.ships, now, 60.0);
    SL_ASSERT(res.exploration_results.size() == 1 && !res.exploration_results[0].completed, "mission running");
    SL_ASSERT(res.discoveries.size() == 1 && res.discoveries[0].jump_point == JumpPointId{10},
              "passive detection while exploring");
    SL_ASSERT(mgr.knowledge(kTerrans)->known_jump_points.count(JumpPointId{10}), "point known");
    SL_ASSERT(!mgr.knowledge(kTerrans)->known_systems.count(kBeta), "far side not yet known");

    r = mgr.initiate_fleet_jump(fleet, JumpPointId{10}, w.systems, w.ships, {}, now);
    SL_ASSERT(!r.ok && r.message == "Fleet is busy with an exploration mission", "no jump while exploring");

    now += 4000.0;
    res = mgr.process_turn_update(w.fleets, w.systems, w.ships, now, 4000.0);
    SL_ASSERT(res.exploration_results.size() == 1 && res.exploration_results[0].completed, "mission done");
    SL_ASSERT(fleet.status == FleetStatus::Idle, "fleet idle");
    SL_ASSERT(mgr.get_system_exploration_status(kAlpha, kTerrans).exploration_progress > 0.0, "progress");

    r = mgr.survey_jump_point(fleet, JumpPointId{10}, w.systems, now);
    SL_ASSERT(r.ok, r.message);
    now += 7200.0;
    res = mgr.process_turn_update(w.fleets, w.systems, w.ships, now, 7200.0);
    SL_ASSERT(res.exploration_results.size() == 1 && res.exploration_results[0].completed, "survey done");

    const JumpPoint* gate = find_jump_point(w.systems.at(kAlpha), JumpPointId{10});
    SL_ASSERT(gate->survey_level == 2 && gate->status == JumpPointStatus::Active, "gate charted");
    SL_ASSERT(mgr.knowledge(kTerrans)->known_systems.count(kBeta), "surveyed gate reveals its far side");

    const auto options = mgr.get_available_jumps_for_fleet(fleet, w.systems, w.ships, {});
    SL_ASSERT(options.size() == 1, "one usable gate");
    SL_ASSERT(options[0].jump.requirements.can_jump, options[0].jump.requirements.summary());
    SL_ASSERT(options[0].target_system_name == "Beta", "target name resolved");

    SL_ASSERT(mgr.find_known_route(kTerrans, kAlpha, kBeta, w.systems) == (std::vector<SystemId>{kAlpha, kBeta}),
              "known route");

    r = mgr.initiate_fleet_jump(fleet, JumpPointId{10}, w.systems, w.ships, {}, now);
    SL_ASSERT(r.ok, r.message);
    SL_ASSERT(mgr.knowledge(kTerrans)->jumps_initiated == 1, "jump counted");
    SL_ASSERT(mgr.get_fleet_jump_status(fleet.id).phase == JumpPhaseKind::Preparation, "preparing");

    r = mgr.start_exploration_mission(fleet, kAlpha, w.systems, MissionKind::Explore, now);
    SL_ASSERT(!r.ok, "no exploring while preparing a jump");
    r = mgr.survey_jump_point(fleet, JumpPointId{10}, w.systems, now);
    SL_ASSERT(!r.ok, "no surveying while preparing a jump");

    now += 100.0;
    res = mgr.process_turn_update(w.fleets, w.systems, w.ships, now, 100.0);
    SL_ASSERT(res.travel_results.size() == 1 && res.travel_results[0].kind == TravelEventKind::JumpExecuted,
              "executed");
    now += 100.0;
    res = mgr.process_turn_update(w.fleets, w.systems, w.ships, now, 100.0);
    SL_ASSERT(res.travel_results.size() == 1 && res.travel_results[0].kind == TravelEventKind::Arrived, "arrived");
    SL_ASSERT(fleet.system_id == kBeta, "fleet in Beta");
    SL_ASSERT(mgr.get_jump_history(fleet.id).size() == 1, "history");

    // Beta's return gate has not been detected by anyone yet.
    SL_ASSERT(mgr.find_known_route(kTerrans, kBeta, kAlpha, w.systems).empty(), "no known way back");

    const KnownNetwork net = mgr.get_faction_jump_network(kTerrans, w.systems);
    SL_ASSERT(net.known_systems.size() == 2, "two known systems");
    SL_ASSERT(net.connections.size() == 1 && net.connections[0].jump_point_id == JumpPointId{10}, "one link");
    SL_ASSERT(net.reachable.at(kAlpha).at(kBeta) == 1, "Beta one hop from Alpha");
    SL_ASSERT(net.jump_points_discovered == 1 && net.jumps_initiated == 1, "statistics");

    const json::Value doc = json::parse(known_network_to_json(net, w.systems));
    SL_ASSERT(doc.at("systems").array().size() == 2, "export systems");
    SL_ASSERT(doc.at("connections").array().size() == 1, "export connections");
    SL_ASSERT(doc.at("statistics").at("jumps_initiated").int_value() == 1, "export statistics");

    const json::Value hist = json::parse(jump_history_to_json(mgr.get_jump_history(fleet.id)));
    SL_ASSERT(hist.array().size() == 1 && hist.array()[0].at("status").string_value() == "completed",
              "history export");

    const json::Value tick = turn_update_to_json(res, now);
    SL_ASSERT(tick.at("travel").array().size() == 1, "tick export");
    SL_ASSERT(tick.at("travel").array()[0].at("kind").string_value() == "arrived", "tick event kind");

    // Other factions learned nothing.
    const KnownNetwork theirs = mgr.get_faction_jump_network(kOthers, w.systems);
    SL_ASSERT(theirs.known_systems.empty() && theirs.connections.empty(), "knowledge is per faction");
  }

  // Command validation.
  {
    World w = make_world();
    JumpPointManager mgr(test_config(), 2);
    Fleet& fleet = w.fleets.at(FleetId{1});

    CommandResult r = mgr.initiate_fleet_jump(fleet, JumpPointId{77}, w.systems, w.ships, {}, 0.0);
    SL_ASSERT(!r.ok && r.message == "Jump point not found", r.message);
    r = mgr.initiate_fleet_jump(fleet, JumpPointId{11}, w.systems, w.ships, {}, 0.0);
    SL_ASSERT(!r.ok && r.message == "Jump point not found", "point in another system");
    r = mgr.initiate_fleet_jump(fleet, JumpPointId{12}, w.systems, w.ships, {}, 0.0);
    SL_ASSERT(!r.ok && r.message == "Jump point destination not set", r.message);
    r = mgr.initiate_fleet_jump(fleet, JumpPointId{13}, w.systems, w.ships, {}, 0.0);
    SL_ASSERT(!r.ok && r.message == "Target system does not exist", r.message);
    r = mgr.initiate_fleet_jump(fleet, JumpPointId{10}, w.systems, w.ships, {}, 0.0);
    SL_ASSERT(!r.ok && r.message.find("Jump not possible: ") == 0, r.message);
    SL_ASSERT(!mgr.travel().has_active_phase(fleet.id), "nothing started");

    r = mgr.cancel_fleet_jump(fleet);
    SL_ASSERT(!r.ok && r.message == "No active jump operation to cancel", r.message);

    r = mgr.survey_jump_point(fleet, JumpPointId{11}, w.systems, 0.0);
    SL_ASSERT(!r.ok, "survey target must be in the fleet's system");
    r = mgr.survey_jump_point(fleet, JumpPointId{12}, w.systems, 0.0);
    SL_ASSERT(!r.ok, "survey target must be in range");

    SL_ASSERT(mgr.get_jump_history(fleet.id).empty(), "no history");
    SL_ASSERT(!mgr.get_fleet_jump_status(fleet.id).has_operation, "no operation");
  }

  // Hidden points rolled by the first command in a system never reuse caller ids.
  {
    JumpConfig cfg = test_config();
    cfg.hidden_first_chance = 1.0;
    cfg.hidden_extra_chance = 1.0;
    cfg.hidden_extra_rolls = 2;
    cfg.hidden_detection_factor = 1.0;

    // Mission first.
    {
      World w = make_low_id_world();
      JumpPointManager mgr(cfg, 2);
      Fleet& fleet = w.fleets.at(FleetId{1});

      CommandResult r = mgr.start_exploration_mission(fleet, kAlpha, w.systems, MissionKind::Explore, 0.0);
      SL_ASSERT(r.ok, r.message);
      SL_ASSERT(mgr.get_system_exploration_status(kAlpha, kTerrans).potential_discoveries == 3, "pool rolled");

      (void)mgr.process_turn_update(w.fleets, w.systems, w.ships, 60.0, 60.0);
      SL_ASSERT(mgr.get_system_exploration_status(kAlpha, kTerrans).potential_discoveries == 0, "pool drained");
      SL_ASSERT(w.systems.at(kAlpha).jump_points.size() == 6, "hidden points revealed");
      SL_ASSERT(unique_point_ids(w.systems), "revealed ids unique after a mission");
      for (const auto& jp : w.systems.at(kAlpha).jump_points) {
        if (jp.name.rfind("Hidden", 0) == 0) SL_ASSERT(jp.id.value > 4, "hidden ids above every caller id");
      }
    }

    // Survey first.
    {
      World w = make_low_id_world();
      JumpPointManager mgr(cfg, 2);
      Fleet& fleet = w.fleets.at(FleetId{1});

      CommandResult r = mgr.survey_jump_point(fleet, JumpPointId{1}, w.systems, 0.0);
      SL_ASSERT(r.ok, r.message);
      SL_ASSERT(mgr.get_system_exploration_status(kAlpha, kTerrans).potential_discoveries == 3, "pool rolled");

      (void)mgr.process_turn_update(w.fleets, w.systems, w.ships, 100000.0, 100000.0);
      SL_ASSERT(fleet.status == FleetStatus::Idle, "survey finished");

      fleet.status = FleetStatus::Moving;
      (void)mgr.process_turn_update(w.fleets, w.systems, w.ships, 100060.0, 60.0);
      SL_ASSERT(mgr.get_system_exploration_status(kAlpha, kTerrans).potential_discoveries == 0, "pool drained");
      SL_ASSERT(unique_point_ids(w.systems), "revealed ids unique after a survey");
    }
  }

  // Seeded managers generate identical galaxies.
  {
    auto build = [](std::uint64_t seed) {
      SystemMap systems;
      for (Id i = 1; i <= 7; ++i) {
        StarSystem s;
        s.id = SystemId{i};
        s.name = "S" + std::to_string(i);
        s.star_mass = 0.5 + 0.25 * static_cast<double>(i);
        s.planet_count = static_cast<int>(i % 4);
        systems[s.id] = s;
      }
      JumpPointManager mgr(JumpConfig{}, seed);
      (void)mgr.generate_enhanced_jump_network(systems, 0.4);
      return network_graph_to_json(mgr.network());
    };
    SL_ASSERT(build(123) == build(123), "same seed, same network");
  }

  log::set_level(prev_level);
  return 0;
}
