#include <cmath>
#include <iostream>
#include <set>
#include <string>

#include "starlane/core/exploration.h"
#include "starlane/util/log.h"

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

// No hidden pools, no mid-mission rolls.
JumpConfig quiet_config() {
  JumpConfig cfg;
  cfg.hidden_first_chance = 0.0;
  cfg.hidden_extra_chance = 0.0;
  cfg.mission_detection_chance = 0.0;
  cfg.mission_anomaly_chance = 0.0;
  return cfg;
}

// Every roll in range succeeds.
JumpConfig certain_detection(JumpConfig cfg) {
  cfg.detection_min_chance = 1.0;
  cfg.detection_max_chance = 1.0;
  cfg.hidden_detection_factor = 1.0;
  return cfg;
}

JumpPoint make_point(Id id, double x_au) {
  JumpPoint jp;
  jp.id = JumpPointId{id};
  jp.name = "JP-" + std::to_string(id);
  jp.position_km = Vec3{x_au * kKmPerAu, 0.0, 0.0};
  return jp;
}

Fleet make_fleet(Id id, FactionId faction, SystemId system, int ships) {
  Fleet f;
  f.id = FleetId{id};
  f.name = "Fleet " + std::to_string(id);
  f.faction_id = faction;
  f.system_id = system;
  for (int i = 0; i < ships; ++i) f.ships.push_back(ShipId{static_cast<Id>(id * 100 + i)});
  return f;
}

bool contains(const std::vector<ExplorationResult>& v, ExplorationResult r) {
  for (auto x : v) {
    if (x == r) return true;
  }
  return false;
}

} // namespace

int test_exploration() {
  const auto prev_level = log::level();
  log::set_level(log::Level::Off);

  const FactionId f1{1};
  const FactionId f2{2};
  const SystemId sol_id{1};

  // Difficulty and capability scores.
  {
    StarSystem sys;
    SL_ASSERT(std::fabs(system_exploration_difficulty(sys) - 1.0) < 1e-9, "empty system difficulty");
    sys.planet_count = 40;
    SL_ASSERT(system_exploration_difficulty(sys) == 3.0, "difficulty clamps high");

    Fleet f;
    SL_ASSERT(fleet_survey_capability(f) == 1.0, "empty fleet capability");
    f.ships.resize(2);
    SL_ASSERT(std::fabs(fleet_survey_capability(f) - 1.2) < 1e-9, "two ship capability");
  }

  // Explore missions: start, progress, completion.
  {
    ExplorationEngine eng(quiet_config());
    util::Rng rng(7);
    IdAllocator ids;

    SystemMap systems;
    StarSystem sol;
    sol.id = sol_id;
    sol.name = "Sol";
    systems[sol.id] = sol;

    FleetMap fleets;
    fleets[FleetId{1}] = make_fleet(1, f1, sol_id, 2);
    Fleet& fleet = fleets.at(FleetId{1});

    CommandResult r = eng.start_exploration_mission(fleet, systems.at(sol_id), MissionKind::Explore, 0.0);
    SL_ASSERT(r.ok, "explore mission starts");
    SL_ASSERT(fleet.status == FleetStatus::Exploring, "fleet exploring");
    SL_ASSERT(!fleet.current_orders.empty() && fleet.current_orders.back() == "Exploring Sol", "order note");
    SL_ASSERT(eng.has_active_mission(fleet.id), "mission recorded");

    const ExplorationMission* m = eng.active_mission(fleet.id);
    SL_ASSERT(m && std::fabs(m->duration - 3000.0) < 1e-6, "duration scales with capability");

    SL_ASSERT(!eng.start_exploration_mission(fleet, systems.at(sol_id), MissionKind::Survey, 0.0).ok,
              "one mission per fleet");

    Fleet elsewhere = make_fleet(2, f1, SystemId{9}, 1);
    SL_ASSERT(!eng.start_exploration_mission(elsewhere, systems.at(sol_id), MissionKind::Explore, 0.0).ok,
              "fleet must be in the system");

    auto reports = eng.process_exploration_missions(fleets, systems, 1500.0, 1500.0, rng, ids);
    SL_ASSERT(reports.size() == 1, "one report");
    SL_ASSERT(std::fabs(reports[0].progress - 0.5) < 1e-9, "half way");
    SL_ASSERT(!reports[0].completed, "not done yet");

    reports = eng.process_exploration_missions(fleets, systems, 3000.0, 1500.0, rng, ids);
    SL_ASSERT(reports.size() == 1 && reports[0].completed, "completed");
    SL_ASSERT(contains(reports[0].results, ExplorationResult::NoDiscovery), "nothing found");
    SL_ASSERT(!eng.has_active_mission(fleet.id), "mission removed");
    SL_ASSERT(fleet.status == FleetStatus::Idle, "fleet idle");
    SL_ASSERT(fleet.current_orders.empty(), "orders cleared");

    ExplorationStatus st = eng.get_exploration_status(sol_id, f1);
    SL_ASSERT(std::fabs(st.exploration_progress - 0.5) < 1e-9, "explore gain");
    SL_ASSERT(st.last_exploration && *st.last_exploration == 3000.0, "last exploration time");
    SL_ASSERT(!systems.at(sol_id).explored, "not yet explored");

    SL_ASSERT(eng.start_exploration_mission(fleet, systems.at(sol_id), MissionKind::Explore, 3000.0).ok,
              "second mission");
    (void)eng.process_exploration_missions(fleets, systems, 6000.0, 3000.0, rng, ids);
    st = eng.get_exploration_status(sol_id, f1);
    SL_ASSERT(st.exploration_progress == 1.0, "progress capped at 1");
    SL_ASSERT(systems.at(sol_id).explored, "system explored");

    // Other factions know nothing.
    SL_ASSERT(eng.get_exploration_status(sol_id, f2).exploration_progress == 0.0, "per faction progress");
  }

  // Missions whose fleet vanished are dropped.
  {
    ExplorationEngine eng(quiet_config());
    util::Rng rng(1);
    IdAllocator ids;
    SystemMap systems;
    systems[sol_id].id = sol_id;
    FleetMap fleets;
    fleets[FleetId{1}] = make_fleet(1, f1, sol_id, 1);
    SL_ASSERT(eng.start_exploration_mission(fleets.at(FleetId{1}), systems.at(sol_id), MissionKind::Explore, 0.0).ok,
              "start");
    fleets.clear();
    SL_ASSERT(eng.process_exploration_missions(fleets, systems, 10.0, 10.0, rng, ids).empty(), "no report");
    SL_ASSERT(eng.active_mission_count() == 0, "dropped");
  }

  // Targeted survey raises the survey level to the travel threshold.
  {
    ExplorationEngine eng(quiet_config());
    util::Rng rng(3);
    IdAllocator ids;
    ids.observe(10);

    SystemMap systems;
    StarSystem& sol = systems[sol_id];
    sol.id = sol_id;
    sol.name = "Sol";
    JumpPoint jp = make_point(5, 1.0);
    jp.status = JumpPointStatus::Detected;
    jp.survey_level = 1;
    jp.discovered_by = f1;
    sol.jump_points.push_back(jp);
    JumpPoint far = make_point(6, 6.0);
    far.status = JumpPointStatus::Detected;
    far.survey_level = 1;
    sol.jump_points.push_back(far);
    JumpPoint done = make_point(7, 1.0);
    done.survey_level = kMaxSurveyLevel;
    done.status = JumpPointStatus::Active;
    sol.jump_points.push_back(done);

    FleetMap fleets;
    fleets[FleetId{1}] = make_fleet(1, f1, sol_id, 1);
    Fleet& fleet = fleets.at(FleetId{1});

    SL_ASSERT(!eng.survey_jump_point(fleet, sol, JumpPointId{6}, f1, 0.0).ok, "beyond survey range");
    SL_ASSERT(!eng.survey_jump_point(fleet, sol, JumpPointId{7}, f1, 0.0).ok, "already fully surveyed");
    SL_ASSERT(!eng.survey_jump_point(fleet, sol, JumpPointId{99}, f1, 0.0).ok, "unknown point");
    SL_ASSERT(!eng.survey_jump_point(fleet, sol, JumpPointId{5}, f2, 0.0).ok, "wrong faction");

    SL_ASSERT(eng.survey_jump_point(fleet, sol, JumpPointId{5}, f1, 0.0).ok, "survey starts");
    SL_ASSERT(fleet.status == FleetStatus::Surveying, "fleet surveying");

    auto reports = eng.process_exploration_missions(fleets, systems, 7000.0, 7000.0, rng, ids);
    SL_ASSERT(reports.size() == 1 && reports[0].completed, "survey completed");
    SL_ASSERT(contains(reports[0].results, ExplorationResult::JumpPointSurveyed), "surveyed result");

    const JumpPoint* after = find_jump_point(systems.at(sol_id), JumpPointId{5});
    SL_ASSERT(after->survey_level == 2, "level raised to 2");
    SL_ASSERT(after->status == JumpPointStatus::Active, "point activated");
    SL_ASSERT(after->last_surveyed && *after->last_surveyed == 7000.0, "survey time recorded");
    SL_ASSERT(after->travel_eligible(), "usable for travel");

    const auto known = eng.discovered_jump_points(sol_id, f1);
    SL_ASSERT(known.size() == 1 && known[0] == JumpPointId{5}, "surveyed point is known");
    SL_ASSERT(eng.get_exploration_status(sol_id, f1).survey_completeness > 0.0, "survey gain");
  }

  // Detection: range limit, once per faction, no downgrade.
  {
    ExplorationEngine eng(certain_detection(quiet_config()));
    util::Rng rng(11);
    IdAllocator ids;
    ids.observe(20);

    StarSystem sys;
    sys.id = sol_id;
    sys.name = "Sol";
    sys.jump_points.push_back(make_point(1, 2.0));
    sys.jump_points.push_back(make_point(2, 12.0));
    JumpPoint gone = make_point(3, 1.0);
    gone.status = JumpPointStatus::Destroyed;
    sys.jump_points.push_back(gone);
    JumpPoint charted = make_point(4, 3.0);
    charted.status = JumpPointStatus::Active;
    charted.survey_level = 2;
    charted.discovered_by = f2;
    charted.discovery_time = 5.0;
    sys.jump_points.push_back(charted);

    Fleet fleet = make_fleet(1, f1, sol_id, 1);

    auto found = eng.attempt_jump_point_detection(fleet, sys, f1, 100.0, rng, ids);
    SL_ASSERT(found.size() == 2, "in-range live points detected");

    const JumpPoint* p1 = find_jump_point(sys, JumpPointId{1});
    SL_ASSERT(p1->status == JumpPointStatus::Detected, "unknown becomes detected");
    SL_ASSERT(p1->survey_level == 1, "detection surveys to level 1");
    SL_ASSERT(p1->discovered_by == f1, "discoverer recorded");
    SL_ASSERT(p1->discovery_time && *p1->discovery_time == 100.0, "discovery time recorded");

    const JumpPoint* p4 = find_jump_point(sys, JumpPointId{4});
    SL_ASSERT(p4->status == JumpPointStatus::Active, "no status downgrade");
    SL_ASSERT(p4->survey_level == 2, "no survey downgrade");
    SL_ASSERT(p4->discovered_by == f2, "first discoverer kept");

    SL_ASSERT(find_jump_point(sys, JumpPointId{2})->status == JumpPointStatus::Unknown, "out of range");
    SL_ASSERT(find_jump_point(sys, JumpPointId{3})->status == JumpPointStatus::Destroyed, "destroyed untouched");

    SL_ASSERT(eng.attempt_jump_point_detection(fleet, sys, f1, 200.0, rng, ids).empty(),
              "a faction detects each point once");
    SL_ASSERT(eng.attempt_jump_point_detection(fleet, sys, f2, 200.0, rng, ids).size() == 2,
              "other factions roll separately");
  }

  // Hidden pools are revealed by detection and become ordinary points.
  {
    JumpConfig cfg = certain_detection(quiet_config());
    cfg.hidden_first_chance = 1.0;
    cfg.hidden_extra_chance = 1.0;
    cfg.hidden_extra_rolls = 2;
    ExplorationEngine eng(cfg);
    util::Rng rng(99);
    IdAllocator ids;

    StarSystem sys;
    sys.id = sol_id;
    sys.name = "Sol";
    sys.jump_points.push_back(make_point(1, 1.0));
    ids.observe(1);

    eng.initialize_system_exploration(sys, f1, rng, ids);
    eng.initialize_system_exploration(sys, f1, rng, ids);
    SL_ASSERT(eng.hidden_point_count(sol_id) == 3, "pool rolled once");
    SL_ASSERT(eng.get_exploration_status(sol_id, f1).potential_discoveries == 3, "pending discoveries");
    SL_ASSERT(sys.jump_points.size() == 1, "hidden points stay out of the system");

    Fleet fleet = make_fleet(1, f1, sol_id, 1);
    auto found = eng.attempt_jump_point_detection(fleet, sys, f1, 10.0, rng, ids);
    SL_ASSERT(found.size() == 4, "visible and hidden detected");

    int hidden = 0;
    std::set<JumpPointId> unique;
    for (const auto& d : found) {
      unique.insert(d.jump_point);
      if (d.was_hidden) ++hidden;
    }
    SL_ASSERT(hidden == 3, "hidden flag set");
    SL_ASSERT(unique.size() == 4, "ids unique");
    SL_ASSERT(sys.jump_points.size() == 4, "revealed points join the system");
    SL_ASSERT(eng.hidden_point_count(sol_id) == 0, "pool drained");

    for (const auto& jp : sys.jump_points) {
      if (jp.id == JumpPointId{1}) continue;
      SL_ASSERT(jp.name.rfind("Hidden JP-", 0) == 0, "hidden point name");
      SL_ASSERT(!jp.connects_to.valid(), "revealed point has no destination yet");
      SL_ASSERT(jp.status == JumpPointStatus::Detected, "revealed point detected");
    }
  }

  // Deep scan combines both gains and rolls detection on completion.
  {
    ExplorationEngine eng(certain_detection(quiet_config()));
    util::Rng rng(5);
    IdAllocator ids;
    ids.observe(1);

    SystemMap systems;
    StarSystem& sys = systems[sol_id];
    sys.id = sol_id;
    sys.name = "Sol";
    sys.jump_points.push_back(make_point(1, 4.0));

    FleetMap fleets;
    fleets[FleetId{1}] = make_fleet(1, f1, sol_id, 1);
    Fleet& fleet = fleets.at(FleetId{1});

    SL_ASSERT(eng.start_exploration_mission(fleet, sys, MissionKind::DeepScan, 0.0).ok, "deep scan starts");
    SL_ASSERT(fleet.status == FleetStatus::Surveying, "deep scan counts as surveying");
    SL_ASSERT(fleet.current_orders.back() == "Deep scanning Sol", "deep scan order note");

    const double duration = eng.active_mission(fleet.id)->duration;
    SL_ASSERT(std::fabs(duration - 7200.0 * 2.0 / 1.1) < 1e-6, "deep scan duration");

    auto reports = eng.process_exploration_missions(fleets, systems, duration, duration, rng, ids);
    SL_ASSERT(reports.size() == 1 && reports[0].completed, "deep scan done");
    SL_ASSERT(reports[0].detections.size() == 1, "completion detection");
    SL_ASSERT(contains(reports[0].results, ExplorationResult::JumpPointDetected), "detected result");

    const ExplorationStatus st = eng.get_exploration_status(sol_id, f1);
    SL_ASSERT(std::fabs(st.exploration_progress - 0.5) < 1e-9, "deep scan explore gain");
    SL_ASSERT(std::fabs(st.survey_completeness - 0.4) < 1e-9, "deep scan survey gain");
  }

  log::set_level(prev_level);
  return 0;
}
