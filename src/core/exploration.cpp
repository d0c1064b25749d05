#include "starlane/core/exploration.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

#include "starlane/util/log.h"
#include "starlane/util/sorted_keys.h"

namespace starlane {
namespace {

constexpr double kTwoPi = 6.28318530717958647692;

std::string fmt1(double v) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(1) << v;
  return ss.str();
}

std::string mission_order_note(MissionKind kind, const StarSystem& sys) {
  switch (kind) {
    case MissionKind::Explore: return "Exploring " + sys.name;
    case MissionKind::Survey: return "Surveying " + sys.name;
    case MissionKind::DeepScan: return "Deep scanning " + sys.name;
  }
  return "Exploring " + sys.name;
}

ExplorationResult result_for(const Detection& d) {
  return d.survey_level >= kMinTravelSurveyLevel ? ExplorationResult::JumpPointSurveyed
                                                 : ExplorationResult::JumpPointDetected;
}

} // namespace

double system_exploration_difficulty(const StarSystem& sys) {
  const double hz_width = std::max(0.0, sys.habitable_zone_outer_au - sys.habitable_zone_inner_au);
  const double d = 1.0 + 0.1 * sys.planet_count + 0.2 * sys.asteroid_belt_count + 0.1 * hz_width;
  return std::clamp(d, 0.5, 3.0);
}

double fleet_survey_capability(const Fleet& fleet) {
  return std::max(0.5, 1.0 + 0.1 * static_cast<double>(fleet.ships.size()));
}

std::string mission_kind_to_string(MissionKind k) {
  switch (k) {
    case MissionKind::Explore: return "explore";
    case MissionKind::Survey: return "survey";
    case MissionKind::DeepScan: return "deep_scan";
  }
  return "explore";
}

std::string exploration_result_to_string(ExplorationResult r) {
  switch (r) {
    case ExplorationResult::NoDiscovery: return "no_discovery";
    case ExplorationResult::JumpPointDetected: return "jump_point_detected";
    case ExplorationResult::JumpPointSurveyed: return "jump_point_surveyed";
    case ExplorationResult::AnomalyDetected: return "anomaly_detected";
  }
  return "no_discovery";
}

ExplorationEngine::ExplorationEngine(const JumpConfig& cfg) : cfg_(cfg) {}

void ExplorationEngine::initialize_system_exploration(const StarSystem& sys, FactionId faction, util::Rng& rng,
                                                      IdAllocator& ids) {
  auto it = systems_.find(sys.id);
  if (it == systems_.end()) {
    SystemExploration rec;
    rec.difficulty = system_exploration_difficulty(sys);
    generate_hidden_pool(sys, rec, rng, ids);
    it = systems_.emplace(sys.id, std::move(rec)).first;
  }
  if (faction.valid()) it->second.factions.try_emplace(faction);
}

void ExplorationEngine::generate_hidden_pool(const StarSystem& sys, SystemExploration& rec, util::Rng& rng,
                                             IdAllocator& ids) {
  int count = rng.chance(cfg_.hidden_first_chance) ? 1 : 0;
  for (int i = 0; i < cfg_.hidden_extra_rolls; ++i) {
    if (rng.chance(cfg_.hidden_extra_chance)) ++count;
  }
  rec.hidden_points_generated = count;
  if (count == 0) return;

  auto& pool = hidden_points_[sys.id];
  for (int i = 0; i < count; ++i) {
    const double r = rng.uniform(cfg_.hidden_min_distance_au, cfg_.hidden_max_distance_au) * kKmPerAu;
    const double bearing = rng.uniform(0.0, kTwoPi);

    JumpPoint jp;
    jp.id = JumpPointId{ids.allocate()};
    jp.name = "Hidden JP-" + std::to_string(i + 1);
    jp.position_km = Vec3{r * std::cos(bearing), r * std::sin(bearing), rng.uniform(-0.1 * r, 0.1 * r)};
    jp.kind = JumpPointKind::Natural;
    jp.status = JumpPointStatus::Unknown;
    jp.stability = rng.uniform(0.7, 1.0);
    jp.size_class = rng.range_int(1, 3);
    jp.exploration_difficulty = rng.uniform(1.2, 2.0);
    jp.fuel_cost_modifier = rng.uniform(0.8, 1.3);
    jp.travel_time_modifier = rng.uniform(0.9, 1.2);
    pool.push_back(std::move(jp));
  }
  log::debug("System " + sys.name + " holds " + std::to_string(count) + " hidden jump point(s)");
}

CommandResult ExplorationEngine::start_exploration_mission(Fleet& fleet, const StarSystem& sys, MissionKind kind,
                                                           double current_time,
                                                           std::optional<Vec3> target_position) {
  double base = cfg_.explore_base_time_s;
  if (kind == MissionKind::Survey) base = cfg_.survey_base_time_s;
  if (kind == MissionKind::DeepScan) base = cfg_.survey_base_time_s * cfg_.deep_scan_time_multiplier;

  double difficulty = system_exploration_difficulty(sys);
  if (auto it = systems_.find(sys.id); it != systems_.end()) difficulty = it->second.difficulty;

  const double duration = base * difficulty / fleet_survey_capability(fleet);
  return launch_mission(fleet, sys, kind, current_time, duration, std::move(target_position), JumpPointId{});
}

CommandResult ExplorationEngine::launch_mission(Fleet& fleet, const StarSystem& sys, MissionKind kind,
                                                double current_time, double duration,
                                                std::optional<Vec3> target_position, JumpPointId target) {
  if (missions_.count(fleet.id)) {
    log::warn("Fleet " + fleet.name + " already has an active exploration mission");
    return {false, "Fleet already has an active exploration mission"};
  }
  if (fleet.system_id != sys.id) return {false, "Fleet is not in system " + sys.name};

  ExplorationMission m;
  m.fleet_id = fleet.id;
  m.system_id = sys.id;
  m.kind = kind;
  m.start_time = current_time;
  m.duration = std::max(cfg_.min_mission_duration_s, duration);
  m.target_position = target_position ? target_position : std::optional<Vec3>(fleet.position_km);
  m.target_jump_point = target;

  fleet.status = (kind == MissionKind::Explore) ? FleetStatus::Exploring : FleetStatus::Surveying;
  fleet.current_orders.push_back(mission_order_note(kind, sys));

  log::info("Fleet " + fleet.name + " started " + mission_kind_to_string(kind) + " mission in " + sys.name +
            " (" + fmt1(m.duration) + " s)");
  missions_[fleet.id] = std::move(m);
  return {true, "Started " + mission_kind_to_string(kind) + " mission in " + sys.name};
}

std::vector<MissionReport> ExplorationEngine::process_exploration_missions(FleetMap& fleets, SystemMap& systems,
                                                                           double current_time,
                                                                           double delta_seconds, util::Rng& rng,
                                                                           IdAllocator& ids) {
  std::vector<MissionReport> reports;

  for (FleetId fid : util::sorted_keys(missions_)) {
    ExplorationMission& m = missions_.at(fid);

    auto fit = fleets.find(fid);
    auto sit = systems.find(m.system_id);
    if (fit == fleets.end() || sit == systems.end()) {
      log::debug("Dropping exploration mission with stale fleet/system reference (fleet " +
                 std::to_string(fid.value) + ")");
      missions_.erase(fid);
      continue;
    }
    Fleet& fleet = fit->second;
    StarSystem& sys = sit->second;

    const double step = (m.duration > 0.0) ? delta_seconds / m.duration : 1.0;
    m.progress = std::min(1.0, m.progress + std::max(0.0, step));

    initialize_system_exploration(sys, fleet.faction_id, rng, ids);
    auto& rec = systems_.at(sys.id);
    rec.total_mission_time += std::max(0.0, delta_seconds);

    MissionReport report;
    report.fleet_id = fid;
    report.system_id = sys.id;
    report.kind = m.kind;

    if (m.progress > cfg_.mission_detection_progress && rng.chance(cfg_.mission_detection_chance)) {
      auto found = attempt_jump_point_detection(fleet, sys, fleet.faction_id, current_time, rng, ids);
      for (const Detection& d : found) report.results.push_back(result_for(d));
      report.detections.insert(report.detections.end(), found.begin(), found.end());
    }
    if (m.progress > cfg_.mission_anomaly_progress && rng.chance(cfg_.mission_anomaly_chance)) {
      report.results.push_back(ExplorationResult::AnomalyDetected);
    }

    if (m.progress >= 1.0 && !m.completed) complete_mission(m, fleet, sys, current_time, rng, ids, report);

    m.results.insert(m.results.end(), report.results.begin(), report.results.end());
    report.progress = m.progress;
    report.completed = m.completed;
    reports.push_back(std::move(report));

    if (m.completed) missions_.erase(fid);
  }
  return reports;
}

void ExplorationEngine::complete_mission(ExplorationMission& m, Fleet& fleet, StarSystem& sys, double current_time,
                                         util::Rng& rng, IdAllocator& ids, MissionReport& report) {
  initialize_system_exploration(sys, fleet.faction_id, rng, ids);
  FactionExploration& knowledge = systems_.at(sys.id).factions[fleet.faction_id];

  const double explore_gain = 0.2 + 0.3 * m.progress;
  const double survey_gain = 0.15 + 0.25 * m.progress;

  switch (m.kind) {
    case MissionKind::Explore:
      knowledge.exploration_progress = std::min(1.0, knowledge.exploration_progress + explore_gain);
      break;
    case MissionKind::Survey:
      knowledge.survey_completeness = std::min(1.0, knowledge.survey_completeness + survey_gain);
      if (m.target_jump_point.valid()) {
        JumpPoint* jp = find_jump_point(sys, m.target_jump_point);
        if (jp && jp->survey_level < kMaxSurveyLevel) {
          jp->survey_level = std::min(kMaxSurveyLevel, jp->survey_level + 1);
          jp->last_surveyed = current_time;
          if (jp->survey_level >= kMinTravelSurveyLevel) jp->status = JumpPointStatus::Active;
          knowledge.discovered_jump_points.insert(jp->id);
          report.results.push_back(ExplorationResult::JumpPointSurveyed);
          log::info("Jump point " + jp->name + " surveyed to level " + std::to_string(jp->survey_level));
        }
      }
      break;
    case MissionKind::DeepScan: {
      knowledge.exploration_progress = std::min(1.0, knowledge.exploration_progress + explore_gain);
      knowledge.survey_completeness = std::min(1.0, knowledge.survey_completeness + survey_gain);
      auto found = attempt_jump_point_detection(fleet, sys, fleet.faction_id, current_time, rng, ids);
      for (const Detection& d : found) report.results.push_back(result_for(d));
      report.detections.insert(report.detections.end(), found.begin(), found.end());
      break;
    }
  }

  knowledge.last_exploration = current_time;
  if (knowledge.exploration_progress >= 1.0) sys.explored = true;

  if (report.results.empty()) report.results.push_back(ExplorationResult::NoDiscovery);

  fleet.status = FleetStatus::Idle;
  fleet.current_orders.clear();
  m.completed = true;

  log::info("Fleet " + fleet.name + " completed " + mission_kind_to_string(m.kind) + " mission in " + sys.name);
}

double ExplorationEngine::detection_probability(const Fleet& fleet, const JumpPoint& jp, double distance_km,
                                                const FactionExploration& knowledge) const {
  const double range_au = cfg_.detection_range_au;
  const double distance_au = distance_km / kKmPerAu;
  const double falloff = std::max(cfg_.detection_falloff_floor, 1.0 - distance_au / range_au);
  const double difficulty = std::max(0.01, jp.exploration_difficulty);
  const double experience = cfg_.detection_experience_bonus * knowledge.exploration_progress;

  const double p =
      cfg_.detection_base_chance * falloff * fleet_survey_capability(fleet) * (1.0 / difficulty) + experience;
  return std::clamp(p, cfg_.detection_min_chance, cfg_.detection_max_chance);
}

void ExplorationEngine::mark_discovered(JumpPoint& jp, FactionId faction, double current_time) const {
  if (!jp.discovered_by.valid()) {
    jp.discovered_by = faction;
    jp.discovery_time = current_time;
  }
  if (jp.status == JumpPointStatus::Unknown) jp.status = JumpPointStatus::Detected;
  jp.survey_level = std::max(1, jp.survey_level);
}

std::vector<Detection> ExplorationEngine::attempt_jump_point_detection(const Fleet& fleet, StarSystem& sys,
                                                                       FactionId faction, double current_time,
                                                                       util::Rng& rng, IdAllocator& ids) {
  initialize_system_exploration(sys, faction, rng, ids);
  FactionExploration& knowledge = systems_.at(sys.id).factions[faction];

  std::vector<Detection> out;
  const double range_km = cfg_.detection_range_au * kKmPerAu;

  for (JumpPoint& jp : sys.jump_points) {
    if (jp.status == JumpPointStatus::Destroyed) continue;
    if (knowledge.discovered_jump_points.count(jp.id)) continue;

    const double dist = fleet.position_km.distance_to(jp.position_km);
    if (dist > range_km) continue;
    if (!rng.chance(detection_probability(fleet, jp, dist, knowledge))) continue;

    mark_discovered(jp, faction, current_time);
    knowledge.discovered_jump_points.insert(jp.id);
    out.push_back(Detection{jp.id, sys.id, faction, jp.survey_level, false});
    log::info("Fleet " + fleet.name + " detected jump point " + jp.name + " in " + sys.name);
  }

  auto hit = hidden_points_.find(sys.id);
  if (hit == hidden_points_.end()) return out;

  auto& pool = hit->second;
  for (auto it = pool.begin(); it != pool.end();) {
    const double dist = fleet.position_km.distance_to(it->position_km);
    if (dist > range_km ||
        !rng.chance(detection_probability(fleet, *it, dist, knowledge) * cfg_.hidden_detection_factor)) {
      ++it;
      continue;
    }

    JumpPoint revealed = std::move(*it);
    it = pool.erase(it);

    mark_discovered(revealed, faction, current_time);
    knowledge.discovered_jump_points.insert(revealed.id);
    out.push_back(Detection{revealed.id, sys.id, faction, revealed.survey_level, true});
    log::info("Fleet " + fleet.name + " discovered hidden jump point " + revealed.name + " in " + sys.name);
    sys.jump_points.push_back(std::move(revealed));
  }
  if (pool.empty()) hidden_points_.erase(hit);
  return out;
}

CommandResult ExplorationEngine::survey_jump_point(Fleet& fleet, const StarSystem& sys, JumpPointId jump_point,
                                                   FactionId faction, double current_time) {
  const JumpPoint* jp = find_jump_point(sys, jump_point);
  if (!jp) return {false, "Unknown jump point"};
  if (jp->survey_level >= kMaxSurveyLevel) return {false, "Jump point " + jp->name + " is already fully surveyed"};
  if (faction.valid() && fleet.faction_id.valid() && faction != fleet.faction_id) {
    return {false, "Fleet does not belong to the surveying faction"};
  }

  const double survey_range_km = cfg_.detection_range_au * kKmPerAu * 0.5;
  if (fleet.position_km.distance_to(jp->position_km) > survey_range_km) {
    return {false, "Fleet is too far from jump point " + jp->name + " to survey it"};
  }

  const double duration = cfg_.survey_base_time_s * jp->exploration_difficulty / fleet_survey_capability(fleet);
  return launch_mission(fleet, sys, MissionKind::Survey, current_time, duration, jp->position_km, jp->id);
}

ExplorationStatus ExplorationEngine::get_exploration_status(SystemId system, FactionId faction) const {
  ExplorationStatus st;
  auto it = systems_.find(system);
  if (it == systems_.end()) return st;

  st.system_difficulty = it->second.difficulty;
  st.potential_discoveries = hidden_point_count(system);

  auto fit = it->second.factions.find(faction);
  if (fit == it->second.factions.end()) return st;

  st.exploration_progress = fit->second.exploration_progress;
  st.survey_completeness = fit->second.survey_completeness;
  st.discovered_jump_points = static_cast<int>(fit->second.discovered_jump_points.size());
  st.last_exploration = fit->second.last_exploration;
  return st;
}

const ExplorationMission* ExplorationEngine::active_mission(FleetId fleet) const {
  auto it = missions_.find(fleet);
  return it == missions_.end() ? nullptr : &it->second;
}

std::vector<JumpPointId> ExplorationEngine::discovered_jump_points(SystemId system, FactionId faction) const {
  auto it = systems_.find(system);
  if (it == systems_.end()) return {};
  auto fit = it->second.factions.find(faction);
  if (fit == it->second.factions.end()) return {};
  return {fit->second.discovered_jump_points.begin(), fit->second.discovered_jump_points.end()};
}

int ExplorationEngine::hidden_point_count(SystemId system) const {
  auto it = hidden_points_.find(system);
  return it == hidden_points_.end() ? 0 : static_cast<int>(it->second.size());
}

const SystemExploration* ExplorationEngine::system_record(SystemId system) const {
  auto it = systems_.find(system);
  return it == systems_.end() ? nullptr : &it->second;
}

} // namespace starlane
