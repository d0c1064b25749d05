#include "starlane/core/jump_manager.h"

#include <algorithm>
#include <utility>

#include "starlane/util/log.h"
#include "starlane/util/sorted_keys.h"

namespace starlane {
namespace {

bool passive_detection_status(FleetStatus s) {
  return s == FleetStatus::Moving || s == FleetStatus::InTransit || s == FleetStatus::Exploring;
}

} // namespace

JumpPointManager::JumpPointManager() : exploration_(cfg_), travel_(cfg_) {}

JumpPointManager::JumpPointManager(const JumpConfig& cfg, std::uint64_t seed)
    : cfg_(cfg), rng_(seed), exploration_(cfg_), travel_(cfg_) {}

FactionKnowledge& JumpPointManager::knowledge_for(FactionId faction) { return factions_[faction]; }

const FactionKnowledge* JumpPointManager::knowledge(FactionId faction) const {
  auto it = factions_.find(faction);
  return it == factions_.end() ? nullptr : &it->second;
}

void JumpPointManager::sync_ids(const SystemMap& systems) {
  for (const auto& [sid, sys] : systems) {
    (void)sid;
    for (const auto& jp : sys.jump_points) ids_.observe(jp.id.value);
  }
}

TurnUpdateResult JumpPointManager::process_turn_update(FleetMap& fleets, SystemMap& systems,
                                                       const ShipMap& /*ships*/, double current_time,
                                                       double delta_seconds) {
  sync_ids(systems);

  TurnUpdateResult result;

  // (a) missions
  result.exploration_results =
      exploration_.process_exploration_missions(fleets, systems, current_time, delta_seconds, rng_, ids_);
  for (const auto& report : result.exploration_results) {
    result.discoveries.insert(result.discoveries.end(), report.detections.begin(), report.detections.end());
  }

  // (b) travel
  result.travel_results = travel_.process_jump_operations(fleets, systems, current_time, delta_seconds, rng_);

  // (c) passive detection
  for (FleetId fid : util::sorted_keys(fleets)) {
    const Fleet& fleet = fleets.at(fid);
    if (!passive_detection_status(fleet.status)) continue;
    auto sit = systems.find(fleet.system_id);
    if (sit == systems.end()) continue;

    auto found =
        exploration_.attempt_jump_point_detection(fleet, sit->second, fleet.faction_id, current_time, rng_, ids_);
    result.discoveries.insert(result.discoveries.end(), found.begin(), found.end());
  }

  // (d) faction knowledge
  refresh_knowledge(fleets, systems, result);
  return result;
}

void JumpPointManager::refresh_knowledge(const FleetMap& fleets, const SystemMap& systems,
                                         const TurnUpdateResult& result) {
  for (const Detection& d : result.discoveries) {
    FactionKnowledge& k = knowledge_for(d.faction);
    k.jump_points_discovered += 1;
    k.known_jump_points.insert(d.jump_point);
    k.known_systems.insert(d.system);
    k.dirty = true;
  }

  for (const TravelEvent& ev : result.travel_results) {
    auto fit = fleets.find(ev.fleet_id);
    if (fit == fleets.end()) continue;
    FactionKnowledge& k = knowledge_for(fit->second.faction_id);
    if (ev.kind == TravelEventKind::Arrived) k.known_systems.insert(ev.target_system_id);
    k.dirty = true;
  }

  for (const MissionReport& r : result.exploration_results) {
    if (!r.completed) continue;
    auto fit = fleets.find(r.fleet_id);
    if (fit != fleets.end()) knowledge_for(fit->second.faction_id).dirty = true;
  }

  for (const auto& [fid, fleet] : fleets) {
    (void)fid;
    if (!fleet.faction_id.valid() || !fleet.system_id.valid()) continue;
    FactionKnowledge& k = knowledge_for(fleet.faction_id);
    if (k.known_systems.insert(fleet.system_id).second) k.dirty = true;
  }

  // Merge what the exploration engine recorded, and let surveyed points
  // reveal where they lead.
  for (FactionId faction : util::sorted_keys(factions_)) {
    FactionKnowledge& k = factions_.at(faction);
    for (SystemId sid : util::sorted_keys(systems)) {
      const StarSystem& sys = systems.at(sid);
      for (JumpPointId jid : exploration_.discovered_jump_points(sid, faction)) {
        if (k.known_jump_points.insert(jid).second) k.dirty = true;
      }
      for (const auto& jp : sys.jump_points) {
        if (!k.known_jump_points.count(jp.id)) continue;
        if (k.known_systems.insert(sid).second) k.dirty = true;
        if (jp.survey_level >= kMinTravelSurveyLevel && systems.count(jp.connects_to)) {
          if (k.known_systems.insert(jp.connects_to).second) k.dirty = true;
        }
      }
    }
    if (k.dirty) rebuild_faction_graph(faction, k, systems);
  }
}

void JumpPointManager::rebuild_faction_graph(FactionId faction, FactionKnowledge& k, const SystemMap& systems) {
  k.network.build_faction_graph(systems, k.known_jump_points, k.known_systems, faction);
  k.dirty = false;
}

void JumpPointManager::prepare_system(const StarSystem& sys, FactionId faction, const SystemMap& systems) {
  // Hidden points draw ids from the shared allocator; it must have seen every caller-assigned id first.
  sync_ids(systems);
  exploration_.initialize_system_exploration(sys, faction, rng_, ids_);
}

CommandResult JumpPointManager::start_exploration_mission(Fleet& fleet, SystemId system, const SystemMap& systems,
                                                          MissionKind kind, double current_time) {
  auto sit = systems.find(system);
  if (sit == systems.end()) return {false, "System not found"};
  const StarSystem& sys = sit->second;
  if (travel_.has_active_phase(fleet.id)) return {false, "Fleet is preparing for or executing a jump"};

  prepare_system(sys, fleet.faction_id, systems);
  CommandResult r = exploration_.start_exploration_mission(fleet, sys, kind, current_time);
  if (!r.ok) return r;

  FactionKnowledge& k = knowledge_for(fleet.faction_id);
  k.exploration_missions += 1;
  if (k.known_systems.insert(sys.id).second) k.dirty = true;
  return r;
}

CommandResult JumpPointManager::survey_jump_point(Fleet& fleet, JumpPointId jump_point, const SystemMap& systems,
                                                  double current_time) {
  auto sit = systems.find(fleet.system_id);
  if (sit == systems.end()) return {false, "Fleet system not found"};
  const StarSystem& sys = sit->second;

  const JumpPoint* jp = find_jump_point(sys, jump_point);
  if (!jp) return {false, "Jump point not found in current system"};
  if (travel_.has_active_phase(fleet.id)) return {false, "Fleet is preparing for or executing a jump"};

  prepare_system(sys, fleet.faction_id, systems);
  CommandResult r = exploration_.survey_jump_point(fleet, sys, jump_point, fleet.faction_id, current_time);
  if (!r.ok) return r;

  knowledge_for(fleet.faction_id).exploration_missions += 1;
  return {true, "Started survey of jump point " + jp->name};
}

CommandResult JumpPointManager::initiate_fleet_jump(Fleet& fleet, JumpPointId jump_point, const SystemMap& systems,
                                                    const ShipMap& ships, const TechnologyQuery& tech,
                                                    double current_time) {
  if (exploration_.has_active_mission(fleet.id)) return {false, "Fleet is busy with an exploration mission"};

  auto sit = systems.find(fleet.system_id);
  const JumpPoint* jp = (sit == systems.end()) ? nullptr : find_jump_point(sit->second, jump_point);
  if (!jp) return {false, "Jump point not found"};
  if (!jp->connects_to.valid()) return {false, "Jump point destination not set"};

  const SystemId target = jp->connects_to;
  if (!systems.count(target)) return {false, "Target system does not exist"};

  CommandResult r = travel_.initiate_jump_preparation(fleet, *jp, target, current_time, ships, tech);
  if (!r.ok) return r;

  FactionKnowledge& k = knowledge_for(fleet.faction_id);
  k.jumps_initiated += 1;
  k.known_systems.insert(fleet.system_id);
  k.known_systems.insert(target);
  k.known_jump_points.insert(jp->id);
  k.dirty = true;
  return r;
}

CommandResult JumpPointManager::cancel_fleet_jump(Fleet& fleet) { return travel_.cancel_jump_operation(fleet); }

std::vector<AvailableJumpInfo> JumpPointManager::get_available_jumps_for_fleet(const Fleet& fleet,
                                                                               const SystemMap& systems,
                                                                               const ShipMap& ships,
                                                                               const TechnologyQuery& tech) const {
  std::vector<AvailableJumpInfo> out;
  auto sit = systems.find(fleet.system_id);
  if (sit == systems.end()) return out;

  for (AvailableJump& a : travel_.get_available_jumps(fleet, sit->second, ships, tech)) {
    AvailableJumpInfo info;
    if (auto tit = systems.find(a.target_system_id); tit != systems.end()) {
      info.target_system_name = tit->second.name;
      info.target_explored = tit->second.explored;
      info.target_exploration = exploration_.get_exploration_status(a.target_system_id, fleet.faction_id);
    }
    info.jump = std::move(a);
    out.push_back(std::move(info));
  }
  return out;
}

KnownNetwork JumpPointManager::get_faction_jump_network(FactionId faction, const SystemMap& systems) {
  FactionKnowledge& k = knowledge_for(faction);
  if (k.dirty) rebuild_faction_graph(faction, k, systems);

  KnownNetwork net;
  net.faction = faction;
  net.known_systems.assign(k.known_systems.begin(), k.known_systems.end());
  net.known_jump_points.assign(k.known_jump_points.begin(), k.known_jump_points.end());
  std::sort(net.known_jump_points.begin(), net.known_jump_points.end());

  for (SystemId sid : k.known_systems) {
    auto sit = systems.find(sid);
    if (sit == systems.end()) continue;
    for (const auto& jp : sit->second.jump_points) {
      if (!k.known_jump_points.count(jp.id) || !jp.is_accessible_by(faction)) continue;
      KnownConnection c;
      c.from = sid;
      c.to = jp.connects_to;
      c.jump_point_id = jp.id;
      c.jump_point_name = jp.name;
      c.status = jp.status;
      c.survey_level = jp.survey_level;
      c.weight = jump_edge_weight(jp);
      net.connections.push_back(std::move(c));
    }
  }

  for (SystemId sid : k.known_systems) {
    net.reachable[sid] = k.network.get_reachable_systems(sid, cfg_.known_network_max_hops);
  }

  net.exploration_missions = k.exploration_missions;
  net.jumps_initiated = k.jumps_initiated;
  net.jump_points_discovered = k.jump_points_discovered;
  return net;
}

std::vector<SystemId> JumpPointManager::find_known_route(FactionId faction, SystemId from, SystemId to,
                                                         const SystemMap& systems) {
  FactionKnowledge& k = knowledge_for(faction);
  if (k.dirty) rebuild_faction_graph(faction, k, systems);
  return k.network.find_shortest_path(from, to);
}

NetworkGenerationStats JumpPointManager::generate_enhanced_jump_network(SystemMap& systems,
                                                                        double connectivity_level) {
  sync_ids(systems);
  NetworkGenerationStats stats = network_.generate_enhanced_jump_network(systems, connectivity_level, rng_, ids_, cfg_);
  for (auto& [faction, k] : factions_) {
    (void)faction;
    k.dirty = true;
  }
  return stats;
}

void JumpPointManager::update_network(const SystemMap& systems) {
  sync_ids(systems);
  network_.build_network_graph(systems);
  for (auto& [faction, k] : factions_) {
    (void)faction;
    k.dirty = true;
  }
  log::debug("Jump network rebuilt over " + std::to_string(systems.size()) + " systems");
}

} // namespace starlane
