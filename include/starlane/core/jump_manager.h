#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "starlane/core/entities.h"
#include "starlane/core/exploration.h"
#include "starlane/core/jump_config.h"
#include "starlane/core/jump_network.h"
#include "starlane/core/jump_travel.h"
#include "starlane/util/rng.h"

namespace starlane {

// What one faction knows of the jump network.
struct FactionKnowledge {
  std::set<SystemId> known_systems;
  std::unordered_set<JumpPointId> known_jump_points;

  int exploration_missions{0};
  int jumps_initiated{0};
  int jump_points_discovered{0};

  // Private graph over the known subset; rebuilt when `dirty`.
  JumpNetwork network;
  bool dirty{true};
};

struct TurnUpdateResult {
  std::vector<MissionReport> exploration_results;
  std::vector<TravelEvent> travel_results;
  // Every successful detection this tick: mission rolls first, then passive.
  std::vector<Detection> discoveries;
};

struct AvailableJumpInfo {
  AvailableJump jump;
  std::string target_system_name;
  bool target_explored{false};
  ExplorationStatus target_exploration;
};

struct KnownConnection {
  SystemId from;
  SystemId to;
  JumpPointId jump_point_id;
  std::string jump_point_name;
  JumpPointStatus status{JumpPointStatus::Unknown};
  int survey_level{0};
  double weight{0.0};
};

struct KnownNetwork {
  FactionId faction;
  std::vector<SystemId> known_systems;
  std::vector<JumpPointId> known_jump_points;
  std::vector<KnownConnection> connections;
  // Per known system: reachable systems and hop counts.
  std::map<SystemId, std::map<SystemId, int>> reachable;

  int exploration_missions{0};
  int jumps_initiated{0};
  int jump_points_discovered{0};
};

// Facade the simulation drives once per tick.
//
// Owns the engines, the shared random source, the jump point id allocator
// and all faction knowledge. Fleets, ships and systems stay with the caller
// and are passed in by reference.
class JumpPointManager {
 public:
  JumpPointManager();
  explicit JumpPointManager(const JumpConfig& cfg, std::uint64_t seed = 0);

  void seed(std::uint64_t value) { rng_.seed(value); }

  TurnUpdateResult process_turn_update(FleetMap& fleets, SystemMap& systems, const ShipMap& ships,
                                       double current_time, double delta_seconds);

  // --- commands ---
  CommandResult start_exploration_mission(Fleet& fleet, SystemId system, const SystemMap& systems,
                                          MissionKind kind, double current_time);
  CommandResult survey_jump_point(Fleet& fleet, JumpPointId jump_point, const SystemMap& systems,
                                  double current_time);
  CommandResult initiate_fleet_jump(Fleet& fleet, JumpPointId jump_point, const SystemMap& systems,
                                    const ShipMap& ships, const TechnologyQuery& tech, double current_time);
  CommandResult cancel_fleet_jump(Fleet& fleet);

  // --- queries ---
  std::vector<AvailableJumpInfo> get_available_jumps_for_fleet(const Fleet& fleet, const SystemMap& systems,
                                                               const ShipMap& ships,
                                                               const TechnologyQuery& tech) const;
  JumpStatusView get_fleet_jump_status(FleetId fleet) const { return travel_.get_jump_status(fleet); }
  ExplorationStatus get_system_exploration_status(SystemId system, FactionId faction) const {
    return exploration_.get_exploration_status(system, faction);
  }
  std::vector<JumpHistoryEntry> get_jump_history(FleetId fleet, int limit = 10) const {
    return travel_.get_jump_history(fleet, limit);
  }

  KnownNetwork get_faction_jump_network(FactionId faction, const SystemMap& systems);

  // Cheapest known route for `faction`. Empty when none is known.
  std::vector<SystemId> find_known_route(FactionId faction, SystemId from, SystemId to, const SystemMap& systems);

  // --- network ---
  NetworkGenerationStats generate_enhanced_jump_network(SystemMap& systems, double connectivity_level);
  void update_network(const SystemMap& systems);

  const JumpNetwork& network() const { return network_; }
  const ExplorationEngine& exploration() const { return exploration_; }
  const TravelEngine& travel() const { return travel_; }
  const JumpConfig& config() const { return cfg_; }
  const FactionKnowledge* knowledge(FactionId faction) const;

 private:
  FactionKnowledge& knowledge_for(FactionId faction);
  void sync_ids(const SystemMap& systems);
  void prepare_system(const StarSystem& sys, FactionId faction, const SystemMap& systems);
  void refresh_knowledge(const FleetMap& fleets, const SystemMap& systems, const TurnUpdateResult& result);
  void rebuild_faction_graph(FactionId faction, FactionKnowledge& k, const SystemMap& systems);

  JumpConfig cfg_;
  util::Rng rng_;
  IdAllocator ids_;

  ExplorationEngine exploration_;
  TravelEngine travel_;
  JumpNetwork network_;

  std::unordered_map<FactionId, FactionKnowledge> factions_;
};

} // namespace starlane
