#pragma once

#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "starlane/core/entities.h"
#include "starlane/core/jump_config.h"
#include "starlane/util/rng.h"

namespace starlane {

enum class MissionKind { Explore, Survey, DeepScan };

enum class ExplorationResult { NoDiscovery, JumpPointDetected, JumpPointSurveyed, AnomalyDetected };

struct ExplorationMission {
  FleetId fleet_id;
  SystemId system_id;
  MissionKind kind{MissionKind::Explore};

  double start_time{0.0};
  double duration{0.0};

  std::optional<Vec3> target_position;
  JumpPointId target_jump_point;

  double progress{0.0};  // 0..1
  bool completed{false};
  std::vector<ExplorationResult> results;
};

// What one faction knows about one system.
struct FactionExploration {
  double exploration_progress{0.0};  // 0..1
  double survey_completeness{0.0};   // 0..1
  std::set<JumpPointId> discovered_jump_points;
  std::optional<double> last_exploration;
};

struct SystemExploration {
  double difficulty{1.0};
  double total_mission_time{0.0};
  int hidden_points_generated{0};
  std::unordered_map<FactionId, FactionExploration> factions;
};

// Read-only projection returned by get_exploration_status().
struct ExplorationStatus {
  double exploration_progress{0.0};
  double survey_completeness{0.0};
  int discovered_jump_points{0};
  std::optional<double> last_exploration;
  double system_difficulty{1.0};
  int potential_discoveries{0};
};

// One successful detection roll.
struct Detection {
  JumpPointId jump_point;
  SystemId system;
  FactionId faction;
  int survey_level{0};
  bool was_hidden{false};
};

// Per-mission outcome of one processing pass.
struct MissionReport {
  FleetId fleet_id;
  SystemId system_id;
  MissionKind kind{MissionKind::Explore};
  double progress{0.0};
  bool completed{false};
  std::vector<ExplorationResult> results;
  std::vector<Detection> detections;
};

// Exploration size score: 1 + 0.1/planet + 0.2/belt + 0.1/AU of habitable
// zone width, clamped to [0.5, 3].
double system_exploration_difficulty(const StarSystem& sys);

// 1 + 0.1 per ship, floor 0.5.
double fleet_survey_capability(const Fleet& fleet);

std::string mission_kind_to_string(MissionKind k);
std::string exploration_result_to_string(ExplorationResult r);

// Survey / exploration missions and per-faction discovery state.
//
// Owns hidden jump point pools: points generated with a system but withheld
// from every faction until a detection roll reveals them.
class ExplorationEngine {
 public:
  explicit ExplorationEngine(const JumpConfig& cfg);

  // Idempotent. The first call for a system rolls its hidden pool.
  void initialize_system_exploration(const StarSystem& sys, FactionId faction, util::Rng& rng,
                                     IdAllocator& ids);

  CommandResult start_exploration_mission(Fleet& fleet, const StarSystem& sys, MissionKind kind,
                                          double current_time,
                                          std::optional<Vec3> target_position = std::nullopt);

  // Advances every mission in ascending fleet id order. Missions whose fleet
  // or system disappeared are dropped.
  std::vector<MissionReport> process_exploration_missions(FleetMap& fleets, SystemMap& systems,
                                                          double current_time, double delta_seconds,
                                                          util::Rng& rng, IdAllocator& ids);

  // Rolls detection for every undiscovered point in range, visible and hidden.
  std::vector<Detection> attempt_jump_point_detection(const Fleet& fleet, StarSystem& sys, FactionId faction,
                                                      double current_time, util::Rng& rng, IdAllocator& ids);

  CommandResult survey_jump_point(Fleet& fleet, const StarSystem& sys, JumpPointId jump_point,
                                  FactionId faction, double current_time);

  ExplorationStatus get_exploration_status(SystemId system, FactionId faction) const;

  bool has_active_mission(FleetId fleet) const { return missions_.count(fleet) != 0; }
  const ExplorationMission* active_mission(FleetId fleet) const;
  std::size_t active_mission_count() const { return missions_.size(); }

  // Ids `faction` has discovered in `system` (ascending).
  std::vector<JumpPointId> discovered_jump_points(SystemId system, FactionId faction) const;

  int hidden_point_count(SystemId system) const;

  const SystemExploration* system_record(SystemId system) const;

 private:
  CommandResult launch_mission(Fleet& fleet, const StarSystem& sys, MissionKind kind, double current_time,
                               double duration, std::optional<Vec3> target_position, JumpPointId target);

  double detection_probability(const Fleet& fleet, const JumpPoint& jp, double distance_km,
                               const FactionExploration& knowledge) const;

  void mark_discovered(JumpPoint& jp, FactionId faction, double current_time) const;

  void complete_mission(ExplorationMission& mission, Fleet& fleet, StarSystem& sys, double current_time,
                        util::Rng& rng, IdAllocator& ids, MissionReport& report);

  void generate_hidden_pool(const StarSystem& sys, SystemExploration& rec, util::Rng& rng, IdAllocator& ids);

  JumpConfig cfg_;
  std::unordered_map<FleetId, ExplorationMission> missions_;
  std::unordered_map<SystemId, SystemExploration> systems_;
  std::unordered_map<SystemId, std::vector<JumpPoint>> hidden_points_;
};

} // namespace starlane
