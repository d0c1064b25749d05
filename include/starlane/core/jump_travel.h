#pragma once

#include <deque>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "starlane/core/entities.h"
#include "starlane/core/jump_config.h"
#include "starlane/util/rng.h"

namespace starlane {

enum class JumpStatus { Pending, Preparing, Jumping, Completed, Failed, Cancelled };

std::string jump_status_to_string(JumpStatus s);

// Feasibility of one fleet using one jump point. Checks fail closed: the
// first failing check is recorded and evaluation stops.
struct JumpRequirements {
  bool can_jump{false};
  bool has_jump_drive{false};

  double fuel_cost{0.0};
  double travel_time{0.0};
  double preparation_time{0.0};

  // Hull size classes present in the fleet.
  int min_ship_size{0};
  int max_ship_size{0};

  std::vector<std::string> tech_requirements;
  std::vector<std::string> failure_reasons;

  std::string summary() const;
};

// Phase 1: the fleet is forming up. No fuel has been spent yet.
struct JumpPreparation {
  FleetId fleet_id;
  JumpPointId jump_point_id;
  SystemId origin_system_id;
  SystemId target_system_id;

  double start_time{0.0};
  double preparation_time{0.0};
  double fuel_cost{0.0};
  double travel_time{0.0};  // before jitter

  double progress{0.0};
  JumpStatus status{JumpStatus::Pending};
};

// Phase 2: in transit. Fuel is already deducted; cannot be cancelled.
struct JumpOperation {
  FleetId fleet_id;
  SystemId origin_system_id;
  SystemId target_system_id;
  JumpPointId jump_point_id;

  double start_time{0.0};
  double travel_time{0.0};
  double fuel_consumed{0.0};

  double progress{0.0};
  JumpStatus status{JumpStatus::Jumping};
};

using JumpPhase = std::variant<JumpPreparation, JumpOperation>;

struct JumpHistoryEntry {
  SystemId origin_system_id;
  SystemId target_system_id;
  JumpPointId jump_point_id;
  double start_time{0.0};
  double travel_time{0.0};
  double fuel_consumed{0.0};
  double arrival_time{0.0};
  JumpStatus status{JumpStatus::Completed};
};

enum class TravelEventKind {
  JumpExecuted,
  ExecutionFailed,
  JumpPointLost,
  Arrived,
  ArrivalFailed,
};

std::string travel_event_kind_to_string(TravelEventKind k);

struct TravelEvent {
  FleetId fleet_id;
  TravelEventKind kind{TravelEventKind::JumpExecuted};
  SystemId origin_system_id;
  SystemId target_system_id;
  JumpPointId jump_point_id;
  std::string message;

  bool failed() const {
    return kind == TravelEventKind::ExecutionFailed || kind == TravelEventKind::JumpPointLost ||
           kind == TravelEventKind::ArrivalFailed;
  }
};

enum class JumpPhaseKind { None, Preparation, Transit };

struct JumpStatusView {
  bool has_operation{false};
  JumpPhaseKind phase{JumpPhaseKind::None};
  JumpStatus status{JumpStatus::Pending};
  double progress{0.0};
  double remaining_time{0.0};

  SystemId origin_system_id;
  SystemId target_system_id;
  JumpPointId jump_point_id;
  // Planned cost during preparation, spent fuel during transit.
  double fuel{0.0};
};

struct AvailableJump {
  JumpPointId jump_point_id;
  std::string jump_point_name;
  SystemId target_system_id;
  JumpPointStatus jump_point_status{JumpPointStatus::Unknown};
  double stability{1.0};
  int size_class{0};
  JumpRequirements requirements;
};

// Per-fleet jump state machine.
//
//   none -> preparing -> jumping -> none
//   preparing -> failed | cancelled
//
// A fleet holds at most one phase at a time; the map stores exactly one
// variant per fleet id.
class TravelEngine {
 public:
  explicit TravelEngine(const JumpConfig& cfg);

  JumpRequirements calculate_jump_requirements(const Fleet& fleet, const JumpPoint& jp, const ShipMap& ships,
                                               const TechnologyQuery& tech) const;

  CommandResult initiate_jump_preparation(Fleet& fleet, const JumpPoint& jp, SystemId target_system,
                                          double current_time, const ShipMap& ships, const TechnologyQuery& tech);

  // Requires a preparation through `jp` at full progress. Deducts fuel and
  // replaces the preparation with an operation.
  CommandResult execute_jump(Fleet& fleet, JumpPoint& jp, double current_time, util::Rng& rng);

  // Auto-transition for a finished preparation: resolves its jump point and
  // executes, or marks the preparation failed and removes it.
  TravelEvent complete_preparation(Fleet& fleet, SystemMap& systems, double current_time, util::Rng& rng);

  // Advances preparations, then operations, in ascending fleet id order.
  std::vector<TravelEvent> process_jump_operations(FleetMap& fleets, SystemMap& systems, double current_time,
                                                   double delta_seconds, util::Rng& rng);

  // Only a preparation can be cancelled.
  CommandResult cancel_jump_operation(Fleet& fleet);

  JumpStatusView get_jump_status(FleetId fleet) const;

  // Most recent `limit` entries, oldest first. limit <= 0 returns all.
  std::vector<JumpHistoryEntry> get_jump_history(FleetId fleet, int limit = 10) const;

  // Every point in `sys` accessible to the fleet's faction, feasible or not.
  std::vector<AvailableJump> get_available_jumps(const Fleet& fleet, const StarSystem& sys, const ShipMap& ships,
                                                 const TechnologyQuery& tech) const;

  bool has_active_phase(FleetId fleet) const { return phases_.count(fleet) != 0; }
  const JumpPreparation* preparation(FleetId fleet) const;
  const JumpOperation* operation(FleetId fleet) const;

  double preparation_time(const Fleet& fleet, const JumpPoint& jp) const;

 private:
  TravelEvent complete_jump(Fleet& fleet, JumpOperation& op, SystemMap& systems, double current_time,
                            util::Rng& rng);
  void record_history(const JumpOperation& op, double arrival_time);

  JumpConfig cfg_;
  std::unordered_map<FleetId, JumpPhase> phases_;
  std::unordered_map<FleetId, std::deque<JumpHistoryEntry>> history_;
};

} // namespace starlane
