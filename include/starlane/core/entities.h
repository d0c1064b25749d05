#pragma once

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "starlane/core/ids.h"
#include "starlane/core/jump_config.h"
#include "starlane/core/vec3.h"

namespace starlane {

// --- jump points ---

enum class JumpPointKind { Natural, Artificial, Unstable, Dormant, Restricted };

// Discovery / usability state of a jump point.
//
// Unknown -> Detected -> Surveyed -> Mapped -> Active is the normal progression.
// Inactive marks dormant links; Destroyed is terminal.
enum class JumpPointStatus { Unknown, Detected, Surveyed, Mapped, Active, Inactive, Destroyed };

// Highest survey level a point can reach.
inline constexpr int kMaxSurveyLevel = 3;

// Survey level required before a point can carry traffic.
inline constexpr int kMinTravelSurveyLevel = 2;

struct JumpPoint {
  JumpPointId id;
  std::string name;

  Vec3 position_km{0.0, 0.0, 0.0};

  // Destination system. Unset for points whose far side is undetermined.
  // Use assign_destination(); once set it never changes.
  SystemId connects_to;

  JumpPointKind kind{JumpPointKind::Natural};
  JumpPointStatus status{JumpPointStatus::Unknown};

  double stability{1.0};  // 0..1
  int size_class{3};      // 1..5
  int survey_level{0};    // 0..kMaxSurveyLevel

  // Explicit per-faction access overrides.
  std::unordered_map<FactionId, bool> access_flags;

  FactionId discovered_by;
  std::optional<double> discovery_time;
  std::optional<double> last_surveyed;

  std::optional<double> last_transit;
  int traffic_level{0};

  double exploration_difficulty{1.0};
  double fuel_cost_modifier{1.0};
  double travel_time_modifier{1.0};

  // Technology a faction needs before transiting. Empty: none.
  std::string tech_requirement;

  // Hull size classes this point can carry.
  int min_ship_size{1};
  int max_ship_size{5};

  bool is_accessible_by(FactionId faction) const;

  // Fuel for a fleet of `ship_count` ships massing `total_mass_tons`.
  // Never below cfg.base_fuel_cost; non-decreasing in ship_count.
  double fuel_cost(double total_mass_tons, int ship_count, const JumpConfig& cfg = JumpConfig{}) const;

  // Seconds in transit. Never below cfg.base_travel_time_s.
  double travel_time(double total_mass_tons, int ship_count, const JumpConfig& cfg = JumpConfig{}) const;

  // Status active or mapped, and surveyed to at least kMinTravelSurveyLevel.
  bool travel_eligible() const;

  // Sets connects_to if unset. Returns false (and leaves the point untouched)
  // when a different destination is already recorded.
  bool assign_destination(SystemId target);
};

// --- collaborator-owned entities ---

enum class FleetStatus { Idle, Moving, InTransit, Orbiting, Surveying, Exploring, FormingUp };

struct Ship {
  ShipId id;
  std::string name;
  double current_mass_tons{0.0};
  int size_class{1};
  bool has_jump_drive{true};
};

struct Fleet {
  FleetId id;
  std::string name;
  FactionId faction_id;
  SystemId system_id;

  Vec3 position_km{0.0, 0.0, 0.0};
  Vec3 velocity_km_s{0.0, 0.0, 0.0};

  std::vector<ShipId> ships;

  FleetStatus status{FleetStatus::Idle};
  std::vector<std::string> current_orders;

  std::optional<Vec3> destination;
  std::optional<double> estimated_arrival;

  double fuel_remaining{0.0};
};

struct StarSystem {
  SystemId id;
  std::string name;

  double star_mass{1.0};  // solar masses
  int planet_count{0};
  int asteroid_belt_count{0};
  double habitable_zone_inner_au{0.0};
  double habitable_zone_outer_au{0.0};

  std::vector<JumpPoint> jump_points;
  bool explored{false};
};

using FleetMap = std::unordered_map<FleetId, Fleet>;
using SystemMap = std::unordered_map<SystemId, StarSystem>;
using ShipMap = std::unordered_map<ShipId, Ship>;

// Answers "does faction F have technology T". An empty query means every
// technology is available.
using TechnologyQuery = std::function<bool(FactionId, const std::string&)>;

// Outcome of a command. Failures are expected and carry a reason.
struct CommandResult {
  bool ok{false};
  std::string message;
};

// Aggregate of a fleet's ships as the cost model sees them.
struct FleetShape {
  int ship_count{0};
  double total_mass_tons{0.0};
  int min_size_class{0};
  int max_size_class{0};
  // Ships with a jump drive whose hull fits the point being checked.
  int jump_capable{0};
};

// Missing ship ids are skipped. When `through` is given, jump_capable counts
// only hulls within its size limits.
FleetShape summarize_fleet(const Fleet& fleet, const ShipMap& ships, const JumpPoint* through = nullptr);

// Lookup helpers. Return nullptr when absent.
JumpPoint* find_jump_point(StarSystem& sys, JumpPointId id);
const JumpPoint* find_jump_point(const StarSystem& sys, JumpPointId id);

} // namespace starlane
