#pragma once

#include <string>
#include <vector>

#include "starlane/util/json.h"

namespace starlane {

// 1 astronomical unit in kilometres.
inline constexpr double kKmPerAu = 149597870.7;

// Every tunable constant of the jump subsystem.
//
// Defaults reproduce the stock game balance. A JSON object can overlay any
// subset of the fields by name (see load_jump_config_from_json).
struct JumpConfig {
  // --- cost model ---
  double base_fuel_cost{100.0};
  double fuel_cost_per_ship{10.0};
  double base_travel_time_s{30.0};

  // Fleets below this much fuel may not request a jump at all.
  double min_fuel_to_jump{20.0};

  // Preparation time = max(min, base + per_ship * ships + penalty * (1 - stability)).
  double preparation_base_s{30.0};
  double preparation_per_ship_s{5.0};
  double preparation_instability_penalty_s{20.0};
  double preparation_min_s{10.0};

  // Actual transit time is the computed one scaled by U(1 - jitter, 1 + jitter).
  double travel_time_jitter{0.1};

  // Arrivals are placed this far from the reciprocal jump point.
  double arrival_offset_km{1000.0};

  // Per-fleet jump history length.
  int max_history_entries{50};

  // --- detection ---
  double detection_range_au{10.0};
  double detection_base_chance{0.3};
  double detection_falloff_floor{0.1};
  double detection_experience_bonus{0.1};
  double detection_min_chance{0.01};
  double detection_max_chance{0.95};
  double hidden_detection_factor{0.5};

  // --- missions ---
  double explore_base_time_s{3600.0};
  double survey_base_time_s{7200.0};
  double deep_scan_time_multiplier{2.0};
  double min_mission_duration_s{60.0};

  double mission_detection_progress{0.3};
  double mission_detection_chance{0.1};
  double mission_anomaly_progress{0.7};
  double mission_anomaly_chance{0.05};

  // --- hidden point pool ---
  double hidden_first_chance{0.4};
  double hidden_extra_chance{0.15};
  int hidden_extra_rolls{2};
  double hidden_min_distance_au{3.0};
  double hidden_max_distance_au{8.0};

  // --- network generation ---
  double generated_min_distance_au{2.0};
  double generated_max_distance_au{6.0};
  double unstable_link_chance{0.2};
  double dormant_link_chance{0.1};

  // Hop limit used for the reachable sets of a faction's known network.
  int known_network_max_hops{5};
};

// Overlays the keys present in `obj` (a JSON object) onto `base`.
// Unknown keys are logged and ignored. Throws std::runtime_error if `obj` is
// not an object or a value has the wrong type.
JumpConfig load_jump_config_from_json(const json::Value& obj, JumpConfig base = JumpConfig{});

// Reads and parses a JSON config file. Throws on I/O or parse failure.
JumpConfig load_jump_config_from_file(const std::string& path, JumpConfig base = JumpConfig{});

// Returns human-readable problems; empty when the config is usable.
std::vector<std::string> validate_jump_config(const JumpConfig& cfg);

} // namespace starlane
