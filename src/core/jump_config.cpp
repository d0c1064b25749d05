#include "starlane/core/jump_config.h"

#include <cmath>
#include <stdexcept>
#include <utility>

#include "starlane/util/file_io.h"
#include "starlane/util/log.h"
#include "starlane/util/sorted_keys.h"

namespace starlane {
namespace {

struct DoubleField {
  const char* key;
  double JumpConfig::*member;
};

struct IntField {
  const char* key;
  int JumpConfig::*member;
};

constexpr DoubleField kDoubleFields[] = {
    {"base_fuel_cost", &JumpConfig::base_fuel_cost},
    {"fuel_cost_per_ship", &JumpConfig::fuel_cost_per_ship},
    {"base_travel_time_s", &JumpConfig::base_travel_time_s},
    {"min_fuel_to_jump", &JumpConfig::min_fuel_to_jump},
    {"preparation_base_s", &JumpConfig::preparation_base_s},
    {"preparation_per_ship_s", &JumpConfig::preparation_per_ship_s},
    {"preparation_instability_penalty_s", &JumpConfig::preparation_instability_penalty_s},
    {"preparation_min_s", &JumpConfig::preparation_min_s},
    {"travel_time_jitter", &JumpConfig::travel_time_jitter},
    {"arrival_offset_km", &JumpConfig::arrival_offset_km},
    {"detection_range_au", &JumpConfig::detection_range_au},
    {"detection_base_chance", &JumpConfig::detection_base_chance},
    {"detection_falloff_floor", &JumpConfig::detection_falloff_floor},
    {"detection_experience_bonus", &JumpConfig::detection_experience_bonus},
    {"detection_min_chance", &JumpConfig::detection_min_chance},
    {"detection_max_chance", &JumpConfig::detection_max_chance},
    {"hidden_detection_factor", &JumpConfig::hidden_detection_factor},
    {"explore_base_time_s", &JumpConfig::explore_base_time_s},
    {"survey_base_time_s", &JumpConfig::survey_base_time_s},
    {"deep_scan_time_multiplier", &JumpConfig::deep_scan_time_multiplier},
    {"min_mission_duration_s", &JumpConfig::min_mission_duration_s},
    {"mission_detection_progress", &JumpConfig::mission_detection_progress},
    {"mission_detection_chance", &JumpConfig::mission_detection_chance},
    {"mission_anomaly_progress", &JumpConfig::mission_anomaly_progress},
    {"mission_anomaly_chance", &JumpConfig::mission_anomaly_chance},
    {"hidden_first_chance", &JumpConfig::hidden_first_chance},
    {"hidden_extra_chance", &JumpConfig::hidden_extra_chance},
    {"hidden_min_distance_au", &JumpConfig::hidden_min_distance_au},
    {"hidden_max_distance_au", &JumpConfig::hidden_max_distance_au},
    {"generated_min_distance_au", &JumpConfig::generated_min_distance_au},
    {"generated_max_distance_au", &JumpConfig::generated_max_distance_au},
    {"unstable_link_chance", &JumpConfig::unstable_link_chance},
    {"dormant_link_chance", &JumpConfig::dormant_link_chance},
};

constexpr IntField kIntFields[] = {
    {"max_history_entries", &JumpConfig::max_history_entries},
    {"hidden_extra_rolls", &JumpConfig::hidden_extra_rolls},
    {"known_network_max_hops", &JumpConfig::known_network_max_hops},
};

double require_number(const json::Value& v, const std::string& key) {
  const double* d = v.as_number();
  if (!d) throw std::runtime_error("Jump config key '" + key + "' must be a number");
  return *d;
}

void check_probability(std::vector<std::string>& errors, const char* name, double p) {
  if (!(p >= 0.0 && p <= 1.0)) errors.push_back(std::string(name) + " must be within [0, 1]");
}

void check_positive(std::vector<std::string>& errors, const char* name, double v) {
  if (!(v > 0.0)) errors.push_back(std::string(name) + " must be > 0");
}

} // namespace

JumpConfig load_jump_config_from_json(const json::Value& obj, JumpConfig base) {
  if (!obj.is_object()) throw std::runtime_error("Jump config must be a JSON object");

  const json::Object& o = obj.object();
  for (const std::string& key : util::sorted_keys(o)) {
    const json::Value& v = o.at(key);

    bool matched = false;
    for (const DoubleField& f : kDoubleFields) {
      if (key != f.key) continue;
      base.*(f.member) = require_number(v, key);
      matched = true;
      break;
    }
    if (matched) continue;

    for (const IntField& f : kIntFields) {
      if (key != f.key) continue;
      const double d = require_number(v, key);
      if (std::floor(d) != d) throw std::runtime_error("Jump config key '" + key + "' must be an integer");
      base.*(f.member) = static_cast<int>(d);
      matched = true;
      break;
    }
    if (!matched) log::warn("Unknown jump config key ignored: " + key);
  }
  return base;
}

JumpConfig load_jump_config_from_file(const std::string& path, JumpConfig base) {
  const std::string text = read_text_file(path);
  return load_jump_config_from_json(json::parse(text), std::move(base));
}

std::vector<std::string> validate_jump_config(const JumpConfig& cfg) {
  std::vector<std::string> errors;

  check_positive(errors, "base_fuel_cost", cfg.base_fuel_cost);
  if (cfg.fuel_cost_per_ship < 0.0) errors.push_back("fuel_cost_per_ship must be >= 0");
  check_positive(errors, "base_travel_time_s", cfg.base_travel_time_s);
  if (cfg.min_fuel_to_jump < 0.0) errors.push_back("min_fuel_to_jump must be >= 0");
  if (cfg.preparation_min_s < 0.0) errors.push_back("preparation_min_s must be >= 0");
  if (!(cfg.travel_time_jitter >= 0.0 && cfg.travel_time_jitter < 1.0)) {
    errors.push_back("travel_time_jitter must be within [0, 1)");
  }
  if (cfg.max_history_entries < 1) errors.push_back("max_history_entries must be >= 1");

  check_positive(errors, "detection_range_au", cfg.detection_range_au);
  check_probability(errors, "detection_base_chance", cfg.detection_base_chance);
  check_probability(errors, "detection_falloff_floor", cfg.detection_falloff_floor);
  check_probability(errors, "detection_min_chance", cfg.detection_min_chance);
  check_probability(errors, "detection_max_chance", cfg.detection_max_chance);
  if (cfg.detection_min_chance > cfg.detection_max_chance) {
    errors.push_back("detection_min_chance must not exceed detection_max_chance");
  }
  check_probability(errors, "hidden_detection_factor", cfg.hidden_detection_factor);

  check_positive(errors, "explore_base_time_s", cfg.explore_base_time_s);
  check_positive(errors, "survey_base_time_s", cfg.survey_base_time_s);
  check_positive(errors, "deep_scan_time_multiplier", cfg.deep_scan_time_multiplier);
  check_positive(errors, "min_mission_duration_s", cfg.min_mission_duration_s);
  check_probability(errors, "mission_detection_progress", cfg.mission_detection_progress);
  check_probability(errors, "mission_detection_chance", cfg.mission_detection_chance);
  check_probability(errors, "mission_anomaly_progress", cfg.mission_anomaly_progress);
  check_probability(errors, "mission_anomaly_chance", cfg.mission_anomaly_chance);

  check_probability(errors, "hidden_first_chance", cfg.hidden_first_chance);
  check_probability(errors, "hidden_extra_chance", cfg.hidden_extra_chance);
  if (cfg.hidden_extra_rolls < 0) errors.push_back("hidden_extra_rolls must be >= 0");
  if (cfg.hidden_min_distance_au > cfg.hidden_max_distance_au) {
    errors.push_back("hidden_min_distance_au must not exceed hidden_max_distance_au");
  }
  if (cfg.generated_min_distance_au > cfg.generated_max_distance_au) {
    errors.push_back("generated_min_distance_au must not exceed generated_max_distance_au");
  }
  check_probability(errors, "unstable_link_chance", cfg.unstable_link_chance);
  check_probability(errors, "dormant_link_chance", cfg.dormant_link_chance);

  if (cfg.known_network_max_hops < 0) errors.push_back("known_network_max_hops must be >= 0");
  return errors;
}

} // namespace starlane
