#include "starlane/core/entities.h"

#include <algorithm>
#include <cmath>

namespace starlane {

bool JumpPoint::is_accessible_by(FactionId faction) const {
  if (status == JumpPointStatus::Unknown || status == JumpPointStatus::Destroyed) return false;
  if (survey_level == 0 && discovered_by != faction) return false;

  auto it = access_flags.find(faction);
  if (it != access_flags.end()) return it->second;

  return discovered_by == faction || status == JumpPointStatus::Active;
}

double JumpPoint::fuel_cost(double total_mass_tons, int ship_count, const JumpConfig& cfg) const {
  const double ships = static_cast<double>(std::max(0, ship_count));
  const double mass_factor = std::sqrt(std::max(0.0, total_mass_tons) / 1000.0);
  const double size_efficiency = 0.8 * static_cast<double>(std::max(1, size_class));

  const double cost =
      (cfg.base_fuel_cost + cfg.fuel_cost_per_ship * ships) * mass_factor * fuel_cost_modifier / size_efficiency;
  return std::max(cfg.base_fuel_cost, cost);
}

double JumpPoint::travel_time(double total_mass_tons, int ship_count, const JumpConfig& cfg) const {
  const double instability = 2.0 - std::clamp(stability, 0.0, 1.0);
  const double coordination = 1.0 + 0.1 * static_cast<double>(std::max(0, ship_count - 1));
  const double heavy = 1.0 + std::max(0.0, total_mass_tons - 1000.0) / 10000.0;

  const double t = cfg.base_travel_time_s * instability * travel_time_modifier * coordination * heavy;
  return std::max(cfg.base_travel_time_s, t);
}

bool JumpPoint::travel_eligible() const {
  const bool usable = status == JumpPointStatus::Active || status == JumpPointStatus::Mapped;
  return usable && survey_level >= kMinTravelSurveyLevel;
}

bool JumpPoint::assign_destination(SystemId target) {
  if (connects_to.valid()) return connects_to == target;
  connects_to = target;
  return true;
}

FleetShape summarize_fleet(const Fleet& fleet, const ShipMap& ships, const JumpPoint* through) {
  FleetShape shape;
  for (ShipId sid : fleet.ships) {
    auto it = ships.find(sid);
    if (it == ships.end()) continue;
    const Ship& sh = it->second;

    ++shape.ship_count;
    shape.total_mass_tons += sh.current_mass_tons;
    if (shape.ship_count == 1) {
      shape.min_size_class = sh.size_class;
      shape.max_size_class = sh.size_class;
    } else {
      shape.min_size_class = std::min(shape.min_size_class, sh.size_class);
      shape.max_size_class = std::max(shape.max_size_class, sh.size_class);
    }

    if (!sh.has_jump_drive) continue;
    if (through && (sh.size_class < through->min_ship_size || sh.size_class > through->max_ship_size)) continue;
    ++shape.jump_capable;
  }
  return shape;
}

JumpPoint* find_jump_point(StarSystem& sys, JumpPointId id) {
  for (auto& jp : sys.jump_points) {
    if (jp.id == id) return &jp;
  }
  return nullptr;
}

const JumpPoint* find_jump_point(const StarSystem& sys, JumpPointId id) {
  for (const auto& jp : sys.jump_points) {
    if (jp.id == id) return &jp;
  }
  return nullptr;
}

} // namespace starlane
