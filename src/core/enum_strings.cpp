#include "starlane/core/enum_strings.h"

namespace starlane {

std::string jump_point_kind_to_string(JumpPointKind k) {
  switch (k) {
    case JumpPointKind::Natural: return "natural";
    case JumpPointKind::Artificial: return "artificial";
    case JumpPointKind::Unstable: return "unstable";
    case JumpPointKind::Dormant: return "dormant";
    case JumpPointKind::Restricted: return "restricted";
  }
  return "natural";
}

JumpPointKind jump_point_kind_from_string(const std::string& s) {
  if (s == "artificial") return JumpPointKind::Artificial;
  if (s == "unstable") return JumpPointKind::Unstable;
  if (s == "dormant") return JumpPointKind::Dormant;
  if (s == "restricted") return JumpPointKind::Restricted;
  return JumpPointKind::Natural;
}

std::string jump_point_status_to_string(JumpPointStatus s) {
  switch (s) {
    case JumpPointStatus::Unknown: return "unknown";
    case JumpPointStatus::Detected: return "detected";
    case JumpPointStatus::Surveyed: return "surveyed";
    case JumpPointStatus::Mapped: return "mapped";
    case JumpPointStatus::Active: return "active";
    case JumpPointStatus::Inactive: return "inactive";
    case JumpPointStatus::Destroyed: return "destroyed";
  }
  return "unknown";
}

JumpPointStatus jump_point_status_from_string(const std::string& s) {
  if (s == "detected") return JumpPointStatus::Detected;
  if (s == "surveyed") return JumpPointStatus::Surveyed;
  if (s == "mapped") return JumpPointStatus::Mapped;
  if (s == "active") return JumpPointStatus::Active;
  if (s == "inactive") return JumpPointStatus::Inactive;
  if (s == "destroyed") return JumpPointStatus::Destroyed;
  return JumpPointStatus::Unknown;
}

std::string fleet_status_to_string(FleetStatus s) {
  switch (s) {
    case FleetStatus::Idle: return "idle";
    case FleetStatus::Moving: return "moving";
    case FleetStatus::InTransit: return "in_transit";
    case FleetStatus::Orbiting: return "orbiting";
    case FleetStatus::Surveying: return "surveying";
    case FleetStatus::Exploring: return "exploring";
    case FleetStatus::FormingUp: return "forming_up";
  }
  return "idle";
}

FleetStatus fleet_status_from_string(const std::string& s) {
  if (s == "moving") return FleetStatus::Moving;
  if (s == "in_transit") return FleetStatus::InTransit;
  if (s == "orbiting") return FleetStatus::Orbiting;
  if (s == "surveying") return FleetStatus::Surveying;
  if (s == "exploring") return FleetStatus::Exploring;
  if (s == "forming_up") return FleetStatus::FormingUp;
  return FleetStatus::Idle;
}

} // namespace starlane
