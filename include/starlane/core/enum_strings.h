#pragma once

#include <string>

#include "starlane/core/entities.h"

namespace starlane {

// Shared string <-> enum conversion helpers.
//
// Used by the JSON exports and the CLI. Unknown strings map to a safe default.

std::string jump_point_kind_to_string(JumpPointKind k);
JumpPointKind jump_point_kind_from_string(const std::string& s);

std::string jump_point_status_to_string(JumpPointStatus s);
JumpPointStatus jump_point_status_from_string(const std::string& s);

std::string fleet_status_to_string(FleetStatus s);
FleetStatus fleet_status_from_string(const std::string& s);

} // namespace starlane
