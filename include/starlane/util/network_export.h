#pragma once

#include <string>
#include <vector>

#include "starlane/core/entities.h"
#include "starlane/core/jump_manager.h"
#include "starlane/util/json.h"

namespace starlane {

// Format a faction's known network as JSON.
//
// The output is an object with:
//   faction_id
//   systems: [ { id, name, explored, reachable: { "<id>": hops } } ]
//   connections: [ { from, to, jump_point_id, jump_point, status, survey_level, weight } ]
//   known_jump_points: [ ids ]
//   statistics: { exploration_missions, jumps_initiated, jump_points_discovered }
//
// System names are resolved best-effort from `systems`. Output ends with a
// trailing newline.
std::string known_network_to_json(const KnownNetwork& net, const SystemMap& systems);

// JSON array of history entries, oldest first.
std::string jump_history_to_json(const std::vector<JumpHistoryEntry>& history);

// One tick's outcome as a JSON value (not a string) so a caller can collect
// many ticks into one document.
json::Value turn_update_to_json(const TurnUpdateResult& result, double current_time);

// The global graph: { nodes: [ids], edges: [ { from, to, weight } ] }.
std::string network_graph_to_json(const JumpNetwork& network);

} // namespace starlane
