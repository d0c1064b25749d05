#include "starlane/util/network_export.h"

#include <string>

#include "starlane/core/enum_strings.h"

namespace starlane {
namespace {

json::Value id_value(Id id) { return static_cast<double>(id); }

std::string system_name(const SystemMap& systems, SystemId id) {
  if (!id.valid()) return {};
  const auto it = systems.find(id);
  return (it != systems.end()) ? it->second.name : std::string{};
}

json::Value history_entry_json(const JumpHistoryEntry& e) {
  json::Object o;
  o["origin_system_id"] = id_value(e.origin_system_id.value);
  o["target_system_id"] = id_value(e.target_system_id.value);
  o["jump_point_id"] = id_value(e.jump_point_id.value);
  o["start_time"] = e.start_time;
  o["travel_time"] = e.travel_time;
  o["fuel_consumed"] = e.fuel_consumed;
  o["arrival_time"] = e.arrival_time;
  o["status"] = jump_status_to_string(e.status);
  return o;
}

json::Value detection_json(const Detection& d) {
  json::Object o;
  o["jump_point_id"] = id_value(d.jump_point.value);
  o["system_id"] = id_value(d.system.value);
  o["faction_id"] = id_value(d.faction.value);
  o["survey_level"] = static_cast<double>(d.survey_level);
  o["was_hidden"] = d.was_hidden;
  return o;
}

} // namespace

std::string known_network_to_json(const KnownNetwork& net, const SystemMap& systems) {
  json::Object root;
  root["faction_id"] = id_value(net.faction.value);

  json::Array sys_arr;
  for (SystemId sid : net.known_systems) {
    json::Object so;
    so["id"] = id_value(sid.value);
    so["name"] = system_name(systems, sid);
    const auto it = systems.find(sid);
    so["explored"] = (it != systems.end()) && it->second.explored;

    json::Object reach;
    if (auto rit = net.reachable.find(sid); rit != net.reachable.end()) {
      for (const auto& [to, hops] : rit->second) reach[std::to_string(to.value)] = static_cast<double>(hops);
    }
    so["reachable"] = std::move(reach);
    sys_arr.push_back(std::move(so));
  }
  root["systems"] = std::move(sys_arr);

  json::Array conns;
  for (const KnownConnection& c : net.connections) {
    json::Object co;
    co["from"] = id_value(c.from.value);
    co["to"] = c.to.valid() ? id_value(c.to.value) : json::Value(nullptr);
    co["jump_point_id"] = id_value(c.jump_point_id.value);
    co["jump_point"] = c.jump_point_name;
    co["status"] = jump_point_status_to_string(c.status);
    co["survey_level"] = static_cast<double>(c.survey_level);
    co["weight"] = c.weight;
    conns.push_back(std::move(co));
  }
  root["connections"] = std::move(conns);

  json::Array jps;
  for (JumpPointId jid : net.known_jump_points) jps.push_back(id_value(jid.value));
  root["known_jump_points"] = std::move(jps);

  json::Object stats;
  stats["exploration_missions"] = static_cast<double>(net.exploration_missions);
  stats["jumps_initiated"] = static_cast<double>(net.jumps_initiated);
  stats["jump_points_discovered"] = static_cast<double>(net.jump_points_discovered);
  root["statistics"] = std::move(stats);

  return json::stringify(root, 2) + "\n";
}

std::string jump_history_to_json(const std::vector<JumpHistoryEntry>& history) {
  json::Array arr;
  arr.reserve(history.size());
  for (const auto& e : history) arr.push_back(history_entry_json(e));
  return json::stringify(arr, 2) + "\n";
}

json::Value turn_update_to_json(const TurnUpdateResult& result, double current_time) {
  json::Object root;
  root["time"] = current_time;

  json::Array missions;
  for (const MissionReport& r : result.exploration_results) {
    json::Object mo;
    mo["fleet_id"] = id_value(r.fleet_id.value);
    mo["system_id"] = id_value(r.system_id.value);
    mo["kind"] = mission_kind_to_string(r.kind);
    mo["progress"] = r.progress;
    mo["completed"] = r.completed;
    json::Array res;
    for (ExplorationResult x : r.results) res.push_back(exploration_result_to_string(x));
    mo["results"] = std::move(res);
    missions.push_back(std::move(mo));
  }
  root["exploration"] = std::move(missions);

  json::Array travel;
  for (const TravelEvent& ev : result.travel_results) {
    json::Object to;
    to["fleet_id"] = id_value(ev.fleet_id.value);
    to["kind"] = travel_event_kind_to_string(ev.kind);
    to["origin_system_id"] = id_value(ev.origin_system_id.value);
    to["target_system_id"] = id_value(ev.target_system_id.value);
    to["jump_point_id"] = id_value(ev.jump_point_id.value);
    to["message"] = ev.message;
    travel.push_back(std::move(to));
  }
  root["travel"] = std::move(travel);

  json::Array disc;
  for (const Detection& d : result.discoveries) disc.push_back(detection_json(d));
  root["discoveries"] = std::move(disc);

  return root;
}

std::string network_graph_to_json(const JumpNetwork& network) {
  json::Object root;

  json::Array nodes;
  for (SystemId sid : network.nodes()) nodes.push_back(id_value(sid.value));
  root["nodes"] = std::move(nodes);

  json::Array edges;
  for (const auto& [from, out] : network.adjacency()) {
    for (const auto& [to, w] : out) {
      json::Object e;
      e["from"] = id_value(from.value);
      e["to"] = id_value(to.value);
      e["weight"] = w;
      edges.push_back(std::move(e));
    }
  }
  root["edges"] = std::move(edges);

  return json::stringify(root, 2) + "\n";
}

} // namespace starlane
