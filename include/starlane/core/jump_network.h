#pragma once

#include <map>
#include <set>
#include <unordered_set>
#include <vector>

#include "starlane/core/entities.h"
#include "starlane/core/jump_config.h"
#include "starlane/util/rng.h"

namespace starlane {

// Summary of one generate_enhanced_jump_network() run.
struct NetworkGenerationStats {
  int systems{0};
  int backbone_links{0};   // bidirectional pairs
  int secondary_links{0};  // bidirectional pairs
  int unstable_points{0};  // one-way
  int dormant_points{0};   // one-way
};

// Edge weight of a jump point: fuel_modifier * time_modifier * (2 - stability).
double jump_edge_weight(const JumpPoint& jp);

// Directed weighted graph of systems linked by jump points.
//
// Derived data: rebuilt wholesale from the systems, never patched.
class JumpNetwork {
 public:
  using Adjacency = std::map<SystemId, std::map<SystemId, double>>;

  // Every point with a destination that exists in `systems`.
  void build_network_graph(const SystemMap& systems);

  // Same rule restricted to points in `known` that `faction` may use, between
  // systems in `known_systems`. Known systems become nodes even without edges.
  void build_faction_graph(const SystemMap& systems, const std::unordered_set<JumpPointId>& known,
                           const std::set<SystemId>& known_systems, FactionId faction);

  void clear();

  // Dijkstra. Empty if unreachable or either end is not a node; [origin]
  // when origin == target.
  std::vector<SystemId> find_shortest_path(SystemId origin, SystemId target) const;

  // Hop-count BFS. Empty if origin is not a node.
  std::map<SystemId, int> get_reachable_systems(SystemId origin, int max_jumps) const;

  // Clears every jump point in `systems` and lays down a new network:
  // a greedy backbone (connected by construction), random secondary pairs up
  // to n(n-1)/2 * connectivity_level, then one-way unstable/dormant points.
  NetworkGenerationStats generate_enhanced_jump_network(SystemMap& systems, double connectivity_level,
                                                        util::Rng& rng, IdAllocator& ids,
                                                        const JumpConfig& cfg = JumpConfig{});

  std::size_t node_count() const { return nodes_.size(); }
  std::size_t edge_count() const;
  bool has_system(SystemId id) const { return nodes_.count(id) != 0; }

  // Sum of edge weights along `path`; negative if a hop is missing.
  double path_cost(const std::vector<SystemId>& path) const;

  const Adjacency& adjacency() const { return adj_; }
  const std::set<SystemId>& nodes() const { return nodes_; }

 private:
  void add_edge(SystemId from, SystemId to, double weight);

  std::set<SystemId> nodes_;
  Adjacency adj_;
};

} // namespace starlane
