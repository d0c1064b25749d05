#include "starlane/core/jump_network.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <deque>
#include <functional>
#include <limits>
#include <queue>
#include <utility>

#include "starlane/util/log.h"
#include "starlane/util/sorted_keys.h"

namespace starlane {
namespace {

constexpr double kTwoPi = 6.28318530717958647692;

// Similarity between two systems used to decide who links to whom. Not a
// spatial distance.
double synthetic_distance(const StarSystem& a, const StarSystem& b, util::Rng& rng) {
  double d = std::fabs(a.star_mass - b.star_mass);
  d += 0.5 * std::fabs(static_cast<double>(a.planet_count - b.planet_count));
  d += rng.uniform(0.5, 2.0);
  return d;
}

std::string jump_point_name_for(const StarSystem& target) {
  std::string tag = target.name.substr(0, std::min<std::size_t>(3, target.name.size()));
  for (char& c : tag) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return "JP-" + tag;
}

JumpPoint make_jump_point(const StarSystem& target, JumpPointKind kind, JumpPointStatus status,
                          std::optional<double> stability, util::Rng& rng, IdAllocator& ids,
                          const JumpConfig& cfg) {
  const double r = rng.uniform(cfg.generated_min_distance_au, cfg.generated_max_distance_au) * kKmPerAu;
  const double bearing = rng.uniform(0.0, kTwoPi);

  JumpPoint jp;
  jp.id = JumpPointId{ids.allocate()};
  jp.name = jump_point_name_for(target);
  jp.position_km = Vec3{r * std::cos(bearing), r * std::sin(bearing), rng.uniform(-0.05 * r, 0.05 * r)};
  jp.assign_destination(target.id);
  jp.kind = kind;
  jp.status = status;
  if (stability) {
    jp.stability = *stability;
  } else {
    jp.stability = (kind == JumpPointKind::Natural) ? rng.uniform(0.8, 1.0) : rng.uniform(0.5, 0.9);
  }
  jp.size_class = rng.range_int(1, 4);
  jp.exploration_difficulty = rng.uniform(0.8, 1.5);
  jp.fuel_cost_modifier = rng.uniform(0.9, 1.1);
  jp.travel_time_modifier = rng.uniform(0.9, 1.1);
  return jp;
}

bool linked(const StarSystem& from, SystemId to) {
  for (const auto& jp : from.jump_points) {
    if (jp.connects_to == to) return true;
  }
  return false;
}

} // namespace

double jump_edge_weight(const JumpPoint& jp) {
  return jp.fuel_cost_modifier * jp.travel_time_modifier * (2.0 - jp.stability);
}

void JumpNetwork::clear() {
  nodes_.clear();
  adj_.clear();
}

void JumpNetwork::add_edge(SystemId from, SystemId to, double weight) {
  nodes_.insert(from);
  nodes_.insert(to);
  auto& out = adj_[from];
  auto it = out.find(to);
  // Parallel points to the same target: keep the cheapest.
  if (it == out.end() || weight < it->second) out[to] = weight;
}

void JumpNetwork::build_network_graph(const SystemMap& systems) {
  clear();
  for (SystemId sid : util::sorted_keys(systems)) {
    nodes_.insert(sid);
    for (const auto& jp : systems.at(sid).jump_points) {
      if (!jp.connects_to.valid() || !systems.count(jp.connects_to)) continue;
      add_edge(sid, jp.connects_to, jump_edge_weight(jp));
    }
  }
}

void JumpNetwork::build_faction_graph(const SystemMap& systems, const std::unordered_set<JumpPointId>& known,
                                      const std::set<SystemId>& known_systems, FactionId faction) {
  clear();
  for (SystemId sid : known_systems) {
    if (systems.count(sid)) nodes_.insert(sid);
  }
  for (SystemId sid : util::sorted_keys(systems)) {
    for (const auto& jp : systems.at(sid).jump_points) {
      if (!known.count(jp.id)) continue;
      if (!jp.is_accessible_by(faction)) continue;
      if (!known_systems.count(sid) || !known_systems.count(jp.connects_to)) continue;
      if (!systems.count(jp.connects_to)) continue;
      add_edge(sid, jp.connects_to, jump_edge_weight(jp));
    }
  }
}

std::vector<SystemId> JumpNetwork::find_shortest_path(SystemId origin, SystemId target) const {
  if (!has_system(origin) || !has_system(target)) return {};
  if (origin == target) return {origin};

  std::map<SystemId, double> dist;
  std::map<SystemId, SystemId> prev;
  dist[origin] = 0.0;

  using Item = std::pair<double, SystemId>;
  std::priority_queue<Item, std::vector<Item>, std::greater<Item>> pq;
  pq.push({0.0, origin});

  while (!pq.empty()) {
    const auto [d, u] = pq.top();
    pq.pop();
    if (d > dist[u] + 1e-12) continue;
    if (u == target) break;

    auto it = adj_.find(u);
    if (it == adj_.end()) continue;
    for (const auto& [v, w] : it->second) {
      const double nd = d + w;
      auto dv = dist.find(v);
      if (dv == dist.end() || nd + 1e-12 < dv->second) {
        dist[v] = nd;
        prev[v] = u;
        pq.push({nd, v});
      }
    }
  }

  if (!prev.count(target)) return {};

  std::vector<SystemId> path;
  for (SystemId cur = target; cur != origin; cur = prev.at(cur)) path.push_back(cur);
  path.push_back(origin);
  std::reverse(path.begin(), path.end());
  return path;
}

std::map<SystemId, int> JumpNetwork::get_reachable_systems(SystemId origin, int max_jumps) const {
  std::map<SystemId, int> reachable;
  if (!has_system(origin)) return reachable;

  reachable[origin] = 0;
  std::deque<SystemId> frontier{origin};
  while (!frontier.empty()) {
    const SystemId cur = frontier.front();
    frontier.pop_front();
    const int hops = reachable.at(cur);
    if (hops >= max_jumps) continue;

    auto it = adj_.find(cur);
    if (it == adj_.end()) continue;
    for (const auto& [next, w] : it->second) {
      (void)w;
      if (reachable.count(next)) continue;
      reachable[next] = hops + 1;
      frontier.push_back(next);
    }
  }
  return reachable;
}

std::size_t JumpNetwork::edge_count() const {
  std::size_t n = 0;
  for (const auto& [from, out] : adj_) n += out.size();
  return n;
}

double JumpNetwork::path_cost(const std::vector<SystemId>& path) const {
  double total = 0.0;
  for (std::size_t i = 1; i < path.size(); ++i) {
    auto it = adj_.find(path[i - 1]);
    if (it == adj_.end()) return -1.0;
    auto jt = it->second.find(path[i]);
    if (jt == it->second.end()) return -1.0;
    total += jt->second;
  }
  return total;
}

NetworkGenerationStats JumpNetwork::generate_enhanced_jump_network(SystemMap& systems, double connectivity_level,
                                                                   util::Rng& rng, IdAllocator& ids,
                                                                   const JumpConfig& cfg) {
  NetworkGenerationStats stats;
  const std::vector<SystemId> order = util::sorted_keys(systems);
  const int n = static_cast<int>(order.size());
  stats.systems = n;

  for (auto& [sid, sys] : systems) {
    (void)sid;
    sys.jump_points.clear();
  }
  log::info("Generating jump network for " + std::to_string(n) + " systems");
  if (n < 2) {
    build_network_graph(systems);
    return stats;
  }

  auto sys_at = [&](int i) -> StarSystem& { return systems.at(order[static_cast<std::size_t>(i)]); };

  auto create_pair = [&](int a, int b) {
    StarSystem& sa = sys_at(a);
    StarSystem& sb = sys_at(b);
    sa.jump_points.push_back(
        make_jump_point(sb, JumpPointKind::Natural, JumpPointStatus::Unknown, std::nullopt, rng, ids, cfg));
    sb.jump_points.push_back(
        make_jump_point(sa, JumpPointKind::Natural, JumpPointStatus::Unknown, std::nullopt, rng, ids, cfg));
  };

  // Synthetic distances, one jitter draw per unordered pair.
  std::vector<std::vector<double>> dist(static_cast<std::size_t>(n), std::vector<double>(static_cast<std::size_t>(n), 0.0));
  for (int i = 0; i < n; ++i) {
    for (int j = i + 1; j < n; ++j) {
      const double d = synthetic_distance(sys_at(i), sys_at(j), rng);
      dist[static_cast<std::size_t>(i)][static_cast<std::size_t>(j)] = d;
      dist[static_cast<std::size_t>(j)][static_cast<std::size_t>(i)] = d;
    }
  }
  auto D = [&](int i, int j) { return dist[static_cast<std::size_t>(i)][static_cast<std::size_t>(j)]; };

  // Backbone: repeatedly attach the unconnected system nearest to the
  // connected set. Ties go to the lowest index.
  std::vector<bool> in_tree(static_cast<std::size_t>(n), false);
  std::vector<double> best(static_cast<std::size_t>(n), std::numeric_limits<double>::infinity());
  std::vector<int> best_from(static_cast<std::size_t>(n), -1);
  in_tree[0] = true;
  for (int j = 1; j < n; ++j) {
    best[static_cast<std::size_t>(j)] = D(0, j);
    best_from[static_cast<std::size_t>(j)] = 0;
  }
  for (int added = 1; added < n; ++added) {
    int pick = -1;
    for (int j = 0; j < n; ++j) {
      if (in_tree[static_cast<std::size_t>(j)]) continue;
      if (pick < 0 || best[static_cast<std::size_t>(j)] < best[static_cast<std::size_t>(pick)]) pick = j;
    }
    create_pair(best_from[static_cast<std::size_t>(pick)], pick);
    ++stats.backbone_links;
    in_tree[static_cast<std::size_t>(pick)] = true;
    for (int j = 0; j < n; ++j) {
      if (in_tree[static_cast<std::size_t>(j)]) continue;
      if (D(pick, j) < best[static_cast<std::size_t>(j)]) {
        best[static_cast<std::size_t>(j)] = D(pick, j);
        best_from[static_cast<std::size_t>(j)] = pick;
      }
    }
  }

  // Secondary pairs: one attempt per missing link, accepted more often
  // between similar systems.
  const long long possible = static_cast<long long>(n) * (n - 1) / 2;
  const long long target =
      static_cast<long long>(std::floor(static_cast<double>(possible) * std::max(0.0, connectivity_level)));
  const long long attempts = std::max(0LL, target - stats.backbone_links);
  for (long long k = 0; k < attempts; ++k) {
    const int a = static_cast<int>(rng.index(static_cast<std::size_t>(n)));
    int b = static_cast<int>(rng.index(static_cast<std::size_t>(n - 1)));
    if (b >= a) ++b;
    if (linked(sys_at(a), order[static_cast<std::size_t>(b)])) continue;

    const double p = std::max(0.1, 1.0 - D(a, b) / 10.0);
    if (!rng.chance(p)) continue;
    create_pair(a, b);
    ++stats.secondary_links;
  }

  // Special one-way points.
  for (int i = 0; i < n; ++i) {
    if (rng.chance(cfg.unstable_link_chance)) {
      int t = static_cast<int>(rng.index(static_cast<std::size_t>(n - 1)));
      if (t >= i) ++t;
      const double stability = rng.uniform(0.3, 0.7);
      sys_at(i).jump_points.push_back(make_jump_point(sys_at(t), JumpPointKind::Unstable, JumpPointStatus::Unknown,
                                                      stability, rng, ids, cfg));
      ++stats.unstable_points;
    }
    if (rng.chance(cfg.dormant_link_chance)) {
      int t = static_cast<int>(rng.index(static_cast<std::size_t>(n - 1)));
      if (t >= i) ++t;
      sys_at(i).jump_points.push_back(make_jump_point(sys_at(t), JumpPointKind::Dormant, JumpPointStatus::Inactive,
                                                      std::nullopt, rng, ids, cfg));
      ++stats.dormant_points;
    }
  }

  build_network_graph(systems);
  log::info("Jump network generated: " + std::to_string(stats.backbone_links) + " backbone, " +
            std::to_string(stats.secondary_links) + " secondary, " + std::to_string(stats.unstable_points) +
            " unstable, " + std::to_string(stats.dormant_points) + " dormant");
  return stats;
}

} // namespace starlane
