#pragma once

#include <algorithm>
#include <vector>

namespace starlane::util {

// Jump subsystem state lives in std::unordered_map keyed by typed ids.
// Anything that consumes randomness or produces user-visible ordering walks
// the keys through this helper so a seeded run is reproducible.
template <typename Map>
inline std::vector<typename Map::key_type> sorted_keys(const Map& m) {
  std::vector<typename Map::key_type> keys;
  keys.reserve(m.size());
  for (const auto& kv : m) keys.push_back(kv.first);
  std::sort(keys.begin(), keys.end());
  return keys;
}

}  // namespace starlane::util
