#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace starlane::util {

// splitmix64 mixer (Sebastiano Vigna). Not cryptographically secure.
inline std::uint64_t splitmix64(std::uint64_t x) {
  x += 0x9e3779b97f4a7c15ULL;
  x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
  x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
  return x ^ (x >> 31);
}

// Top 53 bits of a 64-bit word as a double in [0,1).
inline double u01_from_u64(std::uint64_t x) {
  const std::uint64_t v = x >> 11;
  return static_cast<double>(v) * (1.0 / 9007199254740992.0); // 2^53
}

// The single pseudo-random source of the jump subsystem.
//
// Every function that rolls dice (detection, hidden point pools, travel time
// jitter, network generation) takes an Rng& explicitly. Given a fixed seed and
// a fixed call order the whole tick is reproducible.
class Rng {
 public:
  // Unseeded: derives a seed from the steady clock.
  Rng() : state_(splitmix64(static_cast<std::uint64_t>(
              std::chrono::steady_clock::now().time_since_epoch().count()))) {}
  explicit Rng(std::uint64_t seed) : state_(seed) {}

  void seed(std::uint64_t s) { state_ = s; }
  std::uint64_t state() const { return state_; }

  std::uint64_t next_u64() {
    state_ = splitmix64(state_);
    return state_;
  }

  double next_u01() { return u01_from_u64(next_u64()); }

  // Uniform real in [lo, hi).
  double uniform(double lo, double hi) {
    if (hi < lo) std::swap(lo, hi);
    return lo + (hi - lo) * next_u01();
  }

  // Inclusive integer range, unbiased (rejection sampling).
  int range_int(int lo_incl, int hi_incl) {
    if (hi_incl < lo_incl) std::swap(lo_incl, hi_incl);
    const std::uint64_t span = static_cast<std::uint64_t>(hi_incl - lo_incl) + 1ULL;
    return lo_incl + static_cast<int>(bounded(span));
  }

  // Index in [0, n).
  std::size_t index(std::size_t n) {
    if (n <= 1) return 0;
    return static_cast<std::size_t>(bounded(static_cast<std::uint64_t>(n)));
  }

  // True with probability p. p <= 0 never draws true, p >= 1 always does;
  // both still consume one step so call order stays stable.
  bool chance(double p) { return next_u01() < p; }

 private:
  std::uint64_t bounded(std::uint64_t bound_exclusive) {
    if (bound_exclusive <= 1) return 0;
    const std::uint64_t threshold = (std::uint64_t(0) - bound_exclusive) % bound_exclusive;
    for (;;) {
      const std::uint64_t r = next_u64();
      if (r >= threshold) return r % bound_exclusive;
    }
  }

  std::uint64_t state_{0};
};

} // namespace starlane::util
