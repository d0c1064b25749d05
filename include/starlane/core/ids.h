#pragma once
#include <cstdint>
#include <functional>

namespace starlane {

using Id = std::uint64_t;

constexpr Id kInvalidId = 0;

// Typed wrapper so a FleetId can't be passed where a SystemId is expected.
template <typename Tag>
struct StrongId {
  Id value{kInvalidId};

  constexpr StrongId() = default;
  constexpr explicit StrongId(Id v) : value(v) {}

  constexpr bool valid() const { return value != kInvalidId; }

  friend constexpr bool operator==(StrongId a, StrongId b) { return a.value == b.value; }
  friend constexpr bool operator!=(StrongId a, StrongId b) { return a.value != b.value; }
  friend constexpr bool operator<(StrongId a, StrongId b) { return a.value < b.value; }
};

struct SystemTag {};
struct FleetTag {};
struct ShipTag {};
struct JumpPointTag {};
struct FactionTag {};

using SystemId = StrongId<SystemTag>;
using FleetId = StrongId<FleetTag>;
using ShipId = StrongId<ShipTag>;
using JumpPointId = StrongId<JumpPointTag>;
using FactionId = StrongId<FactionTag>;

// Monotonic id source. observe() lets callers that build entities by hand
// keep the allocator ahead of ids they already used.
struct IdAllocator {
  Id next{1};

  Id allocate() { return next++; }
  void observe(Id used) {
    if (used >= next) next = used + 1;
  }
};

} // namespace starlane

namespace std {
template <typename Tag>
struct hash<starlane::StrongId<Tag>> {
  std::size_t operator()(const starlane::StrongId<Tag>& id) const noexcept {
    return std::hash<starlane::Id>{}(id.value);
  }
};
} // namespace std
