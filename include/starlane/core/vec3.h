#pragma once
#include <cmath>

namespace starlane {

// 3D vector for in-system coordinates, in kilometres from the system centre.
struct Vec3 {
  double x{0.0};
  double y{0.0};
  double z{0.0};

  Vec3() = default;
  Vec3(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

  Vec3 operator+(const Vec3& rhs) const { return {x + rhs.x, y + rhs.y, z + rhs.z}; }
  Vec3 operator-(const Vec3& rhs) const { return {x - rhs.x, y - rhs.y, z - rhs.z}; }
  Vec3 operator*(double s) const { return {x * s, y * s, z * s}; }

  // Exact equality; meant for stored coordinates, not computed ones.
  bool operator==(const Vec3& rhs) const { return x == rhs.x && y == rhs.y && z == rhs.z; }
  bool operator!=(const Vec3& rhs) const { return !(*this == rhs); }

  Vec3& operator+=(const Vec3& rhs) {
    x += rhs.x;
    y += rhs.y;
    z += rhs.z;
    return *this;
  }

  double length() const { return std::sqrt(x * x + y * y + z * z); }
  double length_squared() const { return x * x + y * y + z * z; }
  double distance_to(const Vec3& other) const { return (*this - other).length(); }
};

} // namespace starlane
