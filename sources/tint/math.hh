#pragma once

#include <SDL2/SDL_stdinc.h>

namespace tint {

constexpr double PI_D = 3.14159265358979323846;

constexpr double to_rad(double deg) noexcept { return (PI_D * deg) / 180.0; }
constexpr double to_deg(double rad) noexcept { return (180.0 * rad) / PI_D; }

template <typename T> constexpr T clamp(T val, T min, T max) { return (val < min) ? min : (val > max) ? max : val; }

// half-up rounding, the way palettes were always tuned (2.5 -> 3, -2.5 -> -2)
inline double round_half_up(double val) { return SDL_floor(val + 0.5); }
inline int    round_to_int(double val) { return static_cast<int>(round_half_up(val)); }

// wraps any angle into [0, 360)
inline double normalize_hue(double h)
{
  double result = SDL_fmod(h, 360.0);
  if (result < 0.0)
    result += 360.0;
  if (result >= 360.0)
    result -= 360.0;
  return result;
}

inline double square(double val) { return val * val; }

struct Vec3d
{
  Vec3d() = default;
  constexpr Vec3d(double x, double y, double z)
      : x(x)
      , y(y)
      , z(z)
  {
  }

  [[nodiscard]] Vec3d  scale(double s) const { return Vec3d(x * s, y * s, z * s); }
  [[nodiscard]] double len() const { return SDL_sqrt(x * x + y * y + z * z); }

  double x = 0.0;
  double y = 0.0;
  double z = 0.0;
};

//
// Row-major 3x3 matrix. Only used for the fixed linear transforms between color spaces,
// so there is no need for inversion or any other general purpose functionality.
//
struct Mat3x3
{
  [[nodiscard]] constexpr Vec3d operator*(const Vec3d& v) const
  {
    return Vec3d(rows[0].x * v.x + rows[0].y * v.y + rows[0].z * v.z,
                 rows[1].x * v.x + rows[1].y * v.y + rows[1].z * v.z,
                 rows[2].x * v.x + rows[2].y * v.y + rows[2].z * v.z);
  }

  Vec3d rows[3];
};

} // namespace tint
