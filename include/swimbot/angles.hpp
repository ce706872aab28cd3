#pragma once
#include <cmath>
#include <numbers>

namespace swimbot {

inline constexpr double kPI     = std::numbers::pi_v<double>;
inline constexpr double kTAU    = 2.0 * kPI;
inline constexpr double kHalfPI = 0.5 * kPI;

// Renormalize into (-pi, pi]. In-range values come back untouched.
inline double wrap_angle(double a) {
  if (a > -kPI && a <= kPI) return a;
  double w = std::fmod(a + kPI, kTAU);
  if (w <= 0.0) w += kTAU;
  return w - kPI;
}

// Pull a value sitting within `tolerance` of a bound exactly onto it.
inline double snap_to_limits(double a, double lo, double hi, double tolerance = 1e-9) {
  if (std::abs(a - hi) < tolerance) return hi;
  if (std::abs(a - lo) < tolerance) return lo;
  return a;
}

inline double clamp_to_limits(double a, double lo, double hi) {
  return a < lo ? lo : (a > hi ? hi : a);
}

// Nearest multiple of `interval`; a remainder of exactly one half goes up.
inline double discretize(double value, double interval) {
  if (!(interval > 0.0)) return value;
  const double quotient = value / interval;
  const double floor_q = std::floor(quotient);
  const double diff = quotient - floor_q;
  return (diff >= 0.5 ? floor_q + 1.0 : floor_q) * interval;
}

inline double round_decimals(double value, int places = 8) {
  const double scale = std::pow(10.0, places);
  return std::round(value * scale) / scale;
}

} // namespace swimbot
