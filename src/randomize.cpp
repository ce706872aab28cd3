#include <swimbot/randomize.hpp>
#include <random>

namespace swimbot {

static double draw_nonzero(std::uniform_real_distribution<double>& U, std::mt19937& rng) {
  double v = U(rng);
  while (v == 0.0) v = U(rng);
  return v;
}

JointAngles random_joint_angles(const JointLimits& limits,
                                bool enforce_opposite_signs,
                                std::mt19937& rng) {
  std::uniform_real_distribution<double> U(limits.lower, limits.upper);
  const bool straddles_zero = limits.lower < 0.0 && limits.upper > 0.0;
  if (!enforce_opposite_signs || !straddles_zero) {
    const double a1 = U(rng);
    const double a2 = U(rng);
    return JointAngles{a1, a2};
  }

  const double a1 = draw_nonzero(U, rng);
  std::uniform_real_distribution<double> other = (a1 > 0.0)
    ? std::uniform_real_distribution<double>(limits.lower, 0.0)
    : std::uniform_real_distribution<double>(0.0, limits.upper);
  const double a2 = draw_nonzero(other, rng);
  return JointAngles{a1, a2};
}

} // namespace swimbot
