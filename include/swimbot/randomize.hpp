#pragma once
#include <random>
#include <swimbot/state.hpp>

namespace swimbot {

// Uniform draw of both joints over [lower, upper). With
// enforce_opposite_signs the joints come back strictly non-zero with
// opposite signs (needs lower < 0 < upper, otherwise ignored).
// Deterministic with caller-provided rng.
JointAngles random_joint_angles(const JointLimits& limits,
                                bool enforce_opposite_signs,
                                std::mt19937& rng);

} // namespace swimbot
