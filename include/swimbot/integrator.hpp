#pragma once
#include <optional>
#include <swimbot/state.hpp>

namespace swimbot {

// Sampling and tolerance knobs of the ODE solve.
struct IntegratorConfig {
  int samples = 11;                  // equally spaced points on [0, duration]
  double abs_tolerance = 1.49012e-8;
  double rel_tolerance = 1.49012e-8;
  int max_steps = 500;               // stepper attempts allowed between two samples
};

// Every channel that is integrated in one solve.
struct Configuration {
  double body_x = 0.0;
  double x = 0.0;
  double y = 0.0;
  double theta = 0.0;
  double a1 = 0.0;
  double a2 = 0.0;
};

Configuration configuration_of(const RobotState& s);

bool is_finite(const Configuration& c);

// Integrates the velocity field at constant joint velocities over
// [0, duration] and returns the final sample. duration <= 0 returns `start`
// unchanged. nullopt when the field degenerates: non-finite values, a wheeled
// joint path that crosses D = 0, or more than max_steps stepper attempts
// between two samples.
std::optional<Configuration> integrate(const ModelParams& p,
                                       const Configuration& start,
                                       const JointVelocities& action,
                                       double duration,
                                       const IntegratorConfig& cfg = {});

} // namespace swimbot
