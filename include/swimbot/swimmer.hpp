#pragma once
#include <random>
#include <swimbot/integrator.hpp>
#include <swimbot/move_result.hpp>
#include <swimbot/state.hpp>

namespace swimbot {

struct PlannedStep {
  MoveStatus status = MoveStatus::Ok;
  StepUpdate update{};
};

// Two crossing times closer than this integrate as one.
inline constexpr double kSplitTolerance = 1e-7;
// Joints this close to a bound are snapped onto it.
inline constexpr double kSnapTolerance = 1e-9;

// Time for `angle` moving at constant `velocity` to reach the bound on its
// side of motion, or `nominal` when it stays within limits for the whole
// step (zero velocity included).
double crossing_time(double angle, double velocity, const JointLimits& limits, double nominal);

// Pure core of SwimmingRobot::move: computes the update for one control step.
PlannedStep plan_step(const RobotState& s,
                      const ModelParams& p,
                      const JointVelocities& action,
                      int timestep_count,
                      bool enforce_angle_limits,
                      const IntegratorConfig& cfg = {});

class SwimmingRobot {
public:
  explicit SwimmingRobot(ModelParams params,
                         Vec2 position = {},
                         double theta = 0.0,
                         JointAngles joints = {-kPI / 4.0, kPI / 4.0},
                         IntegratorConfig cfg = {});

  // Advance one control step of params().timestep_count timesteps, limits on.
  MoveResult move(const JointVelocities& action);

  // Advance one control step of timestep_count * t_interval seconds.
  MoveResult move(const JointVelocities& action,
                  int timestep_count,
                  bool enforce_angle_limits = true);

  JointAngles randomize_joint_state(std::mt19937& rng, bool enforce_opposite_signs = false);

  void set_joints(const JointAngles& a) { state_.joints = a; }

  const RobotState& state() const { return state_; }
  const ModelParams& params() const { return params_; }
  Vec2 position() const { return state_.position; }
  double body_x() const { return state_.body_x; }
  double theta() const { return state_.theta; }
  JointAngles joints() const { return state_.joints; }
  JointVelocities velocities() const { return state_.velocities; }
  double elapsed_time() const { return state_.elapsed_time; }

private:
  ModelParams params_;
  IntegratorConfig cfg_;
  RobotState state_;
};

} // namespace swimbot
