#pragma once
#include <cmath>
#include <swimbot/integrator.hpp>
#include <swimbot/move_result.hpp>
#include <swimbot/state.hpp>

namespace swimbot {

// Discretized (theta, a1, a2) as seen by a controller.
struct Observation {
  double theta = 0.0;
  double a1 = 0.0;
  double a2 = 0.0;
};

// Default joints of the wheeled snake, rounded like every stored angle.
inline JointAngles default_wheeled_joints() {
  return JointAngles{round_decimals(0.5 * std::cos(1.0) - 0.6), round_decimals(1.1)};
}

// Wheeled three-link snake whose heading and joints live on a grid of
// ModelParams::angle_interval. Joint limits are not enforced.
class DiscreteRobot {
public:
  explicit DiscreteRobot(ModelParams params,
                         Vec2 position = {},
                         double theta = 0.0,
                         JointAngles joints = default_wheeled_joints(),
                         IntegratorConfig cfg = {});

  MoveResult move(const JointVelocities& action) { return move(action, params_.timestep_count); }

  // Zero duration still re-snaps the joints, so off-grid initial joints land
  // on the grid after the first move whatever its length.
  MoveResult move(const JointVelocities& action, int timestep_count);

  Observation observation() const {
    return Observation{state_.theta, state_.joints.a1, state_.joints.a2};
  }

  const RobotState& state() const { return state_; }
  const ModelParams& params() const { return params_; }
  Vec2 position() const { return state_.position; }
  double theta() const { return state_.theta; }
  JointAngles joints() const { return state_.joints; }
  JointVelocities velocities() const { return state_.velocities; }
  double elapsed_time() const { return state_.elapsed_time; }

private:
  double snap_to_grid_(double a) const {
    return round_decimals(discretize(a, params_.angle_interval));
  }

  ModelParams params_;
  IntegratorConfig cfg_;
  RobotState state_;
};

} // namespace swimbot
