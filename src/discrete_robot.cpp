#include <swimbot/discrete_robot.hpp>
#include <utility>

namespace swimbot {

DiscreteRobot::DiscreteRobot(ModelParams params,
                             Vec2 position,
                             double theta,
                             JointAngles joints,
                             IntegratorConfig cfg)
  : params_(std::move(params)), cfg_(cfg) {
  params_.kind = ModelKind::Wheeled;
  state_.position = position;
  state_.theta = wrap_angle(theta);
  state_.joints = joints;
  state_.timestep_count = params_.timestep_count;
}

MoveResult DiscreteRobot::move(const JointVelocities& action, int timestep_count) {
  const double t = nominal_duration(params_, timestep_count);
  const auto end = integrate(params_, configuration_of(state_), action, t, cfg_);
  if (!end) return MoveResult{MoveStatus::NonFiniteResult, state_.joints};

  StepUpdate u;
  u.position = Vec2{end->x, end->y};
  u.theta = wrap_angle(snap_to_grid_(end->theta));
  u.joints = JointAngles{snap_to_grid_(end->a1), snap_to_grid_(end->a2)};
  u.velocities = action;
  u.duration = t;
  u.first_duration = t;

  apply_step(state_, u);
  state_.timestep_count = timestep_count;
  return MoveResult{MoveStatus::Ok, state_.joints};
}

} // namespace swimbot
