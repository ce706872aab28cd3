#include <swimbot/rollout.hpp>

namespace swimbot {

Sample sample_of(const RobotState& s) {
  return Sample{s.elapsed_time, s.body_x, s.position.x, s.position.y,
                s.theta, s.joints.a1, s.joints.a2};
}

std::vector<JointVelocities> alternating_gait(double amplitude, std::size_t steps) {
  std::vector<JointVelocities> out;
  out.reserve(steps);
  for (std::size_t i = 0; i < steps; ++i) {
    out.push_back(JointVelocities{0.0, (i % 2 == 0) ? amplitude : -amplitude});
  }
  return out;
}

template <class Robot, class Move>
static std::optional<Trajectory> record_(Robot& robot,
                                         const std::vector<JointVelocities>& actions,
                                         Move&& move) {
  Trajectory traj;
  traj.reserve(actions.size() + 1);
  traj.push_back(sample_of(robot.state()));
  for (const auto& a : actions) {
    if (!move(a).ok()) return std::nullopt;
    traj.push_back(sample_of(robot.state()));
  }
  return traj;
}

std::optional<Trajectory> rollout(SwimmingRobot& robot,
                                  const std::vector<JointVelocities>& actions) {
  return rollout(robot, actions, robot.params().timestep_count, true);
}

std::optional<Trajectory> rollout(SwimmingRobot& robot,
                                  const std::vector<JointVelocities>& actions,
                                  int timestep_count,
                                  bool enforce_angle_limits) {
  return record_(robot, actions, [&](const JointVelocities& a) {
    return robot.move(a, timestep_count, enforce_angle_limits);
  });
}

std::optional<Trajectory> rollout(DiscreteRobot& robot,
                                  const std::vector<JointVelocities>& actions) {
  return rollout(robot, actions, robot.params().timestep_count);
}

std::optional<Trajectory> rollout(DiscreteRobot& robot,
                                  const std::vector<JointVelocities>& actions,
                                  int timestep_count) {
  return record_(robot, actions, [&](const JointVelocities& a) {
    return robot.move(a, timestep_count);
  });
}

} // namespace swimbot
