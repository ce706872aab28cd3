#pragma once
#include <cstddef>
#include <optional>
#include <vector>
#include <swimbot/discrete_robot.hpp>
#include <swimbot/swimmer.hpp>

namespace swimbot {

// One recorded point of an episode.
struct Sample {
  double time = 0.0;     // elapsed sim time (s)
  double body_x = 0.0;
  double x = 0.0;
  double y = 0.0;
  double theta = 0.0;
  double a1 = 0.0;
  double a2 = 0.0;
};

using Trajectory = std::vector<Sample>;

Sample sample_of(const RobotState& s);

// (0, +amplitude), (0, -amplitude), ... : the distal joint flaps back and forth.
std::vector<JointVelocities> alternating_gait(double amplitude, std::size_t steps);

// Apply actions in order, recording the initial state and the state after
// every move. nullopt on the first failed move; moves before it stay applied.
// The two-argument forms step by the robot's params().timestep_count.
std::optional<Trajectory> rollout(SwimmingRobot& robot,
                                  const std::vector<JointVelocities>& actions);

std::optional<Trajectory> rollout(SwimmingRobot& robot,
                                  const std::vector<JointVelocities>& actions,
                                  int timestep_count,
                                  bool enforce_angle_limits = true);

std::optional<Trajectory> rollout(DiscreteRobot& robot,
                                  const std::vector<JointVelocities>& actions);

std::optional<Trajectory> rollout(DiscreteRobot& robot,
                                  const std::vector<JointVelocities>& actions,
                                  int timestep_count);

} // namespace swimbot
