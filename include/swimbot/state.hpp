#pragma once
#include <string>
#include <swimbot/angles.hpp>

namespace swimbot {

struct Vec2 {
  double x{};
  double y{};
};

struct JointAngles {
  double a1 = 0.0;   // proximal joint (rad)
  double a2 = 0.0;   // distal joint (rad)
};

struct JointVelocities {
  double a1dot = 0.0; // rad/s
  double a2dot = 0.0; // rad/s
};

struct JointLimits {
  double lower = -kHalfPI;
  double upper =  kHalfPI;
  bool contains(double a) const { return a >= lower && a <= upper; }
};

enum class ModelKind : int {
  HoneySwimmer = 0, // three-link swimmer in a viscous fluid
  Wheeled = 1       // three-link kinematic snake, discretized state
};

// Physical and timing constants of one session. Not mutated by the engine.
struct ModelParams {
  std::string key;
  ModelKind kind = ModelKind::HoneySwimmer;
  double link_length = 2.0;      // length of every link (m)
  double viscosity = 1.0;        // viscosity constant k
  double t_interval = 0.25;      // seconds per timestep
  int timestep_count = 1;        // default timesteps per control step
  JointLimits limits{};
  double angle_interval = 0.001; // discretization of theta/a1/a2 (Wheeled only)
};

struct RobotState {
  Vec2 position{};               // inertial frame (m)
  double body_x = 0.0;           // integrated body-frame longitudinal displacement
  double theta = 0.0;            // heading, kept in (-pi, pi]
  JointAngles joints{-kPI / 4.0, kPI / 4.0};
  JointVelocities velocities{};  // realized over the last step
  double elapsed_time = 0.0;     // seconds actually integrated
  int timestep_count = 1;        // count used by the last move
};

// Result of one control step, computed from a state without touching it.
struct StepUpdate {
  Vec2 position{};
  double body_x = 0.0;
  double theta = 0.0;
  JointAngles joints{};
  JointVelocities velocities{};
  double duration = 0.0;         // total seconds integrated
  bool split = false;            // two sub-integrations were needed
  double first_duration = 0.0;
  double second_duration = 0.0;
};

// timestep_count * t_interval, never negative.
inline double nominal_duration(const ModelParams& p, int timestep_count) {
  const double t = double(timestep_count) * p.t_interval;
  return t > 0.0 ? t : 0.0;
}

inline void apply_step(RobotState& s, const StepUpdate& u) {
  s.position = u.position;
  s.body_x = u.body_x;
  s.theta = u.theta;
  s.joints = u.joints;
  s.velocities = u.velocities;
  s.elapsed_time += u.duration;
}

} // namespace swimbot
