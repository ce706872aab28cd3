#include <swimbot/swimmer.hpp>
#include <algorithm>
#include <cmath>
#include <utility>
#include <swimbot/randomize.hpp>

namespace swimbot {

double crossing_time(double angle, double velocity, const JointLimits& limits, double nominal) {
  const double projected = angle + velocity * nominal;
  if (projected > limits.upper) return (limits.upper - angle) / velocity;
  if (projected < limits.lower) return (limits.lower - angle) / velocity;
  return nominal;
}

// Re-apply the angle invariants to an integrated configuration.
static Configuration settle_(Configuration c, const JointLimits& lim, bool enforce_limits) {
  c.theta = wrap_angle(c.theta);
  if (!enforce_limits) {
    c.a1 = wrap_angle(c.a1);
    c.a2 = wrap_angle(c.a2);
  }
  c.a1 = snap_to_limits(c.a1, lim.lower, lim.upper, kSnapTolerance);
  c.a2 = snap_to_limits(c.a2, lim.lower, lim.upper, kSnapTolerance);
  if (enforce_limits) {
    c.a1 = clamp_to_limits(c.a1, lim.lower, lim.upper);
    c.a2 = clamp_to_limits(c.a2, lim.lower, lim.upper);
  }
  return c;
}

// Time-weighted mean of two sub-step actions, scaled down when the step
// ended before the nominal duration.
static JointVelocities blend_(const JointVelocities& v1, double t1,
                              const JointVelocities& v2, double t2,
                              double nominal) {
  const double total = t1 + t2;
  if (!(total > 0.0) || !(nominal > 0.0)) return JointVelocities{};
  const double c1 = t1 / total;
  const double c2 = t2 / total;
  const double c3 = total < nominal ? total / nominal : 1.0;
  return JointVelocities{(c1 * v1.a1dot + c2 * v2.a1dot) * c3,
                         (c1 * v1.a2dot + c2 * v2.a2dot) * c3};
}

static StepUpdate to_update(const Configuration& c) {
  StepUpdate u;
  u.position = Vec2{c.x, c.y};
  u.body_x = c.body_x;
  u.theta = c.theta;
  u.joints = JointAngles{c.a1, c.a2};
  return u;
}

PlannedStep plan_step(const RobotState& s,
                      const ModelParams& p,
                      const JointVelocities& action,
                      int timestep_count,
                      bool enforce_angle_limits,
                      const IntegratorConfig& cfg) {
  PlannedStep out;
  const double nominal = nominal_duration(p, timestep_count);
  const Configuration start = configuration_of(s);

  if (!enforce_angle_limits) {
    const auto end = integrate(p, start, action, nominal, cfg);
    if (!end) { out.status = MoveStatus::NonFiniteResult; return out; }
    out.update = to_update(settle_(*end, p.limits, false));
    out.update.velocities = blend_(action, nominal, JointVelocities{}, 0.0, nominal);
    out.update.duration = nominal;
    out.update.first_duration = nominal;
    return out;
  }

  if (!p.limits.contains(s.joints.a1) || !p.limits.contains(s.joints.a2)) {
    out.status = MoveStatus::JointOutOfLimits;
    return out;
  }

  const double a1_t = crossing_time(s.joints.a1, action.a1dot, p.limits, nominal);
  const double a2_t = crossing_time(s.joints.a2, action.a2dot, p.limits, nominal);

  if (std::abs(a1_t - a2_t) > kSplitTolerance) {
    // The joint that reaches its bound first is held there for the remainder.
    const double t1 = std::min(a1_t, a2_t);
    const double t2 = std::abs(a1_t - a2_t);
    const JointVelocities held = (a1_t < a2_t) ? JointVelocities{0.0, action.a2dot}
                                               : JointVelocities{action.a1dot, 0.0};

    const auto mid = integrate(p, start, action, t1, cfg);
    if (!mid) { out.status = MoveStatus::NonFiniteResult; return out; }
    const auto end = integrate(p, settle_(*mid, p.limits, true), held, t2, cfg);
    if (!end) { out.status = MoveStatus::NonFiniteResult; return out; }

    out.update = to_update(settle_(*end, p.limits, true));
    out.update.velocities = blend_(action, t1, held, t2, nominal);
    out.update.duration = t1 + t2;
    out.update.split = true;
    out.update.first_duration = t1;
    out.update.second_duration = t2;
    return out;
  }

  const double t = std::min(a1_t, a2_t);
  const auto end = integrate(p, start, action, t, cfg);
  if (!end) { out.status = MoveStatus::NonFiniteResult; return out; }
  out.update = to_update(settle_(*end, p.limits, true));
  out.update.velocities = blend_(action, t, JointVelocities{}, 0.0, nominal);
  out.update.duration = t;
  out.update.first_duration = t;
  return out;
}

SwimmingRobot::SwimmingRobot(ModelParams params,
                             Vec2 position,
                             double theta,
                             JointAngles joints,
                             IntegratorConfig cfg)
  : params_(std::move(params)), cfg_(cfg) {
  state_.position = position;
  state_.theta = wrap_angle(theta);
  state_.joints = joints;
  state_.timestep_count = params_.timestep_count;
}

MoveResult SwimmingRobot::move(const JointVelocities& action) {
  return move(action, params_.timestep_count, true);
}

MoveResult SwimmingRobot::move(const JointVelocities& action,
                               int timestep_count,
                               bool enforce_angle_limits) {
  const PlannedStep step = plan_step(state_, params_, action, timestep_count,
                                     enforce_angle_limits, cfg_);
  if (step.status != MoveStatus::Ok) return MoveResult{step.status, state_.joints};

  apply_step(state_, step.update);
  state_.timestep_count = timestep_count;
  return MoveResult{MoveStatus::Ok, state_.joints};
}

JointAngles SwimmingRobot::randomize_joint_state(std::mt19937& rng, bool enforce_opposite_signs) {
  state_.joints = random_joint_angles(params_.limits, enforce_opposite_signs, rng);
  return state_.joints;
}

} // namespace swimbot
