#include <swimbot/integrator.hpp>
#include <array>
#include <cmath>
#include <vector>
#include <boost/numeric/odeint.hpp>
#include <swimbot/kinematics.hpp>

namespace swimbot {

namespace odeint = boost::numeric::odeint;

// [body_x, x, y, theta, a1, a2]
using state_type = std::array<double, 6>;

static state_type to_state(const Configuration& c) {
  return state_type{c.body_x, c.x, c.y, c.theta, c.a1, c.a2};
}

static Configuration from_state(const state_type& v) {
  return Configuration{v[0], v[1], v[2], v[3], v[4], v[5]};
}

// Right-hand side for odeint; joint velocities are held constant.
struct VelocityField {
  const ModelParams* params;
  JointVelocities action;

  void operator()(const state_type& v, state_type& dvdt, double /*t*/) const {
    const auto f = generalized_velocity(*params, v[3], JointAngles{v[4], v[5]}, action);
    dvdt[0] = f.body_xdot;
    dvdt[1] = f.xdot;
    dvdt[2] = f.ydot;
    dvdt[3] = f.thetadot;
    dvdt[4] = f.a1dot;
    dvdt[5] = f.a2dot;
  }
};

Configuration configuration_of(const RobotState& s) {
  return Configuration{s.body_x, s.position.x, s.position.y, s.theta,
                       s.joints.a1, s.joints.a2};
}

bool is_finite(const Configuration& c) {
  return std::isfinite(c.body_x) && std::isfinite(c.x) && std::isfinite(c.y) &&
         std::isfinite(c.theta) && std::isfinite(c.a1) && std::isfinite(c.a2);
}

// Subdivisions of the joint path scanned for a sign change of D.
static constexpr int kSingularScan = 64;

// Joints move linearly in time, so the wheeled model's singular set is hit
// iff D changes sign (or vanishes) along that segment.
static bool crosses_singularity_(const ModelParams& p,
                                 const Configuration& start,
                                 const JointVelocities& action,
                                 double duration) {
  if (p.kind != ModelKind::Wheeled) return false;
  const double d0 = wheeled_determinant(JointAngles{start.a1, start.a2}, p.link_length);
  for (int i = 1; i <= kSingularScan; ++i) {
    const double t = duration * double(i) / double(kSingularScan);
    const JointAngles a{start.a1 + action.a1dot * t, start.a2 + action.a2dot * t};
    const double d = wheeled_determinant(a, p.link_length);
    if (d == 0.0 || (d > 0.0) != (d0 > 0.0)) return true;
  }
  return false;
}

std::optional<Configuration> integrate(const ModelParams& p,
                                       const Configuration& start,
                                       const JointVelocities& action,
                                       double duration,
                                       const IntegratorConfig& cfg) {
  if (!(duration > 0.0)) return start;
  if (!is_finite(start)) return std::nullopt;

  const VelocityField field{&p, action};

  // Refuse to step from a degenerate point; the controlled stepper would
  // otherwise shrink dt until it gives up.
  state_type v = to_state(start);
  state_type dv{};
  field(v, dv, 0.0);
  for (double d : dv) {
    if (!std::isfinite(d)) return std::nullopt;
  }
  if (crosses_singularity_(p, start, action, duration)) return std::nullopt;

  const int n = cfg.samples < 2 ? 2 : cfg.samples;
  std::vector<double> times(static_cast<std::size_t>(n));
  for (int i = 0; i < n; ++i) {
    times[static_cast<std::size_t>(i)] = duration * double(i) / double(n - 1);
  }
  times.back() = duration;

  auto stepper = odeint::make_controlled(cfg.abs_tolerance, cfg.rel_tolerance,
                                         odeint::runge_kutta_dopri5<state_type>());
  state_type last = v;
  try {
    odeint::integrate_times(stepper, field, v, times.begin(), times.end(),
                            times[1] - times[0],
                            [&last](const state_type& x, double) { last = x; },
                            odeint::max_step_checker(cfg.max_steps));
  } catch (const odeint::odeint_error&) {
    return std::nullopt;
  }

  const Configuration out = from_state(last);
  if (!is_finite(out)) return std::nullopt;
  return out;
}

} // namespace swimbot
