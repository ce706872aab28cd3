#pragma once
#include <Eigen/Dense>
#include <swimbot/state.hpp>

namespace swimbot {

using BodyJacobian = Eigen::Matrix<double, 3, 2>;

// Inertial-frame velocity of every integrated channel.
struct GeneralizedVelocity {
  double body_xdot = 0.0;
  double xdot = 0.0;
  double ydot = 0.0;
  double thetadot = 0.0;
  double a1dot = 0.0;
  double a2dot = 0.0;
};

// Lifted left action T_e L_g: rotates (vx, vy) by theta, leaves omega alone.
Eigen::Matrix3d lift(double theta);

// Closed-form Jacobian of the viscous three-link swimmer.
BodyJacobian swimmer_jacobian(const JointAngles& a, double link_length);

// D(a) of the wheeled three-link snake; zero on the singular set (a1 == a2
// among others).
double wheeled_determinant(const JointAngles& a, double link_length);

// D(a)^-1 * A(a) of the wheeled three-link snake. D vanishes whenever
// a1 == a2; the result then holds Inf/NaN and is not corrected here.
BodyJacobian wheeled_jacobian(const JointAngles& a, double link_length);

BodyJacobian body_jacobian(const ModelParams& p, const JointAngles& a);

GeneralizedVelocity generalized_velocity(const ModelParams& p,
                                         double theta,
                                         const JointAngles& a,
                                         const JointVelocities& action);

} // namespace swimbot
