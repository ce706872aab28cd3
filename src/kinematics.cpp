#include <swimbot/kinematics.hpp>
#include <cmath>

namespace swimbot {

static inline double sq(double x) { return x * x; }

Eigen::Matrix3d lift(double theta) {
  const double c = std::cos(theta);
  const double s = std::sin(theta);
  Eigen::Matrix3d T;
  T << c,  -s,  0.0,
       s,   c,  0.0,
       0.0, 0.0, 1.0;
  return T;
}

BodyJacobian swimmer_jacobian(const JointAngles& a, double link_length) {
  const double a1 = a.a1;
  const double a2 = a.a2;
  const double L = link_length;

  // c(i, j) = cos(i*a1 + j*a2), s(i, j) = sin(i*a1 + j*a2)
  auto c = [&](int i, int j) { return std::cos(i * a1 + j * a2); };
  auto s = [&](int i, int j) { return std::sin(i * a1 + j * a2); };
  const double c1 = std::cos(a1), c2 = std::cos(a2);
  const double s1 = std::sin(a1), s2 = std::sin(a2);

  BodyJacobian J;

  // Row 0: body x velocity. Both columns share one denominator up to sign.
  const double d0 = 3.0 * (-136*c1 - 14*c(2,0) - 136*c2 - 14*c(0,2) + 4*c(1,-2) + 8*c(1,-1)
                           - 56*c(1,1) - 12*c(1,2) + c(2,-2) + 4*c(2,-1) - 12*c(2,1)
                           - 3*c(2,2) - 282);
  J(0, 0) = 4*L*(72*s1 + 5*s(2,0) - 30*s2 - 7*s(0,2) + 6*s(1,-2) + 36*s(1,-1) + 12*s(1,1)
                 + 2*s(1,2) + 2*s(2,1) + s(2,2)) / d0;
  J(0, 1) = -4*L*(-30*s1 - 7*s(2,0) + 72*s2 + 5*s(0,2) - 36*s(1,-1) + 12*s(1,1) + 2*s(1,2)
                  - 6*s(2,-1) + 2*s(2,1) + s(2,2)) / d0;

  // Row 1: body y velocity.
  const double u1 = sq(1.0 - c(2,0));
  const double u2 = sq(1.0 - c(0,2));
  const double d1 = 3.0 * (-8*u1*u2 + 64*u1*c2 + 16*u1*c(0,2) + 112*u1 + 64*u2*c1
                           + 16*u2*c(2,0) + 112*u2
                           - 8224*c1 + 1544*c(2,0) + 544*c(3,0) + 6*c(4,0)
                           - 8224*c2 + 1544*c(0,2) + 544*c(0,3) + 6*c(0,4)
                           - 32*c(1,-4) - 32*c(1,-3) + 912*c(1,-2) + 960*c(1,-1)
                           - 3648*c(1,1) - 176*c(1,2) + 224*c(1,3) + 32*c(1,4)
                           - 12*c(2,-4) - 16*c(2,-3) + 224*c(2,-2) + 912*c(2,-1)
                           - 176*c(2,1) - 32*c(2,2) + 48*c(2,3) + 4*c(2,4)
                           - 16*c(3,-2) - 32*c(3,-1) + 224*c(3,1) + 48*c(3,2)
                           + c(4,-4) - 12*c(4,-2) - 32*c(4,-1) + 32*c(4,1) + 4*c(4,2)
                           + c(4,4) - 18254);
  J(1, 0) = 4*L*(-32*u1 - 56*u2*c1 + 12*u2*c(2,0) - 52*u2
                 + 3596*c1 + 102*c(2,0) - 236*c(3,0) + 1312*c2 + 144*c(0,2) - 88*c(0,3)
                 + 6*c(0,4)
                 - 4*c(1,-4) - 108*c(1,-3) - 14*c(1,-2) + 1512*c(1,-1) + 1512*c(1,1)
                 - 150*c(1,2) - 108*c(1,3) + 4*c(1,4)
                 - 3*c(2,-4) - 24*c(2,-2) - 96*c(2,-1) + 40*c(2,1) - 24*c(2,2) - 8*c(2,3)
                 - 3*c(2,4)
                 - 18*c(3,-2) - 108*c(3,-1) - 108*c(3,1) - 10*c(3,2) - 8*c(4,1) + 666) / d1;
  J(1, 1) = 4*L*(-56*u1*c2 + 12*u1*c(0,2) - 52*u1 - 32*u2
                 + 1312*c1 + 144*c(2,0) - 88*c(3,0) + 6*c(4,0) + 3596*c2 + 102*c(0,2)
                 - 236*c(0,3)
                 - 108*c(1,-3) - 96*c(1,-2) + 1512*c(1,-1) + 1512*c(1,1) + 40*c(1,2)
                 - 108*c(1,3) - 8*c(1,4)
                 - 18*c(2,-3) - 24*c(2,-2) - 14*c(2,-1) - 150*c(2,1) - 24*c(2,2)
                 - 10*c(2,3)
                 - 108*c(3,-1) - 108*c(3,1) - 8*c(3,2) - 3*c(4,-2) - 4*c(4,-1) + 4*c(4,1)
                 - 3*c(4,2) + 666) / d1;

  // Row 2: body angular velocity. Independent of L.
  const double P = -7*c1 - 2*c(2,0) + 7*c2 + 2*c(0,2) + c(1,2) - c(2,1);
  const double Q = 4*s1 + s(2,0) + 4*s2 + s(0,2);
  const double R = c(2,0) + c(0,2) + c(2,2) - 39;
  const double S = c(2,0) + c(0,2) - 8;
  const double T = -28*c1 + c(2,0) - 28*c2 + c(0,2) + 4*c(1,-2) + 8*c(1,-1) - 8*c(1,1)
                   + c(2,-2) + 4*c(2,-1) - 63;
  const double K = -2*(s(2,0) - s(0,2))*P + Q*R;
  const double d2 = 3.0 * (-R*T + 4*sq(P));
  J(2, 0) = 2*(-3*K*s1 - (3*c1 + 4)*S*R + 6*S*P*c1) / d2;
  J(2, 1) = 2*( 3*K*s2 + (3*c2 + 4)*S*R + 6*S*P*c2) / d2;

  return J;
}

double wheeled_determinant(const JointAngles& a, double link_length) {
  const double k = 2.0 / link_length;
  return k * (-std::sin(a.a1) - std::sin(a.a1 - a.a2) + std::sin(a.a2));
}

BodyJacobian wheeled_jacobian(const JointAngles& a, double link_length) {
  const double a1 = a.a1;
  const double a2 = a.a2;
  const double k = 2.0 / link_length;

  BodyJacobian A;
  A << std::cos(a1) + std::cos(a1 - a2),      1.0 + std::cos(a1),
       0.0,                                   0.0,
       k * (std::sin(a1) + std::sin(a1 - a2)), k * std::sin(a1);

  return A / wheeled_determinant(a, link_length);
}

BodyJacobian body_jacobian(const ModelParams& p, const JointAngles& a) {
  switch (p.kind) {
    case ModelKind::Wheeled:      return wheeled_jacobian(a, p.link_length);
    case ModelKind::HoneySwimmer: return swimmer_jacobian(a, p.link_length);
  }
  return swimmer_jacobian(a, p.link_length);
}

GeneralizedVelocity generalized_velocity(const ModelParams& p,
                                         double theta,
                                         const JointAngles& a,
                                         const JointVelocities& action) {
  const Eigen::Vector2d da(action.a1dot, action.a2dot);
  const Eigen::Vector3d f_body = body_jacobian(p, a) * da;
  const Eigen::Vector3d f = lift(theta) * f_body;

  GeneralizedVelocity v;
  v.body_xdot = (p.kind == ModelKind::HoneySwimmer) ? f_body(0) : 0.0;
  v.xdot = f(0);
  v.ydot = f(1);
  v.thetadot = f(2);
  v.a1dot = action.a1dot;
  v.a2dot = action.a2dot;
  return v;
}

} // namespace swimbot
