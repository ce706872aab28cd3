#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <swimbot/integrator.hpp>

using Catch::Approx;
using namespace swimbot;

static ModelParams swimmer_params() {
  ModelParams p;
  p.kind = ModelKind::HoneySwimmer;
  p.link_length = 2.0;
  p.t_interval = 0.5;
  return p;
}

static Configuration default_start() {
  Configuration c;
  c.a1 = -kPI / 4.0;
  c.a2 = kPI / 4.0;
  return c;
}

TEST_CASE("integrate: zero or negative duration returns the start") {
  const auto p = swimmer_params();
  Configuration start = default_start();
  start.x = 1.25; start.y = -3.5; start.theta = 0.3; start.body_x = 0.1;

  for (double t : {0.0, -0.5}) {
    const auto end = integrate(p, start, JointVelocities{1.0, -1.0}, t);
    REQUIRE(end.has_value());
    REQUIRE(end->x == start.x);
    REQUIRE(end->y == start.y);
    REQUIRE(end->theta == start.theta);
    REQUIRE(end->body_x == start.body_x);
    REQUIRE(end->a1 == start.a1);
    REQUIRE(end->a2 == start.a2);
  }
}

TEST_CASE("integrate: zero joint velocity does not move the body") {
  const auto end = integrate(swimmer_params(), default_start(), JointVelocities{}, 2.0);
  REQUIRE(end.has_value());
  REQUIRE(end->x == Approx(0.0).margin(1e-12));
  REQUIRE(end->y == Approx(0.0).margin(1e-12));
  REQUIRE(end->theta == Approx(0.0).margin(1e-12));
  REQUIRE(end->a1 == Approx(-kPI / 4.0));
}

TEST_CASE("integrate: joint channels advance at the commanded rate") {
  const auto end = integrate(swimmer_params(), default_start(), JointVelocities{0.4, -0.6}, 0.5);
  REQUIRE(end.has_value());
  REQUIRE(end->a1 == Approx(-kPI / 4.0 + 0.2).margin(1e-12));
  REQUIRE(end->a2 == Approx(kPI / 4.0 - 0.3).margin(1e-12));
}

TEST_CASE("integrate: matches a reference solution of the swimmer field") {
  // (a1, a2) = (-pi/4, pi/4), action (0, pi/2) for 0.5 s, L = 2.
  // Reference: classical RK4 with 4000 steps.
  const auto end = integrate(swimmer_params(), default_start(), JointVelocities{0.0, kHalfPI}, 0.5);
  REQUIRE(end.has_value());
  REQUIRE(end->body_x == Approx(0.586168253229).margin(1e-6));
  REQUIRE(end->x == Approx(0.561256663546).margin(1e-6));
  REQUIRE(end->y == Approx(-0.297751375152).margin(1e-6));
  REQUIRE(end->theta == Approx(-0.208046844767).margin(1e-6));
  REQUIRE(end->a2 == Approx(kHalfPI).margin(1e-9));

  SECTION("sample count does not change the answer") {
    IntegratorConfig cfg;
    cfg.samples = 3;
    const auto coarse = integrate(swimmer_params(), default_start(), JointVelocities{0.0, kHalfPI}, 0.5, cfg);
    REQUIRE(coarse.has_value());
    REQUIRE(coarse->x == Approx(end->x).margin(1e-6));
    REQUIRE(coarse->y == Approx(end->y).margin(1e-6));
    REQUIRE(coarse->theta == Approx(end->theta).margin(1e-6));
  }
}

TEST_CASE("integrate: singular start yields nullopt") {
  ModelParams p;
  p.kind = ModelKind::Wheeled;
  Configuration start;
  start.a1 = 0.3;
  start.a2 = 0.3;
  REQUIRE_FALSE(integrate(p, start, JointVelocities{0.1, 0.1}, 0.5).has_value());
}

TEST_CASE("integrate: wheeled joint path through D = 0 yields nullopt") {
  ModelParams p;
  p.kind = ModelKind::Wheeled;
  Configuration start;
  start.a1 = 0.3;
  start.a2 = 0.3512345;
  // a1 sweeps past a2 at t ~ 0.051
  REQUIRE_FALSE(integrate(p, start, JointVelocities{1.0, 0.0}, 0.1).has_value());
  // Same start, stopping short of the crossing.
  REQUIRE(integrate(p, start, JointVelocities{1.0, 0.0}, 0.04).has_value());
}

TEST_CASE("integrate: max_steps bounds the stepper work per sample") {
  const auto p = swimmer_params();
  IntegratorConfig cfg;
  cfg.max_steps = 0;
  REQUIRE_FALSE(integrate(p, default_start(), JointVelocities{0.0, 1.0}, 0.5, cfg).has_value());

  cfg.max_steps = 500;
  REQUIRE(integrate(p, default_start(), JointVelocities{0.0, 1.0}, 0.5, cfg).has_value());
}

TEST_CASE("configuration_of copies every integrated channel") {
  RobotState s;
  s.position = Vec2{1.0, 2.0};
  s.body_x = 3.0;
  s.theta = 0.5;
  s.joints = JointAngles{0.1, -0.2};
  const auto c = configuration_of(s);
  REQUIRE(c.x == 1.0);
  REQUIRE(c.y == 2.0);
  REQUIRE(c.body_x == 3.0);
  REQUIRE(c.theta == 0.5);
  REQUIRE(c.a1 == 0.1);
  REQUIRE(c.a2 == -0.2);
  REQUIRE(is_finite(c));
}
