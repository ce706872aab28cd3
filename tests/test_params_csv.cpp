#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sstream>
#include <string>

#include <swimbot/params.hpp>
#include <swimbot/swimmer.hpp>

using Catch::Approx;
using namespace swimbot;

static std::string csv_minimal = R"(key,model,link_length,viscosity,t_interval,timestep,lower_limit,upper_limit,angle_interval
long_swimmer,swimmer,3.0,1.5,0.5,2,-1.2,1.2,0
snake,wheeled,2.0,1.0,0.01,1,-1.5708,1.5708,0.005
)";

static std::string csv_with_noise = R"( key , model , link_length , viscosity , t_interval , timestep , lower_limit , upper_limit , angle_interval
# comment lines are ignored
long_swimmer , SWIMMER , 3.0 , 1.5 , 0.5 , 2 , -1.2 , 1.2 , 0

bad_model, octopus, 2, 1, 0.1, 1, -1, 1, 0
bad_limits, swimmer, 2, 1, 0.1, 1, 1, -1, 0
bad_length, swimmer, 0, 1, 0.1, 1, -1, 1, 0
bad_steps, swimmer, 2, 1, 0.1, 1.5, -1, 1, 0
short_row, swimmer, 2, 1
snake, Wheeled, 2.0, 1.0, 0.01, 1, -1.5708, 1.5708, 0.005
)";

TEST_CASE("params_catalog_from_csv_stream parses valid rows") {
  std::istringstream ss(csv_minimal);
  auto cat = params_catalog_from_csv_stream(ss);
  REQUIRE(cat.size() == 2);

  auto sw = params_by_key_in(cat, "long_swimmer");
  REQUIRE(sw.has_value());
  REQUIRE(sw->kind == ModelKind::HoneySwimmer);
  REQUIRE(sw->link_length == Approx(3.0));
  REQUIRE(sw->viscosity == Approx(1.5));
  REQUIRE(sw->t_interval == Approx(0.5));
  REQUIRE(sw->timestep_count == 2);
  REQUIRE(sw->limits.lower == Approx(-1.2));
  REQUIRE(sw->limits.upper == Approx(1.2));

  auto sn = params_by_key_in(cat, "snake");
  REQUIRE(sn.has_value());
  REQUIRE(sn->kind == ModelKind::Wheeled);
  REQUIRE(sn->angle_interval == Approx(0.005));
}

TEST_CASE("params_catalog_from_csv_stream handles spaces, comments and bad rows") {
  std::istringstream ss(csv_with_noise);
  auto cat = params_catalog_from_csv_stream(ss);
  REQUIRE(cat.size() == 2);
  REQUIRE(params_by_key_in(cat, "long_swimmer").has_value());
  REQUIRE(params_by_key_in(cat, "snake").has_value());
  REQUIRE_FALSE(params_by_key_in(cat, "bad_limits").has_value());
}

TEST_CASE("params_catalog_from_csv_stream works without a header") {
  std::istringstream ss("tiny,swimmer,1.0,1.0,0.1,1,-0.5,0.5,0\n");
  auto cat = params_catalog_from_csv_stream(ss);
  REQUIRE(cat.size() == 1);
  REQUIRE(cat[0].key == "tiny");
}

TEST_CASE("load_params_catalog_csv returns nullopt on missing file") {
  auto none = load_params_catalog_csv("this_file_does_not_exist.csv");
  REQUIRE_FALSE(none.has_value());
}

TEST_CASE("CSV timestep column sets the length of a default move") {
  std::istringstream ss(csv_minimal);
  const auto cat = params_catalog_from_csv_stream(ss);
  const auto sw = params_by_key_in(cat, "long_swimmer");
  REQUIRE(sw.has_value());

  SwimmingRobot r(*sw);
  REQUIRE(r.move(JointVelocities{0.0, 0.1}).ok());
  // timestep = 2, t_interval = 0.5
  REQUIRE(r.elapsed_time() == Approx(1.0));
  REQUIRE(r.state().timestep_count == 2);
}
