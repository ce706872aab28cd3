#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

#include <swimbot/params.hpp>
#include <swimbot/rollout.hpp>
#include <swimbot/swimmer.hpp>

using namespace swimbot;

static void print_sample(std::size_t i, const Sample& s) {
  std::printf("%3zu  t=%6.3f  body_x=% .6f  x=% .6f  y=% .6f  theta=% .6f  a1=% .6f  a2=% .6f\n",
              i, s.time, s.body_x, s.x, s.y, s.theta, s.a1, s.a2);
}

static int usage(const char* argv0) {
  std::fprintf(stderr, "usage: %s [preset] [steps]\n"
                       "       %s --csv <file> <preset> [steps]\n", argv0, argv0);
  return 2;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::optional<ModelParams> params;
  std::size_t arg = 0;
  if (!args.empty() && args[0] == "--csv") {
    if (args.size() < 3) return usage(argv[0]);
    const auto cat = load_params_catalog_csv(args[1]);
    if (!cat) {
      std::fprintf(stderr, "cannot open %s\n", args[1].c_str());
      return 1;
    }
    params = params_by_key_in(*cat, args[2]);
    arg = 3;
  } else {
    params = params_by_key(args.empty() ? "honey_swimmer" : args[0]);
    arg = args.empty() ? 0 : 1;
  }
  if (!params) {
    std::fprintf(stderr, "unknown preset\n");
    return 1;
  }

  std::size_t steps = 10;
  if (arg < args.size()) {
    const long n = std::strtol(args[arg].c_str(), nullptr, 10);
    if (n <= 0) return usage(argv[0]);
    steps = static_cast<std::size_t>(n);
  }

  if (params->kind == ModelKind::Wheeled) {
    DiscreteRobot robot(*params);
    const std::vector<JointVelocities> actions(steps, JointVelocities{kPI / 8.0, -kPI / 8.0});
    const auto traj = rollout(robot, actions);
    if (!traj) {
      std::fprintf(stderr, "move failed: singular configuration\n");
      return 1;
    }
    for (std::size_t i = 0; i < traj->size(); ++i) print_sample(i, (*traj)[i]);
    return 0;
  }

  SwimmingRobot robot(*params);
  const auto& s0 = robot.state();
  std::printf("preset %s  L=%.3f  t_interval=%.3f  timesteps=%d\n",
              params->key.c_str(), params->link_length, params->t_interval,
              params->timestep_count);
  std::printf("initial x y theta a1 a2: %.6f %.6f %.6f %.6f %.6f\n",
              s0.position.x, s0.position.y, s0.theta, s0.joints.a1, s0.joints.a2);

  const auto gait = alternating_gait(kHalfPI, steps);
  for (std::size_t i = 0; i < gait.size(); ++i) {
    const auto r = robot.move(gait[i]);
    if (!r.ok()) {
      std::fprintf(stderr, "step %zu failed: %s\n", i + 1, to_string(r.status));
      return 1;
    }
    std::printf("action (a1dot, a2dot): (%.4f, %.4f)  realized: (%.4f, %.4f)\n",
                gait[i].a1dot, gait[i].a2dot,
                robot.velocities().a1dot, robot.velocities().a2dot);
    print_sample(i + 1, sample_of(robot.state()));
  }
  return 0;
}
