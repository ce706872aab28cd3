#include <swimbot/params.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace swimbot {

static std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

static std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

static std::vector<std::string> split_csv_line(const std::string& line) {
  // No quoted fields.
  std::vector<std::string> cols;
  std::string cur;
  for (char c : line) {
    if (c == ',') { cols.push_back(trim(cur)); cur.clear(); }
    else { cur.push_back(c); }
  }
  cols.push_back(trim(cur));
  return cols;
}

static bool is_header_row(const std::vector<std::string>& cols) {
  if (cols.empty()) return false;
  return lower(cols[0]) == "key";
}

static double to_double_safe(const std::string& s, bool& ok) {
  try {
    size_t idx = 0;
    double v = std::stod(s, &idx);
    ok = idx == s.size();
    return v;
  } catch (const std::exception&) {
    ok = false;
    return 0.0;
  }
}

static std::optional<ModelKind> parse_model(const std::string& s) {
  const auto m = lower(s);
  if (m == "swimmer" || m == "honey_swimmer") return ModelKind::HoneySwimmer;
  if (m == "wheeled") return ModelKind::Wheeled;
  return std::nullopt;
}

static std::optional<ModelParams> parse_params_row(const std::vector<std::string>& cols) {
  if (cols.size() < 9) return std::nullopt;
  const std::string key = cols[0];
  if (key.empty()) return std::nullopt;
  const auto kind = parse_model(cols[1]);
  if (!kind) return std::nullopt;

  bool ok[7];
  const double link  = to_double_safe(cols[2], ok[0]);
  const double visc  = to_double_safe(cols[3], ok[1]);
  const double dt    = to_double_safe(cols[4], ok[2]);
  const double steps = to_double_safe(cols[5], ok[3]);
  const double lo    = to_double_safe(cols[6], ok[4]);
  const double hi    = to_double_safe(cols[7], ok[5]);
  const double grid  = to_double_safe(cols[8], ok[6]);
  if (!std::all_of(std::begin(ok), std::end(ok), [](bool b){ return b; })) return std::nullopt;

  if (link <= 0.0 || dt < 0.0 || steps < 0.0 || steps > 1e6 || lo > hi) return std::nullopt;
  if (steps != static_cast<double>(static_cast<int>(steps))) return std::nullopt;

  ModelParams p;
  p.key = key;
  p.kind = *kind;
  p.link_length = link;
  p.viscosity = visc;
  p.t_interval = dt;
  p.timestep_count = static_cast<int>(steps);
  p.limits = JointLimits{lo, hi};
  p.angle_interval = grid;
  return p;
}

static std::vector<ModelParams> make_catalog_builtin() {
  ModelParams swimmer;
  swimmer.key = "honey_swimmer";
  swimmer.kind = ModelKind::HoneySwimmer;
  swimmer.link_length = 2.0;
  swimmer.viscosity = 1.0;
  swimmer.t_interval = 0.25;

  ModelParams wheeled;
  wheeled.key = "wheeled";
  wheeled.kind = ModelKind::Wheeled;
  wheeled.link_length = 2.0;
  wheeled.t_interval = 0.001;
  wheeled.timestep_count = 10;
  wheeled.angle_interval = 0.001;

  return {swimmer, wheeled};
}

const std::vector<ModelParams>& params_catalog() {
  static const std::vector<ModelParams> cat = make_catalog_builtin();
  return cat;
}

std::optional<ModelParams> params_by_key(const std::string& key) {
  return params_by_key_in(params_catalog(), key);
}

std::optional<ModelParams> params_by_key_in(const std::vector<ModelParams>& cat,
                                            const std::string& key) {
  auto it = std::find_if(cat.begin(), cat.end(), [&](const ModelParams& p){ return p.key == key; });
  if (it == cat.end()) return std::nullopt;
  return *it;
}

std::vector<ModelParams> params_catalog_from_csv_stream(std::istream& in) {
  std::vector<ModelParams> out;
  std::string line;
  bool header_consumed = false;

  while (std::getline(in, line)) {
    std::string raw = trim(line);
    if (raw.empty()) continue;
    if (raw[0] == '#') continue;

    auto cols = split_csv_line(raw);

    if (!header_consumed && is_header_row(cols)) {
      header_consumed = true;
      continue;
    }

    if (auto row = parse_params_row(cols); row.has_value()) {
      out.push_back(*row);
    }
  }
  return out;
}

std::optional<std::vector<ModelParams>> load_params_catalog_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return params_catalog_from_csv_stream(f);
}

} // namespace swimbot
