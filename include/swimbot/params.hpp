#pragma once
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <swimbot/state.hpp>

namespace swimbot {

// Presets compiled into the library: "honey_swimmer" and "wheeled".
const std::vector<ModelParams>& params_catalog();

// Preset by key from params_catalog().
std::optional<ModelParams> params_by_key(const std::string& key);

std::optional<ModelParams> params_by_key_in(const std::vector<ModelParams>& cat,
                                            const std::string& key);

// Model parameter rows read from any stream.
// Columns: key,model,link_length,viscosity,t_interval,timestep,
//          lower_limit,upper_limit,angle_interval
// model is "swimmer" or "wheeled" (case-insensitive). Accepts an optional
// header row; ignores lines starting with '#' and blank lines. Whitespace
// around fields is trimmed. Invalid rows are skipped.
std::vector<ModelParams> params_catalog_from_csv_stream(std::istream& in);

// nullopt when `path` cannot be opened.
std::optional<std::vector<ModelParams>> load_params_catalog_csv(const std::string& path);

} // namespace swimbot
