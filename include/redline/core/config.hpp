#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace redline {

using json = nlohmann::json;

struct OutputConfig {
    int indent = 2;  // negative = compact single-line output
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(OutputConfig, indent)

struct Config {
    std::string log_level = "info";
    std::vector<std::string> schema_paths;
    OutputConfig output;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, log_level, schema_paths, output)

auto load_config(const std::filesystem::path& path) -> Config;
auto load_config_from_env() -> Config;
auto default_config() -> Config;

/// Resolves `${VAR}` environment variable references in a string.
/// Supports `$${VAR}` escape (literal `${VAR}`).
auto resolve_env_refs(std::string_view input) -> std::string;

/// Returns `schema_paths` with env references resolved.
auto resolved_schema_paths(const Config& config) -> std::vector<std::filesystem::path>;

} // namespace redline
