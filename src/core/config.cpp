#include "redline/core/config.hpp"
#include "redline/core/logger.hpp"

#include <cstdlib>
#include <fstream>

namespace redline {

auto load_config(const std::filesystem::path& path) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);

        // A single string is accepted where a list of schema files is expected.
        if (j.contains("schema_paths") && j["schema_paths"].is_string()) {
            auto single = j["schema_paths"].get<std::string>();
            j["schema_paths"] = json::array({single});
            LOG_DEBUG("Config: coerced schema_paths '{}' to a one-element list", single);
        }

        return j.get<Config>();
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

auto load_config_from_env() -> Config {
    Config config;

    if (auto* val = std::getenv("REDLINE_LOG_LEVEL")) {
        config.log_level = val;
    }
    if (auto* val = std::getenv("REDLINE_SCHEMA_PATH")) {
        std::string_view paths(val);
        size_t start = 0;
        while (start <= paths.size()) {
            auto end = paths.find(':', start);
            if (end == std::string_view::npos) end = paths.size();
            auto entry = paths.substr(start, end - start);
            if (!entry.empty()) {
                config.schema_paths.emplace_back(entry);
            }
            start = end + 1;
        }
    }
    if (auto* val = std::getenv("REDLINE_OUTPUT_INDENT")) {
        try {
            config.output.indent = std::stoi(val);
        } catch (const std::exception&) {
            LOG_WARN("Ignoring non-numeric REDLINE_OUTPUT_INDENT '{}'", val);
        }
    }

    return config;
}

auto default_config() -> Config {
    return Config{};
}

auto resolve_env_refs(std::string_view input) -> std::string {
    std::string result;
    result.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        // $${VAR} -> literal ${VAR}
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '$') {
            result += '$';
            i += 2;
            continue;
        }

        if (i + 2 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            auto close = input.find('}', i + 2);
            if (close != std::string_view::npos) {
                std::string var_name(input.substr(i + 2, close - i - 2));

                if (auto* val = std::getenv(var_name.c_str())) {
                    result += val;
                } else {
                    result += input.substr(i, close - i + 1);
                    LOG_DEBUG("Config: unresolved env ref ${{{}}}", var_name);
                }
                i = close + 1;
                continue;
            }
        }

        result += input[i];
        ++i;
    }

    return result;
}

auto resolved_schema_paths(const Config& config) -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> paths;
    paths.reserve(config.schema_paths.size());
    for (const auto& p : config.schema_paths) {
        paths.emplace_back(resolve_env_refs(p));
    }
    return paths;
}

} // namespace redline
