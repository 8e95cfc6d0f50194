#include "redline/cli/commands.hpp"
#include "redline/core/logger.hpp"
#include "redline/schema/json_codec.hpp"

#include <fstream>
#include <iostream>
#include <memory>

// Version string; typically injected by CMake via -D, fallback to a default.
#ifndef REDLINE_VERSION_STRING
#define REDLINE_VERSION_STRING "0.1.0-dev"
#endif

namespace redline::cli {

namespace {

/// Reports `err` and aborts the running subcommand with exit code 1.
[[noreturn]] void fail(const Error& err) {
    LOG_ERROR("{} ({})", err.what(), error_code_to_string(err.code()));
    std::cerr << "error: " << err.what() << "\n";
    throw CLI::RuntimeError(1);
}

auto read_json(const std::string& path) -> Result<json> {
    try {
        if (path.empty() || path == "-") {
            return json::parse(std::cin);
        }
        std::ifstream in(path);
        if (!in.is_open()) {
            return std::unexpected(make_error(ErrorCode::IoError, "Cannot open input", path));
        }
        return json::parse(in);
    } catch (const json::exception& e) {
        return std::unexpected(make_error(
            ErrorCode::SerializationError, "Invalid JSON input", e.what()));
    }
}

auto schema_paths_for(const Config& config, const std::vector<std::string>& extra)
    -> std::vector<std::filesystem::path> {
    auto paths = resolved_schema_paths(config);
    for (const auto& p : extra) {
        paths.emplace_back(p);
    }
    return paths;
}

auto find_type(const schema::SchemaPool& pool, std::string_view type_name)
    -> Result<const schema::MessageType*> {
    const auto* type = pool.find(type_name);
    if (!type) {
        return std::unexpected(make_error(
            ErrorCode::NotFound, "Unknown message type", std::string(type_name)));
    }
    return type;
}

} // anonymous namespace

auto write_json(const json& j, const std::string& path, int indent) -> VoidResult {
    auto text = indent < 0 ? j.dump() : j.dump(indent);
    if (path.empty() || path == "-") {
        std::cout << text << "\n" << std::flush;
        if (!std::cout) {
            return std::unexpected(make_error(ErrorCode::IoError, "Cannot write output", "stdout"));
        }
        return {};
    }
    std::ofstream out(path);
    if (!out.is_open()) {
        return std::unexpected(make_error(ErrorCode::IoError, "Cannot open output", path));
    }
    out << text << "\n";
    out.flush();
    if (!out) {
        return std::unexpected(make_error(ErrorCode::IoError, "Cannot write output", path));
    }
    return {};
}

auto prepare_config(const GlobalOptions& options) -> Config {
    Config config = options.config_path.empty()
        ? load_config_from_env()
        : load_config(std::filesystem::path(options.config_path));

    if (!options.log_level.empty()) {
        config.log_level = options.log_level;
    }
    Logger::init("redline", config.log_level);
    return config;
}

auto load_schemas(schema::SchemaPool& pool,
                  const std::vector<std::filesystem::path>& paths) -> VoidResult {
    for (const auto& path : paths) {
        if (auto loaded = pool.load_file(path); !loaded) {
            return loaded;
        }
    }
    LOG_DEBUG("Schema pool holds {} message type(s)", pool.size());
    return {};
}

auto redact_document(const schema::SchemaPool& pool,
                     redact::RedactorRegistry& registry,
                     std::string_view type_name,
                     const json& document) -> Result<json> {
    auto type = find_type(pool, type_name);
    if (!type) {
        return std::unexpected(type.error());
    }

    auto plan = registry.get(**type);
    if (!plan) {
        return std::unexpected(plan.error());
    }

    auto redact_one = [&](const json& j) -> Result<json> {
        auto message = schema::message_from_json(**type, j);
        if (!message) {
            return std::unexpected(message.error());
        }
        auto redacted = (*plan)->redact(*message);
        if (!redacted) {
            return std::unexpected(redacted.error());
        }
        return schema::message_to_json(**redacted);
    };

    if (!document.is_array()) {
        return redact_one(document);
    }

    json out = json::array();
    for (const auto& element : document) {
        auto redacted = redact_one(element);
        if (!redacted) {
            return std::unexpected(redacted.error());
        }
        out.push_back(std::move(*redacted));
    }
    LOG_DEBUG("Redacted {} {} message(s)", out.size(), type_name);
    return out;
}

auto describe_plan(const schema::SchemaPool& pool,
                   redact::RedactorRegistry& registry,
                   std::string_view type_name) -> Result<json> {
    auto type = find_type(pool, type_name);
    if (!type) {
        return std::unexpected(type.error());
    }

    auto plan = registry.get(**type);
    if (!plan) {
        return std::unexpected(plan.error());
    }

    auto j = (*plan)->describe();
    j["type"] = (*type)->full_name();
    return j;
}

// ---------------------------------------------------------------------------
// redact command
// ---------------------------------------------------------------------------

void register_redact_command(CLI::App& app, const GlobalOptions& options) {
    auto* sub = app.add_subcommand("redact", "Redact sensitive fields from JSON messages");

    struct RedactOptions {
        std::vector<std::string> schemas;
        std::string type;
        std::string input;
        std::string output;
    };
    auto opts = std::make_shared<RedactOptions>();

    sub->add_option("-s,--schema", opts->schemas, "Schema file(s) (JSON)")
        ->check(CLI::ExistingFile);
    sub->add_option("-t,--type", opts->type, "Fully qualified message type")
        ->required();
    sub->add_option("-i,--input", opts->input, "Input JSON file (default: stdin)");
    sub->add_option("-o,--output", opts->output, "Output file (default: stdout)");

    sub->callback([&options, opts]() {
        auto config = prepare_config(options);

        schema::SchemaPool pool;
        if (auto loaded = load_schemas(pool, schema_paths_for(config, opts->schemas)); !loaded) {
            fail(loaded.error());
        }

        auto input = read_json(opts->input);
        if (!input) {
            fail(input.error());
        }

        redact::RedactorRegistry registry;
        auto result = redact_document(pool, registry, opts->type, *input);
        if (!result) {
            fail(result.error());
        }

        if (auto written = write_json(*result, opts->output, config.output.indent); !written) {
            fail(written.error());
        }
    });
}

// ---------------------------------------------------------------------------
// inspect command
// ---------------------------------------------------------------------------

void register_inspect_command(CLI::App& app, const GlobalOptions& options) {
    auto* sub = app.add_subcommand("inspect", "Show the redaction plan of a message type");

    struct InspectOptions {
        std::vector<std::string> schemas;
        std::string type;
    };
    auto opts = std::make_shared<InspectOptions>();

    sub->add_option("-s,--schema", opts->schemas, "Schema file(s) (JSON)")
        ->check(CLI::ExistingFile);
    sub->add_option("-t,--type", opts->type, "Fully qualified message type")
        ->required();

    sub->callback([&options, opts]() {
        auto config = prepare_config(options);

        schema::SchemaPool pool;
        if (auto loaded = load_schemas(pool, schema_paths_for(config, opts->schemas)); !loaded) {
            fail(loaded.error());
        }

        redact::RedactorRegistry registry;
        auto plan = describe_plan(pool, registry, opts->type);
        if (!plan) {
            fail(plan.error());
        }

        if (auto written = write_json(*plan, "", config.output.indent); !written) {
            fail(written.error());
        }
    });
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

void register_version_command(CLI::App& app) {
    auto* sub = app.add_subcommand("version", "Print version information");
    sub->callback([]() {
        std::cout << "redline " << REDLINE_VERSION_STRING << "\n";
    });
}

} // namespace redline::cli
