#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include "redline/core/config.hpp"
#include "redline/core/error.hpp"
#include "redline/redact/registry.hpp"
#include "redline/schema/schema_pool.hpp"

namespace redline::cli {

using json = nlohmann::json;

/// Options shared by every subcommand.
struct GlobalOptions {
    std::string config_path;
    std::string log_level;
};

/// Loads the config file named in `options` (or the environment when none
/// is given), applies the log level override and initializes logging.
auto prepare_config(const GlobalOptions& options) -> Config;

/// Writes `j` to `path`, or stdout when `path` is empty or "-". A negative
/// indent writes compact JSON. Fails with IoError if the file cannot be
/// opened or the write does not complete.
auto write_json(const json& j, const std::string& path, int indent) -> VoidResult;

/// Registers every schema file into `pool`, stopping at the first failure.
auto load_schemas(schema::SchemaPool& pool,
                  const std::vector<std::filesystem::path>& paths) -> VoidResult;

/// Redacts a JSON document holding one message (object) or several
/// (array of objects) of the named type.
auto redact_document(const schema::SchemaPool& pool,
                     redact::RedactorRegistry& registry,
                     std::string_view type_name,
                     const json& document) -> Result<json>;

/// Redaction plan of the named type as JSON.
auto describe_plan(const schema::SchemaPool& pool,
                   redact::RedactorRegistry& registry,
                   std::string_view type_name) -> Result<json>;

/// Register the `redact` subcommand.
void register_redact_command(CLI::App& app, const GlobalOptions& options);

/// Register the `inspect` subcommand.
/// Prints the redaction plan of a message type.
void register_inspect_command(CLI::App& app, const GlobalOptions& options);

/// Register the `version` subcommand.
void register_version_command(CLI::App& app);

} // namespace redline::cli
