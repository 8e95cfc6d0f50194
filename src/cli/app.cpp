#include "redline/cli/app.hpp"
#include "redline/core/logger.hpp"

// Version string; typically injected by CMake via -DREDLINE_VERSION_STRING=...
#ifndef REDLINE_VERSION_STRING
#define REDLINE_VERSION_STRING "0.1.0-dev"
#endif

namespace redline::cli {

App::App()
    : cli_("redline", "Schema-driven message redaction")
{
    cli_.set_version_flag("--version", REDLINE_VERSION_STRING,
                          "Display version information");

    // Global option: config file path.
    cli_.add_option("-c,--config", options_.config_path,
                    "Path to configuration file (JSON)")
        ->envname("REDLINE_CONFIG")
        ->check(CLI::ExistingFile);

    // Global option: log level override; empty keeps the configured level.
    cli_.add_option("--log-level", options_.log_level,
                    "Log level (trace, debug, info, warn, error, critical, off)")
        ->check(CLI::Validator(
            [](std::string& value) -> std::string {
                if (Logger::parse_level(value)) return {};
                return "Unknown log level '" + value + "'";
            },
            "LEVEL"));

    // Require a subcommand.
    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        // Subcommand callbacks run inside parse().
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        Logger::flush();
        return cli_.exit(e);
    }

    Logger::flush();
    return 0;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::options() const -> const GlobalOptions& {
    return options_;
}

void App::setup_commands() {
    register_redact_command(cli_, options_);
    register_inspect_command(cli_, options_);
    register_version_command(cli_);
}

} // namespace redline::cli
