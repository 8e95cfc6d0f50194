#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "redline/core/config.hpp"

TEST_CASE("default_config returns sane defaults", "[config]") {
    auto cfg = redline::default_config();

    CHECK(cfg.log_level == "info");
    CHECK(cfg.schema_paths.empty());
    CHECK(cfg.output.indent == 2);
}

TEST_CASE("load_config parses JSON file correctly", "[config]") {
    namespace fs = std::filesystem;

    auto tmp = fs::temp_directory_path() / "redline_test_config.json";
    {
        std::ofstream out(tmp);
        out << R"({
            "log_level": "debug",
            "schema_paths": ["/etc/redline/a.json", "/etc/redline/b.json"],
            "output": { "indent": -1 }
        })";
    }

    auto cfg = redline::load_config(tmp);

    CHECK(cfg.log_level == "debug");
    REQUIRE(cfg.schema_paths.size() == 2);
    CHECK(cfg.schema_paths[1] == "/etc/redline/b.json");
    CHECK(cfg.output.indent == -1);

    fs::remove(tmp);
}

TEST_CASE("load_config accepts a single schema path string", "[config]") {
    namespace fs = std::filesystem;

    auto tmp = fs::temp_directory_path() / "redline_test_config_single.json";
    {
        std::ofstream out(tmp);
        out << R"({ "schema_paths": "/srv/schema.json" })";
    }

    auto cfg = redline::load_config(tmp);

    REQUIRE(cfg.schema_paths.size() == 1);
    CHECK(cfg.schema_paths[0] == "/srv/schema.json");
    // Non-specified fields keep defaults
    CHECK(cfg.output.indent == 2);

    fs::remove(tmp);
}

TEST_CASE("load_config returns defaults for missing or broken file", "[config]") {
    SECTION("missing file") {
        auto cfg = redline::load_config("/nonexistent/path/config.json");
        CHECK(cfg.log_level == "info");
    }

    SECTION("invalid JSON") {
        namespace fs = std::filesystem;
        auto tmp = fs::temp_directory_path() / "redline_test_config_broken.json";
        {
            std::ofstream out(tmp);
            out << "{ not json";
        }
        auto cfg = redline::load_config(tmp);
        CHECK(cfg.log_level == "info");
        CHECK(cfg.schema_paths.empty());
        fs::remove(tmp);
    }
}

TEST_CASE("load_config_from_env reads environment variables", "[config]") {
    ::setenv("REDLINE_LOG_LEVEL", "trace", 1);
    ::setenv("REDLINE_SCHEMA_PATH", "/a.json::/b.json", 1);
    ::setenv("REDLINE_OUTPUT_INDENT", "4", 1);

    auto cfg = redline::load_config_from_env();

    CHECK(cfg.log_level == "trace");
    REQUIRE(cfg.schema_paths.size() == 2);
    CHECK(cfg.schema_paths[0] == "/a.json");
    CHECK(cfg.schema_paths[1] == "/b.json");
    CHECK(cfg.output.indent == 4);

    ::unsetenv("REDLINE_LOG_LEVEL");
    ::unsetenv("REDLINE_SCHEMA_PATH");
    ::unsetenv("REDLINE_OUTPUT_INDENT");
}

TEST_CASE("Config round-trips through JSON", "[config]") {
    redline::Config cfg;
    cfg.log_level = "warn";
    cfg.schema_paths = {"x.json"};
    cfg.output.indent = 0;

    redline::json j = cfg;
    auto restored = j.get<redline::Config>();

    CHECK(restored.log_level == "warn");
    CHECK(restored.schema_paths == std::vector<std::string>{"x.json"});
    CHECK(restored.output.indent == 0);
}
