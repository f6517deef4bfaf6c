#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <stdexcept>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace turnstile;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("SchedulerConfig: default values", "[config]") {
    SchedulerConfig cfg;
    REQUIRE_FALSE(cfg.trace_dispatch);
    REQUIRE(cfg.max_drain_steps == 0);
}

TEST_CASE("SchedulerConfig::defaults_json matches struct defaults", "[config]") {
    auto j = SchedulerConfig::defaults_json();
    REQUIRE(j["trace_dispatch"] == false);
    REQUIRE(j["max_drain_steps"] == 0);
    REQUIRE(SchedulerConfig{}.to_json() == j);
}

// ── from_json ────────────────────────────────────────────────────

TEST_CASE("SchedulerConfig::from_json: reads fields", "[config]") {
    auto cfg = SchedulerConfig::from_json({{"trace_dispatch", true}, {"max_drain_steps", 64}});
    REQUIRE(cfg.trace_dispatch);
    REQUIRE(cfg.max_drain_steps == 64);
}

TEST_CASE("SchedulerConfig::from_json: missing fields keep defaults", "[config]") {
    auto cfg = SchedulerConfig::from_json(nlohmann::json::object());
    REQUIRE_FALSE(cfg.trace_dispatch);
    REQUIRE(cfg.max_drain_steps == 0);
}

TEST_CASE("SchedulerConfig::from_json: unknown fields are ignored", "[config]") {
    auto cfg = SchedulerConfig::from_json({{"color", "blue"}, {"max_drain_steps", 3}});
    REQUIRE(cfg.max_drain_steps == 3);
}

TEST_CASE("SchedulerConfig::from_json: wrong types throw", "[config]") {
    REQUIRE_THROWS_AS(SchedulerConfig::from_json({{"trace_dispatch", "yes"}}),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(SchedulerConfig::from_json({{"max_drain_steps", -1}}),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(SchedulerConfig::from_json(nlohmann::json::array()),
                      std::invalid_argument);
}

TEST_CASE("SchedulerConfig: to_json round trips through from_json", "[config]") {
    SchedulerConfig cfg;
    cfg.trace_dispatch = true;
    cfg.max_drain_steps = 12;
    auto back = SchedulerConfig::from_json(cfg.to_json());
    REQUIRE(back.trace_dispatch);
    REQUIRE(back.max_drain_steps == 12);
}

// ── SchedulerConfig::load ────────────────────────────────────────

// Helper: create a temp directory
static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "turnstile_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        unsetenv("TURNSTILE_TRACE_DISPATCH");
        unsetenv("TURNSTILE_MAX_DRAIN_STEPS");
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        unsetenv("TURNSTILE_TRACE_DISPATCH");
        unsetenv("TURNSTILE_MAX_DRAIN_STEPS");
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.turnstile/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.turnstile");
        std::ofstream f(config_path());
        f << content;
    }
};

TEST_CASE("SchedulerConfig::load: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({ "trace_dispatch": true, "max_drain_steps": 500 })");

    auto cfg = SchedulerConfig::load(g.config_path());
    REQUIRE(cfg.trace_dispatch);
    REQUIRE(cfg.max_drain_steps == 500);
}

TEST_CASE("SchedulerConfig::load: expands ~ to HOME", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({ "max_drain_steps": 7 })");

    auto cfg = SchedulerConfig::load("~/.turnstile/config.json");
    REQUIRE(cfg.max_drain_steps == 7);
    REQUIRE_FALSE(cfg.trace_dispatch);
}

TEST_CASE("SchedulerConfig::load: missing file uses defaults", "[config]") {
    ConfigTestGuard g;
    auto cfg = SchedulerConfig::load(g.config_path());
    REQUIRE_FALSE(cfg.trace_dispatch);
    REQUIRE(cfg.max_drain_steps == 0);
    // load never writes the file
    REQUIRE_FALSE(std::filesystem::exists(g.config_path()));
}

TEST_CASE("SchedulerConfig::load: malformed file uses defaults", "[config]") {
    ConfigTestGuard g;
    g.write_config("{ not json");

    auto cfg = SchedulerConfig::load(g.config_path());
    REQUIRE_FALSE(cfg.trace_dispatch);
    REQUIRE(cfg.max_drain_steps == 0);
}

TEST_CASE("SchedulerConfig::load: wrongly typed field uses defaults", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({ "trace_dispatch": "loud", "max_drain_steps": 9 })");

    auto cfg = SchedulerConfig::load(g.config_path());
    REQUIRE_FALSE(cfg.trace_dispatch);
    REQUIRE(cfg.max_drain_steps == 0);
}

TEST_CASE("SchedulerConfig::load: env vars override file", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({ "trace_dispatch": false, "max_drain_steps": 5 })");
    setenv("TURNSTILE_TRACE_DISPATCH", "on", 1);
    setenv("TURNSTILE_MAX_DRAIN_STEPS", " 42 ", 1);

    auto cfg = SchedulerConfig::load(g.config_path());
    REQUIRE(cfg.trace_dispatch);
    REQUIRE(cfg.max_drain_steps == 42);
}

TEST_CASE("SchedulerConfig::load: invalid env values are ignored", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({ "trace_dispatch": true, "max_drain_steps": 5 })");
    setenv("TURNSTILE_TRACE_DISPATCH", "maybe", 1);
    setenv("TURNSTILE_MAX_DRAIN_STEPS", "-3", 1);

    auto cfg = SchedulerConfig::load(g.config_path());
    REQUIRE(cfg.trace_dispatch);
    REQUIRE(cfg.max_drain_steps == 5);

    setenv("TURNSTILE_MAX_DRAIN_STEPS", "lots", 1);
    REQUIRE(SchedulerConfig::load(g.config_path()).max_drain_steps == 5);
}
