#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace turnstile {

struct SchedulerConfig {
    bool trace_dispatch = false;  // log every dispatch to stderr
    uint32_t max_drain_steps = 0; // 0 = drain() runs until the queue is empty

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Read fields over the defaults. Throws std::invalid_argument when a
    // known field has the wrong JSON type.
    static SchedulerConfig from_json(const nlohmann::json& j);

    // Load from a JSON file (~ expanded) + env vars.
    // Missing or malformed file falls back to defaults.
    static SchedulerConfig load(const std::string& path);

    nlohmann::json to_json() const;
};

} // namespace turnstile
