#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace turnstile {

nlohmann::json SchedulerConfig::defaults_json() {
    return {
        {"trace_dispatch", false},
        {"max_drain_steps", 0}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

SchedulerConfig SchedulerConfig::from_json(const nlohmann::json& j) {
    SchedulerConfig cfg;
    if (!j.is_object()) {
        throw std::invalid_argument("scheduler config must be a JSON object");
    }

    if (j.contains("trace_dispatch")) {
        if (!j["trace_dispatch"].is_boolean())
            throw std::invalid_argument("trace_dispatch must be a boolean");
        cfg.trace_dispatch = j["trace_dispatch"].get<bool>();
    }
    if (j.contains("max_drain_steps")) {
        const auto& steps = j["max_drain_steps"];
        constexpr auto kMax = std::numeric_limits<uint32_t>::max();
        bool in_range = steps.is_number_unsigned()
            ? steps.get<uint64_t>() <= kMax
            : steps.is_number_integer() && steps.get<int64_t>() >= 0 &&
              steps.get<int64_t>() <= kMax;
        if (!in_range)
            throw std::invalid_argument("max_drain_steps must be a non-negative 32-bit integer");
        cfg.max_drain_steps = steps.get<uint32_t>();
    }
    return cfg;
}

SchedulerConfig SchedulerConfig::load(const std::string& path) {
    std::string config_path = expand_home(path);
    SchedulerConfig cfg;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json j = merge_defaults(nlohmann::json::parse(file),
                                              defaults_json());
            cfg = from_json(j);
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed config " << config_path
                      << ", using defaults: " << e.what() << "\n";
            cfg = SchedulerConfig{};
        } catch (const std::invalid_argument& e) {
            std::cerr << "[config] Invalid config " << config_path
                      << ", using defaults: " << e.what() << "\n";
            cfg = SchedulerConfig{};
        }
    }

    // Environment variables always override config file
    if (const char* v = std::getenv("TURNSTILE_TRACE_DISPATCH"))
        cfg.trace_dispatch = parse_bool(v, cfg.trace_dispatch);
    if (const char* v = std::getenv("TURNSTILE_MAX_DRAIN_STEPS")) {
        std::string value = trim(v);
        try {
            if (value.empty() || value[0] == '-')
                throw std::invalid_argument("negative or empty");
            unsigned long steps = std::stoul(value);
            if (steps > std::numeric_limits<uint32_t>::max())
                throw std::out_of_range("too large");
            cfg.max_drain_steps = static_cast<uint32_t>(steps);
        } catch (const std::exception&) {
            std::cerr << "[config] Ignoring invalid TURNSTILE_MAX_DRAIN_STEPS: "
                      << v << "\n";
        }
    }

    return cfg;
}

nlohmann::json SchedulerConfig::to_json() const {
    return {
        {"trace_dispatch", trace_dispatch},
        {"max_drain_steps", max_drain_steps}
    };
}

} // namespace turnstile
