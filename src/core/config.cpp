/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <cmath>

#include <toml++/toml.hpp>

namespace tracie {

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::ConfigurationError,
                     "Configuration file not found: " + path.string()};
    }

    Config config;
    try {
        auto tbl = toml::parse_file(path.string());

        // [simulation]
        if (auto sim = tbl["simulation"]; sim.is_table()) {
            config.simulation.interactive_task_sec =
                sim["interactive_task_sec"].value_or(config.simulation.interactive_task_sec);
            config.simulation.batch_task_sec =
                sim["batch_task_sec"].value_or(config.simulation.batch_task_sec);
        }

        // [engine]
        if (auto engine = tbl["engine"]; engine.is_table()) {
            config.engine.enabled = engine["enabled"].value_or(config.engine.enabled);
            config.engine.executable =
                engine["executable"].value_or(config.engine.executable);
            config.engine.examples_jar =
                engine["examples_jar"].value_or(config.engine.examples_jar);
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir =
                telemetry["log_dir"].value_or(config.telemetry.log_dir.string());
            config.telemetry.log_level =
                telemetry["log_level"].value_or(config.telemetry.log_level);
            config.telemetry.log_format =
                telemetry["log_format"].value_or(config.telemetry.log_format);
            config.telemetry.events = telemetry["events"].value_or(config.telemetry.events);
        }

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ConfigurationError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }

    if (auto valid = validate_config(config); !valid) {
        return valid.error();
    }
    return config;
}

Result<void> validate_config(const Config& config) {
    auto valid_duration = [](double sec) { return std::isfinite(sec) && sec >= 0.0; };

    if (!valid_duration(config.simulation.interactive_task_sec)) {
        return Error{ErrorCode::ConfigurationError,
                     "simulation.interactive_task_sec must be a finite value >= 0"};
    }
    if (!valid_duration(config.simulation.batch_task_sec)) {
        return Error{ErrorCode::ConfigurationError,
                     "simulation.batch_task_sec must be a finite value >= 0"};
    }
    if (config.engine.enabled && config.engine.executable.empty()) {
        return Error{ErrorCode::ConfigurationError, "engine.executable is empty"};
    }
    if (!parse_log_level(config.telemetry.log_level)) {
        return Error{ErrorCode::ConfigurationError,
                     "Unknown telemetry.log_level: " + config.telemetry.log_level};
    }
    if (!parse_log_format(config.telemetry.log_format)) {
        return Error{ErrorCode::ConfigurationError,
                     "Unknown telemetry.log_format: " + config.telemetry.log_format};
    }
    return {};
}

Config default_config() {
    return Config{};
}

}  // namespace tracie
