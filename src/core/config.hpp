/**
 * @file config.hpp
 * @brief Executor configuration with TOML deserialization.
 */

#pragma once

#include <filesystem>
#include <string>

#include "core/result.hpp"

namespace tracie {

/// Durations used when a task or job is simulated rather than executed.
struct SimulationConfig {
    double interactive_task_sec = 0.05;   ///< Per-task sleep of an interactive job
    double batch_task_sec = 0.1;          ///< Per-task share of a simulated batch job
};

/// External batch engine (Hadoop MapReduce examples).
struct EngineConfig {
    bool enabled = true;                  ///< false = simulate every batch job
    std::string executable = "hadoop";
    std::string examples_jar =
        "/opt/hadoop/share/hadoop/mapreduce/hadoop-mapreduce-examples-3.4.1.jar";
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    std::string log_level = "info";       ///< "debug", "info", "warn", "error"
    std::string log_format = "text";      ///< "text", "json"
    bool events = true;                   ///< Write NDJSON replay events to log_dir
};

/**
 * @brief Top-level executor configuration.
 */
struct Config {
    SimulationConfig simulation;
    EngineConfig engine;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing tables and keys keep their defaults. The result is validated.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Check value ranges and enumerated names.
 */
Result<void> validate_config(const Config& config);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace tracie
