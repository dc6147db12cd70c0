/**
 * @file profile.cpp
 * @brief WorkloadProfile loading from TOML documents using toml++.
 */

#include "workload/profile.hpp"

#include <format>
#include <utility>

#include <toml++/toml.hpp>

namespace tracie {

namespace {

struct KeyName {
    std::string_view name;
    ParameterKey key;
};

constexpr std::array<KeyName, 8> kKeyNames{{
    {"J_D_B",   ParameterKey::JobDurationBatch},
    {"J_D_UF",  ParameterKey::JobDurationInteractive},
    {"T_D_B",   ParameterKey::TaskDurationBatch},
    {"T_D_UF",  ParameterKey::TaskDurationInteractive},
    {"J_AT_B",  ParameterKey::JobInterArrivalBatch},
    {"J_AT_UF", ParameterKey::JobInterArrivalInteractive},
    {"T_AT_B",  ParameterKey::TaskInterArrivalBatch},
    {"T_AT_UF", ParameterKey::TaskInterArrivalInteractive},
}};

Error config_error(std::string message) {
    return Error{ErrorCode::ConfigurationError, std::move(message)};
}

Result<DistributionSampler> parse_sampler(std::string_view key, const toml::node& node) {
    const auto* table = node.as_table();
    if (!table) {
        return config_error(std::format("parameters.{} must be a table", key));
    }

    auto type = (*table)["type"].value<std::string>();
    if (!type) {
        return config_error(std::format("parameters.{}.type is missing", key));
    }

    std::vector<double> params;
    if (const auto* list = (*table)["params"].as_array()) {
        params.reserve(list->size());
        for (const auto& element : *list) {
            auto number = element.value<double>();
            if (!number) {
                return config_error(std::format("parameters.{}.params must be numeric", key));
            }
            params.push_back(*number);
        }
    } else if ((*table).contains("params")) {
        return config_error(std::format("parameters.{}.params must be an array", key));
    }

    auto sampler = DistributionSampler::create(*type, std::move(params));
    if (!sampler) {
        return config_error(std::format("parameters.{}: {}", key, sampler.error().message));
    }
    return sampler;
}

Result<WorkloadProfile> from_table(const toml::table& tbl) {
    auto name = tbl["name"].value<std::string>();
    if (!name) {
        return config_error("Profile field 'name' is missing");
    }

    auto batch_probability = tbl["P_B"].value<double>();
    if (!batch_probability) {
        return config_error("Profile field 'P_B' is missing");
    }

    std::vector<AppId> app_pool;
    const auto* pool = tbl["app_pool"].as_array();
    if (!pool) {
        return config_error("Profile field 'app_pool' is missing");
    }
    for (const auto& element : *pool) {
        auto app = element.value<std::string>();
        if (!app) {
            return config_error("Profile field 'app_pool' must contain strings");
        }
        app_pool.push_back(std::move(*app));
    }

    const auto* parameters = tbl["parameters"].as_table();
    if (!parameters) {
        return config_error("Profile table 'parameters' is missing");
    }

    std::map<ParameterKey, DistributionSampler> samplers;
    for (auto&& [raw_key, node] : *parameters) {
        std::string_view key_name = raw_key.str();
        auto key = parse_parameter_key(key_name);
        if (!key) {
            return config_error(std::format("Unknown profile parameter '{}'", key_name));
        }
        auto sampler = parse_sampler(key_name, node);
        if (!sampler) {
            return sampler.error();
        }
        samplers.emplace(*key, std::move(*sampler));
    }

    return WorkloadProfile::create(std::move(*name), std::move(samplers),
                                   std::move(app_pool), *batch_probability);
}

}  // anonymous namespace

std::string_view to_string(ParameterKey key) noexcept {
    for (const auto& entry : kKeyNames) {
        if (entry.key == key) return entry.name;
    }
    return "unknown";
}

std::optional<ParameterKey> parse_parameter_key(std::string_view name) noexcept {
    for (const auto& entry : kKeyNames) {
        if (entry.name == name) return entry.key;
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────
// Loading
// ─────────────────────────────────────────────

Result<WorkloadProfile> WorkloadProfile::load(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return config_error("Profile file not found: " + path.string());
    }
    try {
        auto tbl = toml::parse_file(path.string());
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return config_error(std::format("Profile parse error in {}: {}",
                                        path.string(), err.description()));
    }
}

Result<WorkloadProfile> WorkloadProfile::parse(std::string_view toml_text) {
    try {
        auto tbl = toml::parse(toml_text);
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return config_error(std::format("Profile parse error: {}", err.description()));
    }
}

Result<WorkloadProfile> WorkloadProfile::create(std::string name,
                                                std::map<ParameterKey, DistributionSampler> samplers,
                                                std::vector<AppId> app_pool,
                                                double batch_probability) {
    for (auto key : kAllParameterKeys) {
        if (!samplers.contains(key)) {
            return config_error(std::format("Profile '{}' is missing parameter '{}'",
                                            name, to_string(key)));
        }
    }
    if (app_pool.empty()) {
        return config_error(std::format("Profile '{}' has an empty app_pool", name));
    }
    if (!(batch_probability >= 0.0 && batch_probability <= 1.0)) {
        return config_error(std::format("Profile '{}' has P_B = {} outside [0, 1]",
                                        name, batch_probability));
    }
    return WorkloadProfile(std::move(name), std::move(samplers),
                           std::move(app_pool), batch_probability);
}

WorkloadProfile::WorkloadProfile(std::string name,
                                 std::map<ParameterKey, DistributionSampler> samplers,
                                 std::vector<AppId> app_pool,
                                 double batch_probability)
    : name_(std::move(name))
    , samplers_(std::move(samplers))
    , app_pool_(std::move(app_pool))
    , batch_probability_(batch_probability) {}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

const DistributionSampler& WorkloadProfile::sampler(ParameterKey key) const {
    // Every key is present once create() has succeeded.
    return samplers_.at(key);
}

ClassSamplers WorkloadProfile::samplers_for(JobClass job_class) const {
    if (job_class == JobClass::Batch) {
        return ClassSamplers{
            .job_duration = &sampler(ParameterKey::JobDurationBatch),
            .task_duration = &sampler(ParameterKey::TaskDurationBatch),
            .job_inter_arrival = &sampler(ParameterKey::JobInterArrivalBatch),
            .task_inter_arrival = &sampler(ParameterKey::TaskInterArrivalBatch),
        };
    }
    return ClassSamplers{
        .job_duration = &sampler(ParameterKey::JobDurationInteractive),
        .task_duration = &sampler(ParameterKey::TaskDurationInteractive),
        .job_inter_arrival = &sampler(ParameterKey::JobInterArrivalInteractive),
        .task_inter_arrival = &sampler(ParameterKey::TaskInterArrivalInteractive),
    };
}

}  // namespace tracie
