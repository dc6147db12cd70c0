/**
 * @file profile.hpp
 * @brief Workload profile: named distributions, application pool, batch share.
 *
 * Profile document (TOML):
 *
 *   name = "Google 2011"
 *   P_B = 0.3
 *   app_pool = ["pi", "wordcount", "nginx"]
 *
 *   [parameters.J_D_B]
 *   type = "lognorm"
 *   params = [1.2, 0.0, 300.0]
 *   ...one table per parameter key...
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "workload/distribution.hpp"

#include <array>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tracie {

// ─────────────────────────────────────────────
// Parameter Keys
// ─────────────────────────────────────────────

enum class ParameterKey : uint8_t {
    JobDurationBatch,             ///< J_D_B
    JobDurationInteractive,       ///< J_D_UF
    TaskDurationBatch,            ///< T_D_B
    TaskDurationInteractive,      ///< T_D_UF
    JobInterArrivalBatch,         ///< J_AT_B
    JobInterArrivalInteractive,   ///< J_AT_UF
    TaskInterArrivalBatch,        ///< T_AT_B
    TaskInterArrivalInteractive   ///< T_AT_UF
};

inline constexpr std::array<ParameterKey, 8> kAllParameterKeys{
    ParameterKey::JobDurationBatch,     ParameterKey::JobDurationInteractive,
    ParameterKey::TaskDurationBatch,    ParameterKey::TaskDurationInteractive,
    ParameterKey::JobInterArrivalBatch, ParameterKey::JobInterArrivalInteractive,
    ParameterKey::TaskInterArrivalBatch, ParameterKey::TaskInterArrivalInteractive,
};

[[nodiscard]] std::string_view to_string(ParameterKey key) noexcept;
[[nodiscard]] std::optional<ParameterKey> parse_parameter_key(std::string_view name) noexcept;

/**
 * @brief The four samplers that drive one job class.
 */
struct ClassSamplers {
    const DistributionSampler* job_duration;
    const DistributionSampler* task_duration;
    const DistributionSampler* job_inter_arrival;
    const DistributionSampler* task_inter_arrival;
};

// ─────────────────────────────────────────────
// WorkloadProfile
// ─────────────────────────────────────────────

/**
 * @brief Read-only workload description consumed by the TraceGenerator.
 */
class WorkloadProfile {
public:
    /// Parse and validate a TOML profile file.
    static Result<WorkloadProfile> load(const std::filesystem::path& path);

    /// Parse and validate a TOML profile held in memory.
    static Result<WorkloadProfile> parse(std::string_view toml_text);

    /**
     * @brief Validate and assemble a profile from already-built samplers.
     *
     * Fails with ErrorCode::ConfigurationError when a parameter key is
     * missing, the app pool is empty, or batch_probability is outside [0, 1].
     */
    static Result<WorkloadProfile> create(std::string name,
                                          std::map<ParameterKey, DistributionSampler> samplers,
                                          std::vector<AppId> app_pool,
                                          double batch_probability);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::vector<AppId>& app_pool() const noexcept { return app_pool_; }
    [[nodiscard]] double batch_probability() const noexcept { return batch_probability_; }

    [[nodiscard]] const DistributionSampler& sampler(ParameterKey key) const;
    [[nodiscard]] ClassSamplers samplers_for(JobClass job_class) const;

private:
    WorkloadProfile(std::string name,
                    std::map<ParameterKey, DistributionSampler> samplers,
                    std::vector<AppId> app_pool,
                    double batch_probability);

    std::string name_;
    std::map<ParameterKey, DistributionSampler> samplers_;
    std::vector<AppId> app_pool_;
    double batch_probability_;
};

}  // namespace tracie
