/**
 * @file generator.hpp
 * @brief Distribution-driven synthetic trace generator.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "workload/distribution.hpp"
#include "workload/profile.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace tracie {

/// Floor applied to task-duration draws before dividing by them.
inline constexpr double kMinTaskDurationSec = 1e-6;

/**
 * @brief One generated job and its task arrival offsets.
 */
struct GeneratedJob {
    JobRecord record;
    TaskOffsets task_offsets;
};

struct GenerationOptions {
    size_t job_count = 0;
    double arrival_scale = 1.0;            ///< Multiplies every job inter-arrival draw (-wSat)
    double duration_scale = 1.0;           ///< Multiplies the raw task count JD / TD (-jSD)
    std::optional<uint64_t> seed;          ///< Fixed seed = reproducible trace
};

/// Round to microsecond precision (6 decimal digits).
[[nodiscard]] double round_to_micros(double seconds) noexcept;

/**
 * @brief Finite, forward-only sequence of generated jobs.
 *
 * Produces exactly `job_count` jobs, one per next() call. The sequence cannot
 * be rewound: a second identical run needs a new generator with the same seed.
 * The profile must outlive the generator.
 */
class TraceGenerator {
public:
    /**
     * @brief Validate options and seed the random stream.
     *
     * Fails with ErrorCode::ConfigurationError for negative or non-finite
     * scale factors.
     */
    static Result<TraceGenerator> create(const WorkloadProfile& profile, GenerationOptions options);

    /// Next job, or std::nullopt once job_count jobs have been produced.
    std::optional<GeneratedJob> next();

    [[nodiscard]] size_t remaining() const noexcept { return options_.job_count - produced_; }
    [[nodiscard]] size_t produced() const noexcept { return produced_; }
    [[nodiscard]] uint64_t seed() const noexcept { return seed_; }

    /// Running (unrounded) arrival total after the last produced job.
    [[nodiscard]] double elapsed_arrival_sec() const noexcept { return t_total_; }

private:
    TraceGenerator(const WorkloadProfile& profile, GenerationOptions options, uint64_t seed);

    uint32_t scaled_task_count(double job_duration, double task_duration) const;

    const WorkloadProfile* profile_;
    GenerationOptions options_;
    uint64_t seed_;
    RandomEngine rng_;
    size_t produced_{0};
    double t_total_{0.0};
};

/// ConfigurationError for a trace that cannot be allocated.
[[nodiscard]] Error trace_too_large(size_t job_count);

/**
 * @brief Generate a whole trace in one call.
 *
 * Fails with ErrorCode::ConfigurationError when the trace cannot be held in
 * memory.
 */
Result<std::vector<GeneratedJob>> generate(const WorkloadProfile& profile,
                                           const GenerationOptions& options);

}  // namespace tracie
