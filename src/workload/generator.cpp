/**
 * @file generator.cpp
 * @brief TraceGenerator implementation.
 *
 * Per job:
 *   1. class = Batch if U[0,1) < P_B, else Interactive
 *   2. draw JD, TD (floored at 1e-6) and JA from the class samplers
 *   3. arrival += JA * arrival_scale
 *   4. task_count = max(1, floor(JD / TD * duration_scale))
 *   5. app = uniform pick from the app pool
 *   6. task offsets = running sum of task_count inter-arrival draws
 */

#include "workload/generator.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>
#include <new>
#include <stdexcept>

namespace tracie {

Error trace_too_large(size_t job_count) {
    return Error{ErrorCode::ConfigurationError,
                 std::format("Trace of {} jobs does not fit in memory; "
                             "lower the job count or the duration scale", job_count)};
}

double round_to_micros(double seconds) noexcept {
    return std::round(seconds * 1e6) / 1e6;
}

Result<TraceGenerator> TraceGenerator::create(const WorkloadProfile& profile,
                                              GenerationOptions options) {
    if (!std::isfinite(options.arrival_scale) || options.arrival_scale < 0.0) {
        return Error{ErrorCode::ConfigurationError,
                     std::format("Arrival scale must be a finite value >= 0, got {}",
                                 options.arrival_scale)};
    }
    if (!std::isfinite(options.duration_scale) || options.duration_scale < 0.0) {
        return Error{ErrorCode::ConfigurationError,
                     std::format("Duration scale must be a finite value >= 0, got {}",
                                 options.duration_scale)};
    }

    uint64_t seed = options.seed.has_value()
        ? *options.seed
        : (static_cast<uint64_t>(std::random_device{}()) << 32) | std::random_device{}();
    return TraceGenerator(profile, options, seed);
}

TraceGenerator::TraceGenerator(const WorkloadProfile& profile, GenerationOptions options,
                               uint64_t seed)
    : profile_(&profile), options_(options), seed_(seed), rng_(seed) {}

std::optional<GeneratedJob> TraceGenerator::next() {
    if (produced_ >= options_.job_count) return std::nullopt;

    // 1. Job class
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    JobClass job_class = unit(rng_) < profile_->batch_probability()
        ? JobClass::Batch : JobClass::Interactive;
    auto samplers = profile_->samplers_for(job_class);

    // 2. Job-level draws
    double job_duration = samplers.job_duration->sample(rng_);
    double task_duration = std::max(samplers.task_duration->sample(rng_), kMinTaskDurationSec);
    double job_inter_arrival = samplers.job_inter_arrival->sample(rng_);

    // 3. Arrival: the scale applies to the gap, never to the absolute time
    t_total_ += job_inter_arrival * options_.arrival_scale;

    // 4. Task count
    uint32_t task_count = scaled_task_count(job_duration, task_duration);

    // 5. Application
    const auto& pool = profile_->app_pool();
    std::uniform_int_distribution<size_t> pick(0, pool.size() - 1);
    AppId app = pool[pick(rng_)];

    // 6. Task arrivals within the job
    TaskOffsets offsets;
    offsets.reserve(task_count);
    double task_time = 0.0;
    for (uint32_t i = 0; i < task_count; ++i) {
        task_time += samplers.task_inter_arrival->sample(rng_);
        offsets.push_back(round_to_micros(task_time));
    }

    GeneratedJob job{
        .record = JobRecord{
            .job_id = static_cast<JobId>(produced_),
            .arrival_time_sec = round_to_micros(t_total_),
            .job_class = job_class,
            .app_type = std::move(app),
            .task_count = task_count
        },
        .task_offsets = std::move(offsets)
    };
    ++produced_;
    return job;
}

uint32_t TraceGenerator::scaled_task_count(double job_duration, double task_duration) const {
    double raw = job_duration / task_duration;
    double scaled = std::floor(raw * options_.duration_scale);
    constexpr double kMax = static_cast<double>(std::numeric_limits<uint32_t>::max());
    if (!(scaled >= 1.0)) return 1;
    if (scaled >= kMax) return std::numeric_limits<uint32_t>::max();
    return static_cast<uint32_t>(scaled);
}

Result<std::vector<GeneratedJob>> generate(const WorkloadProfile& profile,
                                           const GenerationOptions& options) {
    auto generator = TraceGenerator::create(profile, options);
    if (!generator) {
        return generator.error();
    }

    std::vector<GeneratedJob> jobs;
    try {
        jobs.reserve(options.job_count);
        while (auto job = generator->next()) {
            jobs.push_back(std::move(*job));
        }
    } catch (const std::length_error&) {
        return trace_too_large(options.job_count);
    } catch (const std::bad_alloc&) {
        return trace_too_large(options.job_count);
    }
    return jobs;
}

}  // namespace tracie
