/**
 * @file generator_main.cpp
 * @brief tracie_generate: synthesize a job trace from a workload profile.
 *
 * Profile → TraceGenerator → jobs CSV + tasks CSV
 */

#include "core/logger.hpp"
#include "core/result.hpp"
#include "telemetry/json_sink.hpp"
#include "workload/generator.hpp"
#include "workload/profile.hpp"
#include "workload/trace_io.hpp"

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <new>
#include <optional>
#include <stdexcept>
#include <string>

using namespace tracie;

namespace {

struct CLIArgs {
    std::filesystem::path profile_path;
    std::optional<size_t> num_jobs;
    double w_sat = 1.0;
    double j_sd = 1.0;
    std::optional<uint64_t> seed;
    std::filesystem::path jobs_file = "generated_jobs.csv";
    std::filesystem::path tasks_file = "generated_tasks.csv";
};

void print_usage() {
    std::cout << "Usage: tracie_generate -p <profile.toml> -n <jobs> [OPTIONS]\n"
              << "  -p, --profile <path>    Workload profile (TOML)\n"
              << "  -n, --num-jobs <n>      Number of jobs to generate\n"
              << "  -wSat, --w-sat <x>      Scale job inter-arrival times (default: 1.0)\n"
              << "  -jSD, --j-sd <x>        Scale the task count of every job (default: 1.0)\n"
              << "  --seed <n>              Fixed RNG seed for a reproducible trace\n"
              << "  --jobs-file <path>      Jobs CSV output (default: generated_jobs.csv)\n"
              << "  --tasks-file <path>     Tasks CSV output (default: generated_tasks.csv)\n"
              << "  --help, -h              Show this help message\n";
}

[[noreturn]] void usage_error(const std::string& message) {
    std::cerr << "tracie_generate: " << message << "\n";
    print_usage();
    std::exit(1);
}

double parse_double(const std::string& flag, const std::string& text) {
    try {
        size_t used = 0;
        double value = std::stod(text, &used);
        if (used == text.size()) return value;
    } catch (const std::exception&) {
    }
    usage_error(std::format("{} expects a number, got '{}'", flag, text));
}

uint64_t parse_unsigned(const std::string& flag, const std::string& text) {
    try {
        size_t used = 0;
        if (!text.empty() && text.front() != '-') {
            uint64_t value = std::stoull(text, &used);
            if (used == text.size()) return value;
        }
    } catch (const std::exception&) {
    }
    usage_error(std::format("{} expects a non-negative integer, got '{}'", flag, text));
}

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto needs_value = [&]() -> std::string {
            if (i + 1 >= argc) usage_error(arg + " requires a value");
            return argv[++i];
        };

        if (arg == "-p" || arg == "--profile") {
            args.profile_path = needs_value();
        } else if (arg == "-n" || arg == "--num-jobs") {
            args.num_jobs = static_cast<size_t>(parse_unsigned(arg, needs_value()));
        } else if (arg == "-wSat" || arg == "--w-sat") {
            args.w_sat = parse_double(arg, needs_value());
        } else if (arg == "-jSD" || arg == "--j-sd") {
            args.j_sd = parse_double(arg, needs_value());
        } else if (arg == "--seed") {
            args.seed = parse_unsigned(arg, needs_value());
        } else if (arg == "--jobs-file") {
            args.jobs_file = needs_value();
        } else if (arg == "--tasks-file") {
            args.tasks_file = needs_value();
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            usage_error("unknown option " + arg);
        }
    }

    if (args.profile_path.empty()) usage_error("missing --profile");
    if (!args.num_jobs) usage_error("missing --num-jobs");
    return args;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);

    Logger logger(std::make_unique<StdoutSink>(), LogLevel::Info, LogFormat::Text);

    auto profile = WorkloadProfile::load(args.profile_path);
    if (!profile) {
        logger.error(std::format("Failed to load profile: {}", profile.error().message));
        return 1;
    }
    logger.info(std::format("Profile '{}' loaded: P_B={}, {} applications",
                            profile->name(), profile->batch_probability(),
                            profile->app_pool().size()));

    auto generator = TraceGenerator::create(*profile, GenerationOptions{
        .job_count = *args.num_jobs,
        .arrival_scale = args.w_sat,
        .duration_scale = args.j_sd,
        .seed = args.seed,
    });
    if (!generator) {
        logger.error(std::format("Invalid generation options: {}", generator.error().message));
        return 1;
    }
    logger.info(std::format("Generating {} jobs (wSat={}, jSD={}, seed={})",
                            *args.num_jobs, args.w_sat, args.j_sd, generator->seed()));

    std::vector<GeneratedJob> jobs;
    size_t batch = 0;
    uint64_t total_tasks = 0;
    try {
        jobs.reserve(*args.num_jobs);
        while (auto job = generator->next()) {
            if (job->record.job_class == JobClass::Batch) ++batch;
            total_tasks += job->record.task_count;
            logger.debug(std::format("Job {}: t={}s type={} app={} tasks={}",
                                     job->record.job_id, job->record.arrival_time_sec,
                                     to_token(job->record.job_class), job->record.app_type,
                                     job->record.task_count));
            jobs.push_back(std::move(*job));
        }
    } catch (const std::length_error&) {
        logger.error(trace_too_large(*args.num_jobs).message);
        return 1;
    } catch (const std::bad_alloc&) {
        logger.error(trace_too_large(*args.num_jobs).message);
        return 1;
    }

    if (auto written = write_trace(jobs, args.jobs_file, args.tasks_file); !written) {
        logger.error(std::format("Failed to write trace: {}", written.error().message));
        return 1;
    }

    logger.info(std::format("Wrote {} jobs ({} batch, {} interactive, {} tasks) spanning {:.2f}s",
                            jobs.size(), batch, jobs.size() - batch, total_tasks,
                            generator->elapsed_arrival_sec()));
    logger.info("Jobs:  " + args.jobs_file.string());
    logger.info("Tasks: " + args.tasks_file.string());
    return 0;
}
