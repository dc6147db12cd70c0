/**
 * @file executor_main.cpp
 * @brief tracie_execute: replay a generated trace against the wall clock.
 *
 * Wires the replay pipeline:
 *   Config → Logger → Telemetry → Trace → JobRunner → ReplayScheduler
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/engine_command.hpp"
#include "executor/job_runner.hpp"
#include "executor/process_launcher.hpp"
#include "scheduler/replay_scheduler.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"
#include "workload/trace_io.hpp"

#include <pthread.h>
#include <signal.h>
#include <unistd.h>

#include <csignal>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

using namespace tracie;

namespace {

// Sent to the signal watcher to end it after a normal run.
constexpr int kWatcherWakeSignal = SIGUSR1;

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║              Tracie Executor              ║
  ║   Open-loop replay of synthetic traces    ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path jobs_file = "generated_jobs.csv";
    std::filesystem::path tasks_file = "generated_tasks.csv";
    std::optional<double> uf_task_time;
    std::optional<double> batch_task_time;
    std::optional<std::filesystem::path> config_path;
    std::string log_dir;
    bool no_confirm = false;
};

void print_usage() {
    std::cout << "Usage: tracie_execute [OPTIONS]\n"
              << "  --jobs-file <path>        Jobs CSV (default: generated_jobs.csv)\n"
              << "  --tasks-file <path>       Tasks CSV (default: generated_tasks.csv)\n"
              << "  --uf-task-time <sec>      Simulated duration of one interactive task (default: 0.05)\n"
              << "  --batch-task-time <sec>   Simulated duration per batch task (default: 0.1)\n"
              << "  --config <path>           Executor configuration (TOML)\n"
              << "  --log-dir <path>          Event log output directory\n"
              << "  --no-confirm              Start the replay without waiting for Enter\n"
              << "  --help, -h                Show this help message\n";
}

[[noreturn]] void usage_error(const std::string& message) {
    std::cerr << "tracie_execute: " << message << "\n";
    print_usage();
    std::exit(1);
}

double parse_seconds(const std::string& flag, const std::string& text) {
    try {
        size_t used = 0;
        double value = std::stod(text, &used);
        if (used == text.size()) return value;
    } catch (const std::exception&) {
    }
    usage_error(std::format("{} expects a number of seconds, got '{}'", flag, text));
}

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto needs_value = [&]() -> std::string {
            if (i + 1 >= argc) usage_error(arg + " requires a value");
            return argv[++i];
        };

        if (arg == "--jobs-file") {
            args.jobs_file = needs_value();
        } else if (arg == "--tasks-file") {
            args.tasks_file = needs_value();
        } else if (arg == "--uf-task-time") {
            args.uf_task_time = parse_seconds(arg, needs_value());
        } else if (arg == "--batch-task-time") {
            args.batch_task_time = parse_seconds(arg, needs_value());
        } else if (arg == "--config") {
            args.config_path = needs_value();
        } else if (arg == "--log-dir") {
            args.log_dir = needs_value();
        } else if (arg == "--no-confirm") {
            args.no_confirm = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            usage_error("unknown option " + arg);
        }
    }
    return args;
}

Result<Config> resolve_config(const CLIArgs& args) {
    Config config = default_config();
    if (args.config_path) {
        auto loaded = load_config(*args.config_path);
        if (!loaded) return loaded.error();
        config = std::move(*loaded);
    }

    if (args.uf_task_time) config.simulation.interactive_task_sec = *args.uf_task_time;
    if (args.batch_task_time) config.simulation.batch_task_sec = *args.batch_task_time;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;

    if (auto valid = validate_config(config); !valid) return valid.error();
    return config;
}

/// Blocks until the operator presses Enter; skipped when stdin is not a terminal.
void wait_for_confirmation(bool no_confirm) {
    if (no_confirm || !::isatty(STDIN_FILENO)) return;
    std::cout << "Press Enter to start the replay (Ctrl+C aborts)..." << std::flush;
    std::string line;
    std::getline(std::cin, line);
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    print_banner();

    auto config_result = resolve_config(args);
    if (!config_result) {
        std::cerr << "Configuration error: " << config_result.error().message << std::endl;
        return 1;
    }
    const Config config = std::move(*config_result);

    // ── Initialize Logger ────────────────────
    Logger logger(std::make_unique<StdoutSink>(),
                  parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info),
                  parse_log_format(config.telemetry.log_format).value_or(LogFormat::Text));

    // ── Initialize Telemetry ─────────────────
    std::unique_ptr<ILogSink> event_sink;
    if (config.telemetry.events) {
        auto file_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "tracie_events");
        if (!file_sink->is_open()) {
            logger.warn("Could not open event log in " + config.telemetry.log_dir.string()
                        + ", events disabled");
            event_sink = std::make_unique<NullSink>();
        } else {
            logger.info("Event log: " + file_sink->current_path().string());
            event_sink = std::move(file_sink);
        }
    } else {
        event_sink = std::make_unique<NullSink>();
    }
    MetricsCollector metrics(std::move(event_sink));

    logger.info(std::format("Interactive task time: {}s", config.simulation.interactive_task_sec));
    logger.info(std::format("Batch task time:       {}s", config.simulation.batch_task_sec));
    if (config.engine.enabled) {
        logger.info("Engine: " + config.engine.executable + " jar " + config.engine.examples_jar);
    } else {
        logger.info("Engine: disabled, every batch job is simulated");
    }

    // ── Load Trace ───────────────────────────
    auto trace = load_trace(args.jobs_file, args.tasks_file);
    if (!trace) {
        logger.error("Failed to load trace: " + trace.error().message);
        return 1;
    }
    if (trace->empty()) {
        logger.info("Trace contains no jobs, nothing to replay");
        return 0;
    }
    logger.info(std::format("Loaded {} jobs from {}", trace->jobs.size(), args.jobs_file.string()));

    wait_for_confirmation(args.no_confirm);

    // ── Signal Handling ──────────────────────
    // SIGINT/SIGTERM are blocked in every thread and consumed by one watcher,
    // which turns them into a stop request.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    sigaddset(&signals, kWatcherWakeSignal);
    if (int rc = pthread_sigmask(SIG_BLOCK, &signals, nullptr); rc != 0) {
        logger.error(std::format("pthread_sigmask failed: {}", rc));
        return 1;
    }

    std::stop_source interrupt;
    std::jthread signal_watcher([&signals, &interrupt, &logger] {
        int received = 0;
        if (sigwait(&signals, &received) != 0 || received == kWatcherWakeSignal) return;
        logger.warn(std::format("Received signal {}, stopping replay", received));
        interrupt.request_stop();
    });

    // ── Replay ───────────────────────────────
    CommandRegistry registry = config.engine.enabled ? CommandRegistry::hadoop_examples()
                                                     : CommandRegistry{};
    PosixProcessLauncher launcher;
    JobRunner runner(config.simulation, config.engine, std::move(registry),
                     launcher, logger, metrics);
    ReplayScheduler scheduler(runner, logger, metrics);

    logger.info("--- Replay starting (T0) ---");
    auto summary = scheduler.replay(*trace, interrupt.get_token());

    if (!summary) {
        logger.error("Replay aborted: " + summary.error().message);
        metrics.flush();
        logger.flush();
        // Job threads may still be running detached; leave without unwinding.
        std::quick_exit(1);
    }

    pthread_kill(signal_watcher.native_handle(), kWatcherWakeSignal);

    logger.info("--- Replay finished ---");
    logger.info(std::format("Total simulated time: {:.2f}s", summary->elapsed_sec));
    logger.info(std::format("Jobs: {} dispatched, {} completed, {} failed, {} cancelled",
                            summary->dispatched, summary->completed,
                            summary->failed, summary->cancelled));
    for (const auto& outcome : summary->outcomes) {
        if (outcome.state != JobState::Failed) continue;
        logger.warn(std::format("  Job {} ({}, app {}): {}", outcome.job_id,
                                to_string(outcome.mode), outcome.app_type,
                                outcome.error ? outcome.error->message : "failed"));
    }

    metrics.flush();
    logger.flush();
    return 0;
}
