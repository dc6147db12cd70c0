/**
 * @file engine_command.cpp
 * @brief Command template expansion and the default template registry.
 */

#include "executor/engine_command.hpp"

#include <format>

namespace tracie {

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

std::string output_location(const std::string& prefix, JobId id) {
    return std::format("{}_{}", prefix, id);
}

}  // anonymous namespace

std::string EngineCommand::to_string() const {
    std::string line = executable;
    for (const auto& arg : args) {
        line += ' ';
        line += arg;
    }
    return line;
}

std::vector<std::string> operation_args(const CommandTemplate& tmpl, const JobRecord& job) {
    return std::visit(overloaded{
        [&](const MapCountCommand& c) -> std::vector<std::string> {
            return {c.operation, std::to_string(job.task_count), std::to_string(c.samples_per_map)};
        },
        [&](const StagedInputCommand& c) -> std::vector<std::string> {
            std::vector<std::string> args{c.operation, c.input_dir,
                                          output_location(c.output_prefix, job.job_id)};
            args.insert(args.end(), c.extra_args.begin(), c.extra_args.end());
            return args;
        },
        [&](const RowCountCommand& c) -> std::vector<std::string> {
            uint64_t rows = static_cast<uint64_t>(job.task_count) * c.rows_per_task;
            return {c.operation, std::to_string(rows),
                    output_location(c.output_prefix, job.job_id)};
        },
    }, tmpl);
}

CommandRegistry CommandRegistry::hadoop_examples() {
    CommandRegistry registry;
    registry.add("pi", MapCountCommand{.operation = "pi", .samples_per_map = 1000});
    registry.add("wordcount", StagedInputCommand{
        .operation = "wordcount",
        .input_dir = "/inputs/wordcount_data",
        .output_prefix = "/outputs/wordcount",
        .extra_args = {}
    });
    registry.add("grep", StagedInputCommand{
        .operation = "grep",
        .input_dir = "/inputs/grep_data",
        .output_prefix = "/outputs/grep",
        .extra_args = {"Tracie"}
    });
    // teragen only: the generated data size follows the task count.
    registry.add("terasort", RowCountCommand{
        .operation = "teragen",
        .rows_per_task = 1000,
        .output_prefix = "/outputs/teragen"
    });
    return registry;
}

void CommandRegistry::add(AppId app, CommandTemplate tmpl) {
    templates_.insert_or_assign(std::move(app), std::move(tmpl));
}

bool CommandRegistry::contains(std::string_view app) const {
    return templates_.find(app) != templates_.end();
}

const CommandTemplate* CommandRegistry::find(std::string_view app) const {
    auto it = templates_.find(app);
    return it == templates_.end() ? nullptr : &it->second;
}

std::optional<EngineCommand> CommandRegistry::build(const JobRecord& job,
                                                    const EngineConfig& engine) const {
    const auto* tmpl = find(job.app_type);
    if (!tmpl) return std::nullopt;

    EngineCommand command{.executable = engine.executable, .args = {"jar", engine.examples_jar}};
    auto op_args = operation_args(*tmpl, job);
    command.args.insert(command.args.end(), op_args.begin(), op_args.end());
    return command;
}

}  // namespace tracie
