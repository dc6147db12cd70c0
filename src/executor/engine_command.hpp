/**
 * @file engine_command.hpp
 * @brief Per-application command templates for the external batch engine.
 *
 * Each template is one alternative of a std::variant and states which job
 * fields it consumes: MapCountCommand and RowCountCommand scale with the
 * task count, StagedInputCommand ignores it and needs input staged on the
 * engine's filesystem beforehand.
 */

#pragma once

#include "core/config.hpp"
#include "core/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tracie {

/**
 * @brief A fully built engine invocation (argv form, no shell involved).
 */
struct EngineCommand {
    std::string executable;
    std::vector<std::string> args;

    /// Space-joined command line, for logging.
    [[nodiscard]] std::string to_string() const;
};

/// <operation> <task_count> <samples_per_map>
struct MapCountCommand {
    std::string operation;
    uint32_t samples_per_map;
};

/// <operation> <input_dir> <output_prefix>_<job_id> [extra_args...]
struct StagedInputCommand {
    std::string operation;
    std::string input_dir;
    std::string output_prefix;
    std::vector<std::string> extra_args;
};

/// <operation> <task_count * rows_per_task> <output_prefix>_<job_id>
struct RowCountCommand {
    std::string operation;
    uint64_t rows_per_task;
    std::string output_prefix;
};

using CommandTemplate = std::variant<MapCountCommand, StagedInputCommand, RowCountCommand>;

/// Operation keyword and arguments of a template applied to one job.
[[nodiscard]] std::vector<std::string> operation_args(const CommandTemplate& tmpl,
                                                      const JobRecord& job);

/**
 * @brief Static mapping from application identifier to command template.
 */
class CommandRegistry {
public:
    CommandRegistry() = default;

    /// pi, wordcount, grep and terasort (teragen) of the MapReduce examples jar.
    static CommandRegistry hadoop_examples();

    void add(AppId app, CommandTemplate tmpl);

    [[nodiscard]] bool contains(std::string_view app) const;
    [[nodiscard]] const CommandTemplate* find(std::string_view app) const;
    [[nodiscard]] size_t size() const noexcept { return templates_.size(); }

    /**
     * @brief `<executable> jar <examples_jar> <operation> <args...>` for a job.
     *
     * std::nullopt when the job's application has no template.
     */
    [[nodiscard]] std::optional<EngineCommand> build(const JobRecord& job,
                                                     const EngineConfig& engine) const;

private:
    std::map<AppId, CommandTemplate, std::less<>> templates_;
};

}  // namespace tracie
