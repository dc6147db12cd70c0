/**
 * @file process_launcher.hpp
 * @brief Blocking subprocess execution for external engine commands.
 */

#pragma once

#include "core/result.hpp"
#include "executor/engine_command.hpp"

#include <string>

namespace tracie {

struct ProcessResult {
    int exit_code{0};             ///< Exit status, or 128 + signal number
    std::string stderr_output;    ///< Captured standard error

    [[nodiscard]] bool succeeded() const noexcept { return exit_code == 0; }
};

/**
 * @brief Abstract interface for running an engine command to completion.
 *
 * Tests substitute a scripted launcher.
 */
class IProcessLauncher {
public:
    virtual ~IProcessLauncher() = default;

    /**
     * @brief Run the command and wait for it to exit.
     *
     * A process that runs and exits non-zero is a value, not an error. The
     * error path is reserved for a process that could not be started:
     * ErrorCode::EngineNotFound when the executable does not exist.
     */
    virtual Result<ProcessResult> run(const EngineCommand& command) = 0;
};

/**
 * @brief posix_spawnp-based launcher: stdout to /dev/null, stderr captured.
 */
class PosixProcessLauncher : public IProcessLauncher {
public:
    Result<ProcessResult> run(const EngineCommand& command) override;
};

}  // namespace tracie
