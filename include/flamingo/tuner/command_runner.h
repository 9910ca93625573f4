#pragma once

// =============================================================================
// Flamingo - Command Runner
// =============================================================================
//
// Executes one rendered compile/test/clean command and reports how it ended.
//
// ShellCommandRunner runs `/bin/sh -c <command>` in a process group of its
// own with stdin redirected from /dev/null, captures stdout and stderr and
// measures the wall-clock time of the process. A timeout kills the whole
// process group. Cancellation lets the command finish unless it outlives the
// grace period, after which it is killed as well.
//
// The interface exists so the evaluator can be driven by a scripted runner in
// tests.
//

#include "flamingo/error.h"
#include "flamingo/tuner/cancellation.h"

#include <string>

namespace flamingo {
namespace tuner {

struct CommandOptions {
    double timeout_seconds = 0.0;  // 0 = no limit
    std::string working_directory;  // Empty = inherit
    const CancellationToken* cancellation = nullptr;
    double cancel_grace_seconds = 10.0;
};

struct CommandResult {
    int exit_code = -1;
    bool signaled = false;
    int term_signal = 0;
    bool timed_out = false;
    bool cancelled = false;  // Killed after the cancellation grace period
    std::string stdout_text;
    std::string stderr_text;
    double wall_seconds = 0.0;

    [[nodiscard]] bool success() const {
        return !signaled && !timed_out && !cancelled && exit_code == 0;
    }

    /// Short description of how the process ended ("exit 1", "signal 9", ...)
    [[nodiscard]] std::string describe() const;
};

class CommandRunner {
  public:
    virtual ~CommandRunner() = default;

    /// Run a command; an Error means it could not be started at all
    [[nodiscard]] virtual Result<CommandResult> run(const std::string& command,
                                                    const CommandOptions& options) = 0;
};

class ShellCommandRunner : public CommandRunner {
  public:
    ShellCommandRunner() = default;

    [[nodiscard]] Result<CommandResult> run(const std::string& command,
                                            const CommandOptions& options) override;
};

}  // namespace tuner
}  // namespace flamingo
