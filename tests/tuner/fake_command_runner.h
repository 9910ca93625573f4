#pragma once

// =============================================================================
// Flamingo - Scripted Command Runner for Tests
// =============================================================================

#include "flamingo/tuner/command_runner.h"

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace flamingo {
namespace tuner {
namespace test_support {

/// Answers every command with a scripted result and records what ran
class FakeCommandRunner : public CommandRunner {
  public:
    using Handler = std::function<Result<CommandResult>(const std::string& command)>;

    FakeCommandRunner() : handler_([](const std::string&) { return exitWith(0); }) {}
    explicit FakeCommandRunner(Handler handler) : handler_(std::move(handler)) {}

    Result<CommandResult> run(const std::string& command,
                              const CommandOptions& options) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            commands_.push_back(command);
        }
        if (options.cancellation != nullptr && options.cancellation->cancelled() &&
            cancel_in_flight_) {
            CommandResult result;
            result.cancelled = true;
            return result;
        }
        return handler_(command);
    }

    /// Commands seen so far, in call order
    [[nodiscard]] std::vector<std::string> commands() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return commands_;
    }

    /// Number of commands starting with `prefix`
    [[nodiscard]] size_t count(const std::string& prefix) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& command : commands_) {
            if (command.rfind(prefix, 0) == 0) {
                ++n;
            }
        }
        return n;
    }

    /// Report every command run after cancellation as killed
    void setCancelInFlight(bool cancel) { cancel_in_flight_ = cancel; }

    static CommandResult exitWith(int code, std::string stdout_text = {}) {
        CommandResult result;
        result.exit_code = code;
        result.stdout_text = std::move(stdout_text);
        result.wall_seconds = 0.01;
        return result;
    }

    static CommandResult printScore(double score) {
        return exitWith(0, std::to_string(score) + "\n");
    }

  private:
    Handler handler_;
    mutable std::mutex mutex_;
    std::vector<std::string> commands_;
    std::atomic<bool> cancel_in_flight_{false};
};

/// Splits "word a b c" into its words
inline std::vector<std::string> words(const std::string& command) {
    std::vector<std::string> out;
    std::string current;
    for (char c : command) {
        if (c == ' ') {
            if (!current.empty()) {
                out.push_back(current);
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        out.push_back(current);
    }
    return out;
}

}  // namespace test_support
}  // namespace tuner
}  // namespace flamingo
