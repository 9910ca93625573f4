// =============================================================================
// Flamingo - Command Line Tuner
// =============================================================================
//
// Usage: flamingo_tune SETTINGS.json
//
// Exit status: 0 when an optimum was found, 1 on a configuration error,
// 2 when too many tests failed, 130 when interrupted.
//

#include "flamingo/flamingo.h"

#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <iostream>

namespace {

// Written by the signal handler, read by the evaluator workers
std::atomic<bool>* g_cancel_flag = nullptr;

extern "C" void handleSignal(int) {
    if (g_cancel_flag != nullptr) {
        g_cancel_flag->store(true);
    }
}

}  // namespace

int main(int argc, char** argv) {
    using namespace flamingo;

    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " SETTINGS.json\n";
        return 1;
    }

    auto settings = tuner::loadSettingsFile(argv[1]);
    if (!settings) {
        std::cerr << "Could not read settings: " << settings.error().toString() << "\n";
        return 1;
    }

    auto level = tuner::parseLogLevel(settings->log_level);
    if (!level) {
        std::cerr << level.error().toString() << "\n";
        return 1;
    }
    spdlog::set_level(*level);

    tuner::SessionOptions options;
    options.on_progress = [](uint64_t completed, uint64_t total) {
        spdlog::debug("Progress: {}/{}", completed, total);
    };

    auto session = tuner::TuningSession::create(std::move(*settings), std::move(options));
    if (!session) {
        std::cerr << "Invalid settings: " << session.error().toString() << "\n";
        return 1;
    }

    tuner::CancellationToken token;
    g_cancel_flag = token.flag();
    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    auto result = (*session)->run(token);
    g_cancel_flag = nullptr;
    if (!result) {
        std::cerr << "Tuning failed: " << result.error().toString() << "\n";
        return 1;
    }

    switch (result->state) {
    case tuner::OptimizerState::kSucceeded:
        return 0;
    case tuner::OptimizerState::kCancelled:
        return 130;
    default:
        return 2;
    }
}
