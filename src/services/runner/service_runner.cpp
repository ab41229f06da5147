/// @file service_runner.cpp
/// @brief Command line, config path, signals and shutdown sequencing.

#include "fxp/service/service_runner.hpp"

#include <algorithm>
#include <signal.h>
#include <cstdlib>
#include <exception>
#include <string_view>
#include <thread>

#include "fxp/foundation/game_logger.hpp"

namespace fxp::service {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

GameResult<CommandLine> parseCommandLine(int argc, char* argv[]) {
    CommandLine cli;
    auto bad = [](std::string message, std::string_view arg) {
        return GameResult<CommandLine>::err(
            GameError(ErrorCode::InvalidArgument, std::move(message), std::string(arg)));
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                return bad("missing value", arg);
            }
            cli.configPath = argv[++i];
        } else if (arg.rfind("--config=", 0) == 0) {
            auto value = arg.substr(std::string_view("--config=").size());
            if (value.empty()) {
                return bad("missing value", "--config");
            }
            cli.configPath = std::string(value);
        } else if (arg == "--version") {
            cli.showVersion = true;
        } else if (arg == "--help" || arg == "-h") {
            cli.showHelp = true;
        } else {
            return bad("unrecognized argument", arg);
        }
    }
    return GameResult<CommandLine>::ok(std::move(cli));
}

std::string usage(const char* program) {
    return std::string("usage: ") + program +
           " [--config <path>] [--version] [--help]\n"
           "  config path precedence: $" + kConfigPathEnv + ", --config, " +
           kDefaultConfigPath + "\n";
}

std::filesystem::path resolveConfigPath(const std::filesystem::path& cliPath) {
    if (const char* env = std::getenv(kConfigPathEnv); env != nullptr && *env != '\0') {
        return env;
    }
    return cliPath.empty() ? std::filesystem::path(kDefaultConfigPath) : cliPath;
}

// ---------------------------------------------------------------------------
// ShutdownSignal
// ---------------------------------------------------------------------------

std::atomic<bool> ShutdownSignal::flag_{false};

namespace {

struct sigaction previousInt {};
struct sigaction previousTerm {};

} // namespace

ShutdownSignal::ShutdownSignal() {
    flag_.store(false);

    struct sigaction action {};
    // A lock-free atomic store is async-signal-safe.
    action.sa_handler = [](int) { flag_.store(true, std::memory_order_relaxed); };
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, &previousInt);
    sigaction(SIGTERM, &action, &previousTerm);
}

ShutdownSignal::~ShutdownSignal() {
    sigaction(SIGINT, &previousInt, nullptr);
    sigaction(SIGTERM, &previousTerm, nullptr);
}

bool ShutdownSignal::triggered() const noexcept {
    return flag_.load(std::memory_order_relaxed);
}

void ShutdownSignal::trigger() noexcept {
    flag_.store(true, std::memory_order_relaxed);
}

bool ShutdownSignal::waitFor(std::chrono::milliseconds timeout) const {
    constexpr std::chrono::milliseconds kSlice{20};
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!triggered()) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) {
            break;
        }
        std::this_thread::sleep_for(std::min(left, kSlice));
    }
    return triggered();
}

// ---------------------------------------------------------------------------
// ShutdownSequence
// ---------------------------------------------------------------------------

void ShutdownSequence::add(std::string name, std::function<void()> step) {
    steps_.push_back(Step{std::move(name), std::move(step)});
}

ShutdownReport ShutdownSequence::run() {
    ShutdownReport report;
    const auto deadline = std::chrono::steady_clock::now() + deadline_;

    for (const auto& step : steps_) {
        if (std::chrono::steady_clock::now() > deadline) {
            FXP_LOG_WARN(LogCategory::Core, "shutdown deadline passed before " + step.name);
            report.late.push_back(step.name);
        }
        FXP_LOG_DEBUG(LogCategory::Core, "shutdown: " + step.name);
        try {
            step.action();
        } catch (const std::exception& e) {
            FXP_LOG_ERROR(LogCategory::Core, "shutdown step " + step.name + " failed: " + e.what());
            report.failed.push_back(step.name);
        }
    }
    return report;
}

} // namespace fxp::service
