#pragma once

/// @file service_runner.hpp
/// @brief Process plumbing for the worker executable: command line, config
///        path resolution, termination signals and ordered shutdown.

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "fxp/foundation/game_result.hpp"

namespace fxp::service {

inline constexpr const char* kDefaultConfigPath = "/etc/fika_xp/config.yaml";

/// Takes precedence over `--config`.
inline constexpr const char* kConfigPathEnv = "FXP_CONFIG_PATH";

struct CommandLine {
    std::filesystem::path configPath;
    bool showVersion = false;
    bool showHelp = false;
};

/// Accepts `--config <path>`, `--config=<path>`, `-c <path>`, `--version`
/// and `--help`. Anything else is InvalidArgument.
[[nodiscard]] foundation::GameResult<CommandLine> parseCommandLine(int argc, char* argv[]);

[[nodiscard]] std::string usage(const char* program);

/// $FXP_CONFIG_PATH if set and non-empty, else @p cliPath if given, else
/// kDefaultConfigPath.
[[nodiscard]] std::filesystem::path resolveConfigPath(const std::filesystem::path& cliPath);

/// Latches SIGINT/SIGTERM. One instance per process; the previous handlers
/// come back on destruction so a second signal during teardown still kills
/// the process.
class ShutdownSignal {
public:
    ShutdownSignal();
    ~ShutdownSignal();

    ShutdownSignal(const ShutdownSignal&) = delete;
    ShutdownSignal& operator=(const ShutdownSignal&) = delete;

    [[nodiscard]] bool triggered() const noexcept;

    void trigger() noexcept;

    /// Sleep up to @p timeout, returning early once triggered.
    /// @return triggered()
    bool waitFor(std::chrono::milliseconds timeout) const;

private:
    static std::atomic<bool> flag_;
};

struct ShutdownReport {
    /// Names of the steps that threw.
    std::vector<std::string> failed;
    /// Steps that started after the deadline had passed.
    std::vector<std::string> late;

    [[nodiscard]] bool clean() const { return failed.empty() && late.empty(); }
};

/// Named shutdown steps run in the order they were added. Every step runs,
/// even after one throws or the deadline passes; both are logged.
///
/// @code
///   ShutdownSequence shutdown(std::chrono::seconds(10));
///   shutdown.add("ingest", [&] { service.stop(); });
///   shutdown.add("logger", [&] { (void)logger.flush(); });
///   auto report = shutdown.run();
/// @endcode
class ShutdownSequence {
public:
    explicit ShutdownSequence(std::chrono::milliseconds deadline = std::chrono::seconds(30))
        : deadline_(deadline) {}

    void add(std::string name, std::function<void()> step);

    [[nodiscard]] std::size_t size() const { return steps_.size(); }

    ShutdownReport run();

private:
    struct Step {
        std::string name;
        std::function<void()> action;
    };
    std::chrono::milliseconds deadline_;
    std::vector<Step> steps_;
};

} // namespace fxp::service
