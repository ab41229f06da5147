#pragma once

/// @file line_source.hpp
/// @brief Polling tail of a single growing text file with a commit cursor.

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

#include "fxp/foundation/game_result.hpp"

namespace fxp::ingest {

/// Line source settings.
struct LineSourceConfig {
    std::filesystem::path path;
    std::chrono::milliseconds pollInterval{250};
    bool startAtEnd = true;      ///< skip content present at open()
    bool createIfMissing = true; ///< create parent dirs and an empty file
};

/// Yields complete, newline-terminated lines appended to a file.
///
/// The cursor only moves on commit(): next() keeps returning the same line
/// until it is committed, so a caller that fails to process a line can
/// retry it. Truncation (size below the cursor) and replacement (a
/// different inode at the path) reset the cursor to the current end of
/// the file with a warning; lost content is not recovered.
///
/// Usage:
/// @code
///   LineSource source({"/srv/fika/server.log"});
///   if (!source.open()) { ... }
///   while (running) {
///       auto line = source.next();
///       if (line && line.value()) {
///           handle(*line.value());
///           source.commit();
///       } else {
///           source.waitForData();
///       }
///   }
/// @endcode
class LineSource {
public:
    explicit LineSource(LineSourceConfig config);
    ~LineSource() = default;

    LineSource(const LineSource&) = delete;
    LineSource& operator=(const LineSource&) = delete;

    /// Open the file and place the cursor (end or start, per config).
    /// @return SourceUnavailable when the file is missing and cannot be created.
    [[nodiscard]] foundation::GameResult<void> open();

    /// Next complete line at the cursor without consuming it, or nullopt
    /// when no complete line is available yet. A trailing '\r' is removed.
    /// @return SourceReadFailed on I/O errors.
    [[nodiscard]] foundation::GameResult<std::optional<std::string>> next();

    /// Move the cursor past the line last returned by next().
    void commit();

    /// Sleep for the poll interval.
    void waitForData() const;

    /// Byte offset of the cursor.
    [[nodiscard]] std::uint64_t offset() const noexcept { return cursor_; }

    [[nodiscard]] bool isOpen() const noexcept { return opened_; }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return config_.path; }

private:
    struct FileId {
        std::uint64_t device = 0;
        std::uint64_t inode = 0;
        std::uint64_t size = 0;
    };

    [[nodiscard]] std::optional<FileId> statFile() const;
    bool reopen();

    LineSourceConfig config_;
    std::ifstream stream_;
    FileId current_{};
    std::uint64_t cursor_ = 0;
    std::optional<std::uint64_t> pendingEnd_;
    bool opened_ = false;
    bool missingReported_ = false;
};

} // namespace fxp::ingest
