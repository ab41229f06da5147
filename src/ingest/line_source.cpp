/// @file line_source.cpp
/// @brief LineSource implementation (POSIX stat for rotation detection).

#include "fxp/ingest/line_source.hpp"

#include <sys/stat.h>

#include <system_error>
#include <thread>
#include <utility>

#include "fxp/foundation/game_logger.hpp"

namespace fs = std::filesystem;

namespace fxp::ingest {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

LineSource::LineSource(LineSourceConfig config)
    : config_(std::move(config)) {}

std::optional<LineSource::FileId> LineSource::statFile() const {
    struct ::stat st {};
    if (::stat(config_.path.c_str(), &st) != 0) {
        return std::nullopt;
    }
    return FileId{static_cast<std::uint64_t>(st.st_dev),
                  static_cast<std::uint64_t>(st.st_ino),
                  static_cast<std::uint64_t>(st.st_size)};
}

bool LineSource::reopen() {
    if (stream_.is_open()) {
        stream_.close();
    }
    stream_.clear();
    stream_.open(config_.path, std::ios::in | std::ios::binary);
    return stream_.is_open();
}

GameResult<void> LineSource::open() {
    if (config_.createIfMissing) {
        std::error_code ec;
        if (config_.path.has_parent_path()) {
            fs::create_directories(config_.path.parent_path(), ec);
        }
        if (!fs::exists(config_.path, ec)) {
            std::ofstream touch(config_.path, std::ios::app);
        }
    }

    auto id = statFile();
    if (!id || !reopen()) {
        return GameResult<void>::err(GameError(
            ErrorCode::SourceUnavailable, "cannot open log file " + config_.path.string()));
    }

    current_ = *id;
    cursor_ = config_.startAtEnd ? id->size : 0;
    pendingEnd_.reset();
    opened_ = true;

    FXP_LOG_INFO(LogCategory::Ingest,
                 "tailing " + config_.path.string() + " from offset " + std::to_string(cursor_));
    return GameResult<void>::ok();
}

GameResult<std::optional<std::string>> LineSource::next() {
    using Next = GameResult<std::optional<std::string>>;

    if (!opened_) {
        return Next::err(GameError(ErrorCode::SourceUnavailable, "line source is not open"));
    }

    auto id = statFile();
    if (!id) {
        if (!missingReported_) {
            FXP_LOG_WARN(LogCategory::Ingest,
                         "log file " + config_.path.string() + " disappeared, waiting");
            missingReported_ = true;
        }
        pendingEnd_.reset();
        return Next::ok(std::nullopt);
    }
    missingReported_ = false;

    if (id->device != current_.device || id->inode != current_.inode) {
        if (!reopen()) {
            return Next::err(GameError(ErrorCode::SourceReadFailed,
                                       "cannot reopen replaced log file " + config_.path.string()));
        }
        FXP_LOG_WARN(LogCategory::Ingest,
                     "log file " + config_.path.string() + " was replaced, resuming at its end");
        cursor_ = id->size;
        pendingEnd_.reset();
    } else if (id->size < cursor_) {
        FXP_LOG_WARN(LogCategory::Ingest,
                     "log file " + config_.path.string() + " was truncated from " +
                     std::to_string(cursor_) + " to " + std::to_string(id->size) + " bytes");
        cursor_ = id->size;
        pendingEnd_.reset();
    }
    current_ = *id;

    if (id->size <= cursor_) {
        return Next::ok(std::nullopt);
    }

    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(cursor_));
    if (!stream_) {
        return Next::err(GameError(ErrorCode::SourceReadFailed,
                                   "seek failed in " + config_.path.string()));
    }

    std::string line;
    std::getline(stream_, line);
    if (stream_.bad()) {
        return Next::err(GameError(ErrorCode::SourceReadFailed,
                                   "read failed in " + config_.path.string()));
    }
    if (stream_.eof()) {
        // Partial line: wait for its newline.
        return Next::ok(std::nullopt);
    }

    pendingEnd_ = cursor_ + line.size() + 1;
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return Next::ok(std::move(line));
}

void LineSource::commit() {
    if (pendingEnd_) {
        cursor_ = *pendingEnd_;
        pendingEnd_.reset();
    }
}

void LineSource::waitForData() const {
    std::this_thread::sleep_for(config_.pollInterval);
}

} // namespace fxp::ingest
