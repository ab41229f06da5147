#pragma once

/// @file error_code.hpp
/// @brief Error codes for ingestion and progression, grouped by subsystem.

#include <cstdint>
#include <string_view>

namespace fxp::foundation {

/// The high byte of a code names the subsystem that raised it.
enum class ErrorCode : std::uint32_t {
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,

    DatabaseError = 0x0200,
    QueryFailed = 0x0201,
    TransactionFailed = 0x0202,
    ConnectionPoolExhausted = 0x0203,
    NotConnected = 0x0205,

    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    ConfigInvalidValue = 0x0603,

    ThreadError = 0x0700,
    JobScheduleFailed = 0x0701,
    JobNotFound = 0x0702,
    JobCancelled = 0x0703,

    LoggerFlushFailed = 0x0802,

    /// A rules document or one of its patterns was rejected.
    RuleCompileFailed = 0x0900,
    /// The log file cannot be opened at all; the worker stops.
    SourceUnavailable = 0x0901,
    /// A single read failed; the next poll tries again.
    SourceReadFailed = 0x0902,

    InvalidEvent = 0x0A00,
    PlayerNotFound = 0x0A01,
    QuestNotFound = 0x0A02,
    QuestInvalid = 0x0A03,
    StoreUnavailable = 0x0A04,
};

constexpr std::string_view errorSubsystem(ErrorCode code) {
    switch (static_cast<std::uint32_t>(code) >> 8) {
        case 0x00: return "General";
        case 0x02: return "Database";
        case 0x06: return "Config";
        case 0x07: return "Thread";
        case 0x08: return "Logger";
        case 0x09: return "Ingest";
        case 0x0A: return "Progression";
        default: return "Unknown";
    }
}

/// Enumerator name, for log lines.
constexpr std::string_view errorName(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::DatabaseError: return "DatabaseError";
        case ErrorCode::QueryFailed: return "QueryFailed";
        case ErrorCode::TransactionFailed: return "TransactionFailed";
        case ErrorCode::ConnectionPoolExhausted: return "ConnectionPoolExhausted";
        case ErrorCode::NotConnected: return "NotConnected";
        case ErrorCode::ConfigLoadFailed: return "ConfigLoadFailed";
        case ErrorCode::ConfigKeyNotFound: return "ConfigKeyNotFound";
        case ErrorCode::ConfigTypeMismatch: return "ConfigTypeMismatch";
        case ErrorCode::ConfigInvalidValue: return "ConfigInvalidValue";
        case ErrorCode::ThreadError: return "ThreadError";
        case ErrorCode::JobScheduleFailed: return "JobScheduleFailed";
        case ErrorCode::JobNotFound: return "JobNotFound";
        case ErrorCode::JobCancelled: return "JobCancelled";
        case ErrorCode::LoggerFlushFailed: return "LoggerFlushFailed";
        case ErrorCode::RuleCompileFailed: return "RuleCompileFailed";
        case ErrorCode::SourceUnavailable: return "SourceUnavailable";
        case ErrorCode::SourceReadFailed: return "SourceReadFailed";
        case ErrorCode::InvalidEvent: return "InvalidEvent";
        case ErrorCode::PlayerNotFound: return "PlayerNotFound";
        case ErrorCode::QuestNotFound: return "QuestNotFound";
        case ErrorCode::QuestInvalid: return "QuestInvalid";
        case ErrorCode::StoreUnavailable: return "StoreUnavailable";
    }
    return "Unknown";
}

} // namespace fxp::foundation
