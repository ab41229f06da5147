#pragma once

/// @file game_error.hpp
/// @brief Error type used with Result<T, GameError>.

#include <string>
#include <string_view>
#include <utility>

#include "fxp/foundation/error_code.hpp"

namespace fxp::foundation {

/// An error code with a message and, optionally, the name of the thing it
/// concerns (a rule's event type, a player, a quest key).
class GameError {
public:
    GameError() = default;

    explicit GameError(ErrorCode code) : code_(code) {}

    GameError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    GameError(ErrorCode code, std::string message, std::string subject)
        : code_(code), message_(std::move(message)), subject_(std::move(subject)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] std::string_view message() const noexcept { return message_; }
    [[nodiscard]] std::string_view subject() const noexcept { return subject_; }

    [[nodiscard]] std::string_view subsystem() const noexcept { return errorSubsystem(code_); }

    /// `Name: message (subject)`, e.g.
    /// `RuleCompileFailed: unbalanced parenthesis (KILL)`.
    [[nodiscard]] std::string describe() const {
        std::string text(errorName(code_));
        if (!message_.empty()) {
            text += ": ";
            text += message_;
        }
        if (!subject_.empty()) {
            text += " (";
            text += subject_;
            text += ')';
        }
        return text;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::string subject_;
};

} // namespace fxp::foundation
