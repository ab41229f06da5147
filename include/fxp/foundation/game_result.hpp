#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> alias used by every fallible operation.

#include "fxp/core/result.hpp"
#include "fxp/foundation/game_error.hpp"

namespace fxp::foundation {

/// Result type specialized with GameError.
///
/// Components return GameResult<T> instead of throwing; exceptions raised
/// by third-party code are converted at the boundary that calls it.
///
/// Example:
/// @code
///   GameResult<int64_t> parseTarget(int64_t raw) {
///       if (raw <= 0) {
///           return GameResult<int64_t>::err(
///               GameError(ErrorCode::QuestInvalid, "target must be positive"));
///       }
///       return GameResult<int64_t>::ok(raw);
///   }
/// @endcode
template <typename T>
using GameResult = fxp::Result<T, GameError>;

}  // namespace fxp::foundation
