#pragma once

/// @file string_utils.hpp
/// @brief ASCII string helpers shared by rule, quest and config parsing.

#include <string>
#include <string_view>

namespace fxp::foundation {

/// Trim ASCII whitespace from both ends.
[[nodiscard]] std::string trimCopy(std::string_view text);

/// ASCII upper-case copy.
[[nodiscard]] std::string toUpperCopy(std::string_view text);

} // namespace fxp::foundation
