#pragma once

/// @file time_utils.hpp
/// @brief UTC calendar helpers: ISO-8601 formatting/parsing and day flooring.

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "fxp/foundation/types.hpp"

namespace fxp::foundation {

/// Read exactly @p width decimal digits starting at @p pos.
/// @return false when the text is too short or a character is not a digit;
///         @p out is left untouched then.
[[nodiscard]] bool readDigits(std::string_view text, std::size_t pos, std::size_t width,
                              unsigned& out);

/// Read `HH:MM:SS` at @p pos. Field ranges are not checked.
[[nodiscard]] bool readClockTime(std::string_view text, std::size_t pos, unsigned& hour,
                                 unsigned& minute, unsigned& second);

/// Build a UTC instant from calendar fields.
/// @return nullopt when any field is out of range (e.g. month 13, 25:00).
[[nodiscard]] std::optional<Timestamp> makeUtc(int year, unsigned month, unsigned day,
                                               unsigned hour, unsigned minute,
                                               unsigned second);

/// Format as `YYYY-MM-DDTHH:MM:SSZ` (sub-second part truncated).
[[nodiscard]] std::string formatIso8601(Timestamp ts);

/// Format the calendar date only, `YYYY-MM-DD`.
[[nodiscard]] std::string formatDate(Timestamp ts);

/// Parse the output of formatIso8601(). The trailing `Z` is optional.
[[nodiscard]] std::optional<Timestamp> parseIso8601(std::string_view text);

/// Midnight (00:00:00 UTC) of the day containing @p ts.
[[nodiscard]] Timestamp utcMidnight(Timestamp ts);

/// Floor @p ts to a multiple of @p days counted from the Unix epoch.
[[nodiscard]] Timestamp floorToDayCycle(Timestamp ts, int days);

} // namespace fxp::foundation
