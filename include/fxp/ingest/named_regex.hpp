#pragma once

/// @file named_regex.hpp
/// @brief std::regex wrapper that understands named capture groups.

#include <map>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "fxp/foundation/game_result.hpp"

namespace fxp::ingest {

/// Named capture values of one match. Groups that did not participate in
/// the match are absent.
using Captures = std::map<std::string, std::string>;

/// A compiled pattern whose named groups can be read back by name.
///
/// Rule files write groups as `(?P<name>...)` or `(?<name>...)` and
/// back-references as `(?P=name)` or `\k<name>`. std::regex (ECMAScript)
/// has no named groups, so compile() rewrites them into numbered groups
/// and keeps the index-to-name table. A leading `(?i)` turns on
/// case-insensitive matching.
///
/// Example:
/// @code
///   auto rx = NamedRegex::compile(R"((?P<killer>\S+) killed (?P<victim>\S+))");
///   Captures caps;
///   if (rx && rx.value().search("PlayerA killed PlayerB", caps)) {
///       // caps["victim"] == "PlayerB"
///   }
/// @endcode
class NamedRegex {
public:
    /// Compile @p pattern. RuleCompileFailed on syntax errors, duplicate
    /// group names or references to unknown groups.
    [[nodiscard]] static foundation::GameResult<NamedRegex> compile(std::string_view pattern);

    /// Search anywhere in @p text. Returns false when there is no match;
    /// on a match @p out receives the named captures.
    bool search(std::string_view text, Captures& out) const;

    /// The pattern as written in the rule file.
    [[nodiscard]] const std::string& source() const noexcept { return source_; }

    /// The ECMAScript pattern handed to std::regex.
    [[nodiscard]] const std::string& translated() const noexcept { return translated_; }

    /// Group names in group-number order (unnamed groups are skipped).
    [[nodiscard]] std::vector<std::string> groupNames() const;

private:
    NamedRegex() = default;

    std::string source_;
    std::string translated_;
    std::regex regex_;
    std::map<std::size_t, std::string> names_;
};

} // namespace fxp::ingest
