#pragma once

/// @file rule_set.hpp
/// @brief Compiled extraction rules and the compiler that builds them.

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "fxp/foundation/game_result.hpp"
#include "fxp/ingest/named_regex.hpp"

namespace fxp::ingest {

/// One event type and its pattern.
struct CompiledRule {
    std::string eventType; ///< trimmed, upper-cased
    NamedRegex pattern;
};

/// Immutable table of compiled rules in configuration order, plus the
/// headshot keywords (upper-cased).
class RuleSet {
public:
    [[nodiscard]] const std::vector<CompiledRule>& rules() const noexcept { return rules_; }

    [[nodiscard]] const std::vector<std::string>& headshotKeywords() const noexcept {
        return headshotKeywords_;
    }

    /// Rule for @p eventType (case-insensitive), or nullptr.
    [[nodiscard]] const CompiledRule* find(std::string_view eventType) const;

    [[nodiscard]] std::size_t size() const noexcept { return rules_.size(); }

private:
    friend class RuleCompiler;

    std::vector<CompiledRule> rules_;
    std::vector<std::string> headshotKeywords_;
};

/// Builds a RuleSet from a rules document.
///
/// Document layout:
/// @code
///   patterns:
///     KILL: '(?P<ts>\S+ \S+) (?P<killer>\S+) killed (?P<victim>\S+)'
///     EXTRACT: '(?P<name>\S+) extracted'
///   headshot_keywords: [HEADSHOT, HS]
/// @endcode
/// A mapping without a `patterns` key is read as the pattern mapping
/// itself. Every failure is reported as RuleCompileFailed so a bad rules
/// file stops the worker before any line is read.
class RuleCompiler {
public:
    /// Keywords used when the document has none (or an empty list).
    static const std::vector<std::string>& defaultHeadshotKeywords();

    [[nodiscard]] static foundation::GameResult<RuleSet> compile(const YAML::Node& document);

    [[nodiscard]] static foundation::GameResult<RuleSet> compileString(std::string_view yaml);

    [[nodiscard]] static foundation::GameResult<RuleSet> compileFile(
        const std::filesystem::path& path);
};

} // namespace fxp::ingest
