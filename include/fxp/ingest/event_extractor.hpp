#pragma once

/// @file event_extractor.hpp
/// @brief Maps one raw log line to zero or more gameplay events.

#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "fxp/foundation/types.hpp"
#include "fxp/ingest/event.hpp"
#include "fxp/ingest/named_regex.hpp"
#include "fxp/ingest/rule_set.hpp"

namespace fxp::ingest {

/// Parse a captured timestamp.
///
/// Accepted forms, tried in order: `YYYY-MM-DDTHH:MM:SS[Z]`,
/// `YYYY-MM-DD HH:MM:SS`, `HH:MM:SS` (on the UTC date of @p now).
/// Anything else, including an empty capture, yields nullopt.
[[nodiscard]] std::optional<foundation::Timestamp> parseLogTimestamp(
    std::string_view text, foundation::Timestamp now);

/// Evaluates every compiled rule against a line and derives events.
///
/// Derivation per matched rule:
/// - KILL: KILL{actor=killer, victim}; plus HEADSHOT{actor=killer, victim}
///   when a `headshot`/`hs` group captured text or a headshot keyword
///   occurs anywhere in the line (case-insensitive).
/// - DEATH: DEATH{actor=victim, killer}.
/// - SURVIVE: SURVIVE{actor=name}.
/// - EXTRACT: EXTRACT{actor=name} and SURVIVE{actor=name, from=EXTRACT}.
/// - DOGTAG: DOGTAG{actor=name|killer|victim} with any captured
///   victim/level/side/weapon/status.
/// - other types: actor name|killer|victim, every non-empty capture except
///   `ts` as attributes.
///
/// Events with an empty actor are dropped, and events with the same
/// identityKey() are emitted once per line. parse() never throws.
class EventExtractor {
public:
    explicit EventExtractor(std::shared_ptr<const RuleSet> rules,
                            foundation::Clock clock = foundation::systemNow);

    [[nodiscard]] std::vector<Event> parse(std::string_view line) const;

    [[nodiscard]] const RuleSet& rules() const noexcept { return *rules_; }

private:
    void derive(const CompiledRule& rule, std::string_view line, const Captures& caps,
                foundation::Timestamp ts, std::vector<Event>& out) const;

    [[nodiscard]] bool containsHeadshot(std::string_view line, const Captures& caps) const;

    std::shared_ptr<const RuleSet> rules_;
    foundation::Clock clock_;
};

} // namespace fxp::ingest
