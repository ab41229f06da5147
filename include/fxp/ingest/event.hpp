#pragma once

/// @file event.hpp
/// @brief Gameplay event extracted from a log line.

#include <map>
#include <string>
#include <string_view>

#include "fxp/foundation/types.hpp"

namespace fxp::ingest {

/// Canonical event type tags. Custom rule names pass through unchanged
/// (upper-cased), so the tag is a string rather than an enum.
namespace event_type {
inline constexpr std::string_view kKill = "KILL";
inline constexpr std::string_view kHeadshot = "HEADSHOT";
inline constexpr std::string_view kDeath = "DEATH";
inline constexpr std::string_view kSurvive = "SURVIVE";
inline constexpr std::string_view kExtract = "EXTRACT";
inline constexpr std::string_view kDogtag = "DOGTAG";
} // namespace event_type

/// Ordered attribute mapping (victim, killer, from, level, ...).
using EventAttributes = std::map<std::string, std::string>;

/// An immutable gameplay occurrence attributed to one player.
struct Event {
    foundation::Timestamp timestamp{};
    std::string type;
    std::string actor;
    EventAttributes attributes;

    /// Attribute value or "" when absent.
    [[nodiscard]] std::string attribute(std::string_view key) const;

    bool operator==(const Event&) const = default;
};

/// Identity used to deduplicate events within a line and in the event log:
/// `type|timestamp|actor|key attributes`.
///
/// Key attributes are `victim` for KILL, HEADSHOT and DOGTAG, `killer` for
/// DEATH, `from` for SURVIVE, none for EXTRACT and every attribute for
/// custom types.
[[nodiscard]] std::string identityKey(const Event& event);

/// Attributes as a compact JSON object, e.g. {"victim":"PlayerB"}.
[[nodiscard]] std::string attributesToJson(const EventAttributes& attributes);

/// Inverse of attributesToJson(). Malformed text or a non-object document
/// yields no attributes; nested values are skipped and other scalars are
/// kept in their JSON spelling.
[[nodiscard]] EventAttributes attributesFromJson(std::string_view json);

} // namespace fxp::ingest
