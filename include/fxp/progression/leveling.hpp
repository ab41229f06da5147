#pragma once

/// @file leveling.hpp
/// @brief Level curve and per-event XP awards.

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

#include "fxp/foundation/game_result.hpp"

namespace fxp::foundation {
class ConfigManager;
} // namespace fxp::foundation

namespace fxp::progression {

/// Total XP needed to reach @p level: 0 up to level 1, then
/// 100 * (level - 1)^2 + 100.
[[nodiscard]] constexpr std::int64_t xpRequired(std::int64_t level) noexcept {
    if (level <= 1) {
        return 0;
    }
    return 100 * (level - 1) * (level - 1) + 100;
}

/// Largest level whose threshold is at most @p xp (at least 1).
[[nodiscard]] constexpr std::int64_t levelFromXp(std::int64_t xp) noexcept {
    std::int64_t level = 1;
    while (xp >= xpRequired(level + 1)) {
        ++level;
    }
    return level;
}

/// Immutable event-type -> XP mapping. Unknown types award 0.
class XpAwardTable {
public:
    /// KILL 100, HEADSHOT 25, SURVIVE 150, EXTRACT 75, DOGTAG 30, DEATH 0.
    XpAwardTable();

    /// Build from an explicit mapping. Keys are upper-cased; a negative
    /// award is ConfigInvalidValue.
    [[nodiscard]] static foundation::GameResult<XpAwardTable> fromMap(
        const std::map<std::string, std::int64_t>& awards);

    /// Read `progression.xp_awards.<TYPE>`; defaults when the section is absent.
    [[nodiscard]] static foundation::GameResult<XpAwardTable> fromConfig(
        const foundation::ConfigManager& config);

    [[nodiscard]] std::int64_t awardFor(std::string_view eventType) const;

    [[nodiscard]] const std::map<std::string, std::int64_t>& entries() const noexcept {
        return awards_;
    }

private:
    std::map<std::string, std::int64_t> awards_;
};

} // namespace fxp::progression
