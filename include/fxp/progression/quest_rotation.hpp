#pragma once

/// @file quest_rotation.hpp
/// @brief Retires expired quests and seeds the next cycle.

#include <cstddef>
#include <string>
#include <vector>

#include "fxp/foundation/game_result.hpp"
#include "fxp/foundation/types.hpp"
#include "fxp/progression/progression_store.hpp"

namespace fxp::foundation {
class ConfigManager;
} // namespace fxp::foundation

namespace fxp::progression {

/// Rotation settings (`quests.*`).
struct RotationConfig {
    int cycleDays = 7;
    std::vector<QuestSeed> seeds;

    /// dogtags_week (DOGTAG x5) and survive_week (SURVIVE x5).
    [[nodiscard]] static std::vector<QuestSeed> defaultSeeds();

    /// Read `quests.cycle_days` and `quests.seeds`. ConfigInvalidValue on a
    /// non-positive cycle, a malformed seed or duplicate seed keys.
    [[nodiscard]] static GameResult<RotationConfig> fromConfig(
        const foundation::ConfigManager& config);
};

/// Result of one rotate() call.
struct RotationReport {
    std::size_t deactivated = 0;
    std::vector<std::string> seeded; ///< keys inserted by this call
    std::size_t active = 0;          ///< active quests afterwards
};

/// Quest rotation.
///
/// rotate() deactivates every active quest whose end has passed and, when
/// no active quest is left, inserts one quest per seed for the cycle that
/// contains @p now. Seeded keys are `<seed key>@<cycle start date>` and
/// inserts skip keys that already exist, so calling rotate() repeatedly
/// within a cycle never duplicates quests.
class QuestRotation {
public:
    QuestRotation(IProgressionStore& store, RotationConfig config);

    [[nodiscard]] GameResult<RotationReport> rotate(foundation::Timestamp now);

    /// Key a seed receives in the cycle containing @p now.
    [[nodiscard]] std::string cycleKey(const QuestSeed& seed, foundation::Timestamp now) const;

private:
    IProgressionStore& store_;
    RotationConfig config_;
};

} // namespace fxp::progression
