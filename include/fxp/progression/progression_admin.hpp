#pragma once

/// @file progression_admin.hpp
/// @brief Administrative writes: eligibility, quest acceptance and quest CRUD.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "fxp/foundation/types.hpp"
#include "fxp/progression/progression_store.hpp"

namespace fxp::progression {

/// Fields of a new quest.
struct QuestDraft {
    std::string key;
    std::string title;
    std::string eventType;
    std::int64_t target = 1;
    Timestamp start{};
    Timestamp end{};
    bool active = true;
};

/// Partial quest update; unset fields keep their value.
struct QuestUpdate {
    std::optional<std::string> title;
    std::optional<std::string> eventType;
    std::optional<std::int64_t> target;
    std::optional<Timestamp> start;
    std::optional<Timestamp> end;
    std::optional<bool> active;
};

/// Write surface for admin tools and bot commands.
///
/// Every operation runs in its own store transaction and keeps the
/// progression invariants: eligibility changes never rewrite XP or levels,
/// and quest edits never touch existing progress or completion stamps.
/// Validation failures are QuestInvalid.
class ProgressionAdmin {
public:
    explicit ProgressionAdmin(IProgressionStore& store,
                              foundation::Clock clock = foundation::systemNow);

    /// Opt a known player in to (or out of) XP. PlayerNotFound otherwise.
    [[nodiscard]] GameResult<PlayerRecord> setEligible(std::string_view displayName, bool eligible);

    /// Create the player's progress row for an active quest. Accepting twice
    /// returns the existing row unchanged.
    [[nodiscard]] GameResult<QuestProgress> acceptQuest(std::string_view displayName,
                                                        std::string_view questKey);

    [[nodiscard]] GameResult<Quest> createQuest(const QuestDraft& draft);

    [[nodiscard]] GameResult<Quest> updateQuest(std::string_view questKey,
                                                const QuestUpdate& update);

    /// Remove a quest and all progress toward it.
    [[nodiscard]] GameResult<void> deleteQuest(std::string_view questKey);

    [[nodiscard]] GameResult<std::vector<Quest>> listQuests(bool activeOnly = false);

private:
    IProgressionStore& store_;
    foundation::Clock clock_;
};

} // namespace fxp::progression
