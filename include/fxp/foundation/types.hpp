#pragma once

/// @file types.hpp
/// @brief Strong ID types and the timestamp alias shared by all subsystems.

#include <chrono>
#include <cstdint>
#include <functional>

namespace fxp::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// Prevents accidental mixing of different ID types (e.g. PlayerId and
/// QuestId) at compile time while keeping the same representation.
template <typename Tag, typename T = int64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct PlayerIdTag {};
struct QuestIdTag {};
struct EventIdTag {};

/// Surrogate key of a player row.
using PlayerId = StrongId<PlayerIdTag>;

/// Surrogate key of a quest row.
using QuestId = StrongId<QuestIdTag>;

/// Sequence number of an event log entry.
using EventId = StrongId<EventIdTag>;

/// UTC instant with second resolution semantics (sub-second parts are kept
/// but never produced by the log parser).
using Timestamp = std::chrono::system_clock::time_point;

/// Source of "now"; injectable so time-dependent policies are testable.
using Clock = std::function<Timestamp()>;

/// The real wall clock.
inline Timestamp systemNow() {
    return std::chrono::system_clock::now();
}

} // namespace fxp::foundation

template <typename Tag, typename T>
struct std::hash<fxp::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const fxp::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
