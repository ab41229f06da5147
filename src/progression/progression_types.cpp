/// @file progression_types.cpp
/// @brief Event type to stat counter mapping.

#include "fxp/progression/progression_types.hpp"

namespace fxp::progression {

namespace et = ingest::event_type;

std::optional<StatCounter> counterForEventType(std::string_view eventType) {
    if (eventType == et::kKill) {
        return StatCounter::Kills;
    }
    if (eventType == et::kDeath) {
        return StatCounter::Deaths;
    }
    if (eventType == et::kExtract) {
        return StatCounter::Extracts;
    }
    if (eventType == et::kSurvive) {
        return StatCounter::Survivals;
    }
    if (eventType == et::kDogtag) {
        return StatCounter::Dogtags;
    }
    return std::nullopt;
}

std::string_view statCounterName(StatCounter counter) {
    switch (counter) {
        case StatCounter::Kills:     return "kills";
        case StatCounter::Deaths:    return "deaths";
        case StatCounter::Extracts:  return "extracts";
        case StatCounter::Survivals: return "survivals";
        case StatCounter::Dogtags:   return "dogtags";
    }
    return "unknown";
}

void increment(PlayerStats& stats, StatCounter counter) {
    switch (counter) {
        case StatCounter::Kills:     ++stats.kills; break;
        case StatCounter::Deaths:    ++stats.deaths; break;
        case StatCounter::Extracts:  ++stats.extracts; break;
        case StatCounter::Survivals: ++stats.survivals; break;
        case StatCounter::Dogtags:   ++stats.dogtags; break;
    }
}

} // namespace fxp::progression
