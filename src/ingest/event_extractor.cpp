/// @file event_extractor.cpp
/// @brief EventExtractor implementation.

#include "fxp/ingest/event_extractor.hpp"

#include <chrono>
#include <exception>
#include <string>
#include <unordered_set>

#include "fxp/foundation/game_logger.hpp"
#include "fxp/foundation/string_utils.hpp"
#include "fxp/foundation/time_utils.hpp"

namespace fxp::ingest {

using foundation::LogCategory;
using foundation::readClockTime;
using foundation::readDigits;
using foundation::Timestamp;
using foundation::toUpperCopy;
using foundation::trimCopy;
using foundation::Timestamp;

namespace {

std::string capture(const Captures& caps, const char* name) {
    auto it = caps.find(name);
    return it != caps.end() ? trimCopy(it->second) : std::string();
}

std::string firstNonEmpty(const std::string& a, const std::string& b, const std::string& c) {
    if (!a.empty()) {
        return a;
    }
    return !b.empty() ? b : c;
}

Event makeEvent(Timestamp ts, std::string_view type, std::string actor,
                EventAttributes attributes = {}) {
    return Event{ts, std::string(type), std::move(actor), std::move(attributes)};
}

void putIfPresent(EventAttributes& attrs, const char* key, const std::string& value) {
    if (!value.empty()) {
        attrs.emplace(key, value);
    }
}

} // namespace

std::optional<Timestamp> parseLogTimestamp(std::string_view text, Timestamp now) {
    auto trimmed = trimCopy(text);
    std::string_view ts = trimmed;

    if (auto iso = foundation::parseIso8601(ts)) {
        return iso;
    }

    unsigned y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    if (ts.size() == 19 && readDigits(ts, 0, 4, y) && ts[4] == '-' &&
        readDigits(ts, 5, 2, mo) && ts[7] == '-' && readDigits(ts, 8, 2, d) &&
        ts[10] == ' ' && readClockTime(ts, 11, h, mi, s)) {
        return foundation::makeUtc(static_cast<int>(y), mo, d, h, mi, s);
    }

    if (ts.size() == 8 && readClockTime(ts, 0, h, mi, s) && h < 24 && mi < 60 && s < 60) {
        return foundation::utcMidnight(now) + std::chrono::hours(h) +
               std::chrono::minutes(mi) + std::chrono::seconds(s);
    }
    return std::nullopt;
}

EventExtractor::EventExtractor(std::shared_ptr<const RuleSet> rules, foundation::Clock clock)
    : rules_(std::move(rules)), clock_(std::move(clock)) {}

std::vector<Event> EventExtractor::parse(std::string_view line) const {
    std::vector<Event> events;
    try {
        std::vector<Event> derived;
        Captures caps;
        for (const auto& rule : rules_->rules()) {
            if (!rule.pattern.search(line, caps)) {
                continue;
            }

            auto now = clock_();
            auto ts = parseLogTimestamp(capture(caps, "ts"), now);
            if (!ts) {
                FXP_LOG_TRACE(LogCategory::Parser,
                              "unparseable timestamp for " + rule.eventType +
                              ", using processing time");
                ts = std::chrono::time_point_cast<std::chrono::seconds>(now);
            }
            derive(rule, line, caps, *ts, derived);
        }

        std::unordered_set<std::string> seen;
        for (auto& event : derived) {
            if (event.actor.empty()) {
                FXP_LOG_DEBUG(LogCategory::Parser,
                              "dropping " + event.type + " event without an actor");
                continue;
            }
            if (seen.insert(identityKey(event)).second) {
                events.push_back(std::move(event));
            }
        }
    } catch (const std::exception& e) {
        FXP_LOG_WARN(LogCategory::Parser, std::string("line skipped: ") + e.what());
        events.clear();
    }

    if (events.empty()) {
        FXP_LOG_TRACE(LogCategory::Parser, "no events in line");
    }
    return events;
}

void EventExtractor::derive(const CompiledRule& rule, std::string_view line,
                            const Captures& caps, Timestamp ts,
                            std::vector<Event>& out) const {
    auto killer = capture(caps, "killer");
    auto victim = capture(caps, "victim");
    auto name = capture(caps, "name");
    const auto& type = rule.eventType;

    if (type == event_type::kKill) {
        EventAttributes attrs;
        putIfPresent(attrs, "victim", victim);
        out.push_back(makeEvent(ts, event_type::kKill, killer, attrs));
        if (containsHeadshot(line, caps)) {
            out.push_back(makeEvent(ts, event_type::kHeadshot, killer, attrs));
        }
    } else if (type == event_type::kDeath) {
        EventAttributes attrs;
        putIfPresent(attrs, "killer", killer);
        out.push_back(makeEvent(ts, event_type::kDeath, victim, std::move(attrs)));
    } else if (type == event_type::kSurvive) {
        out.push_back(makeEvent(ts, event_type::kSurvive, name));
    } else if (type == event_type::kExtract) {
        out.push_back(makeEvent(ts, event_type::kExtract, name));
        out.push_back(makeEvent(ts, event_type::kSurvive, name,
                                {{"from", std::string(event_type::kExtract)}}));
    } else if (type == event_type::kDogtag) {
        EventAttributes attrs;
        for (const char* key : {"victim", "level", "side", "weapon", "status"}) {
            putIfPresent(attrs, key, capture(caps, key));
        }
        out.push_back(makeEvent(ts, event_type::kDogtag, firstNonEmpty(name, killer, victim),
                                std::move(attrs)));
    } else {
        EventAttributes attrs;
        for (const auto& [key, value] : caps) {
            if (key == "ts") {
                continue;
            }
            putIfPresent(attrs, key.c_str(), trimCopy(value));
        }
        out.push_back(makeEvent(ts, type, firstNonEmpty(name, killer, victim), std::move(attrs)));
    }
}

bool EventExtractor::containsHeadshot(std::string_view line, const Captures& caps) const {
    if (!capture(caps, "headshot").empty() || !capture(caps, "hs").empty()) {
        return true;
    }
    auto upper = toUpperCopy(line);
    for (const auto& keyword : rules_->headshotKeywords()) {
        if (upper.find(keyword) != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace fxp::ingest
