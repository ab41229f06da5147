/// @file event.cpp
/// @brief Event identity and attribute (de)serialization via nlohmann::json.

#include "fxp/ingest/event.hpp"

#include <nlohmann/json.hpp>

#include "fxp/foundation/time_utils.hpp"

namespace fxp::ingest {

using json = nlohmann::json;

std::string Event::attribute(std::string_view key) const {
    auto it = attributes.find(std::string(key));
    return it != attributes.end() ? it->second : std::string();
}

std::string identityKey(const Event& event) {
    std::string key;
    key.reserve(64);
    key += event.type;
    key += '|';
    key += foundation::formatIso8601(event.timestamp);
    key += '|';
    key += event.actor;
    key += '|';

    if (event.type == event_type::kKill || event.type == event_type::kHeadshot ||
        event.type == event_type::kDogtag) {
        key += event.attribute("victim");
    } else if (event.type == event_type::kDeath) {
        key += event.attribute("killer");
    } else if (event.type == event_type::kSurvive) {
        key += event.attribute("from");
    } else if (event.type != event_type::kExtract) {
        key += attributesToJson(event.attributes);
    }
    return key;
}

std::string attributesToJson(const EventAttributes& attributes) {
    json doc = json::object();
    for (const auto& [k, v] : attributes) {
        doc[k] = v;
    }
    // Log lines are not guaranteed to be valid UTF-8.
    return doc.dump(-1, ' ', false, json::error_handler_t::replace);
}

EventAttributes attributesFromJson(std::string_view text) {
    EventAttributes attributes;
    auto doc = json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return attributes;
    }
    for (const auto& [k, v] : doc.items()) {
        if (v.is_string()) {
            attributes.emplace(k, v.get<std::string>());
        } else if (!v.is_null() && !v.is_structured()) {
            attributes.emplace(k, v.dump());
        }
    }
    return attributes;
}

} // namespace fxp::ingest
