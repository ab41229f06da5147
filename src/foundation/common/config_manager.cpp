/// @file config_manager.cpp
/// @brief ConfigManager: yaml-cpp document flattened into dotted keys.

#include "fxp/foundation/config_manager.hpp"

#include <algorithm>

namespace fxp::foundation {

GameResult<void> ConfigManager::load(const std::filesystem::path& path) {
    try {
        return replace(YAML::LoadFile(path.string()));
    } catch (const YAML::BadFile&) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, "cannot open config file", path.string()));
    } catch (const YAML::ParserException& e) {
        return GameResult<void>::err(GameError(ErrorCode::ConfigLoadFailed,
                                               std::string("YAML parse error: ") + e.what(),
                                               path.string()));
    }
}

GameResult<void> ConfigManager::loadString(std::string_view yaml) {
    try {
        return replace(YAML::Load(std::string(yaml)));
    } catch (const YAML::ParserException& e) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

GameResult<void> ConfigManager::replace(const YAML::Node& root) {
    if (!root.IsNull() && !root.IsMap()) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, "top level of a config document must be a mapping"));
    }
    std::lock_guard lock(mutex_);
    entries_.clear();
    order_.clear();
    flatten("", root);
    return GameResult<void>::ok();
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

std::vector<std::string> ConfigManager::childKeys(std::string_view prefix) const {
    std::lock_guard lock(mutex_);
    std::string head = std::string(prefix) + ".";
    std::vector<std::string> children;
    for (const auto& key : order_) {
        if (key.size() <= head.size() || key.compare(0, head.size(), head) != 0) {
            continue;
        }
        auto rest = key.substr(head.size());
        auto child = rest.substr(0, rest.find('.'));
        if (std::find(children.begin(), children.end(), child) == children.end()) {
            children.push_back(std::move(child));
        }
    }
    return children;
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else if (!prefix.empty()) {
        // Leaf node (scalar, sequence, null) stored under its dotted key.
        store(prefix, YAML::Clone(node));
    }
}

void ConfigManager::store(const std::string& key, YAML::Node node) {
    // Replace rather than assign: YAML::Node assignment writes through
    // to the node it currently references.
    if (entries_.erase(key) == 0) {
        order_.push_back(key);
    }
    entries_.emplace(key, std::move(node));
}

}  // namespace fxp::foundation
