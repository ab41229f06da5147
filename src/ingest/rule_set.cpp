/// @file rule_set.cpp
/// @brief RuleCompiler implementation.

#include "fxp/ingest/rule_set.hpp"

#include <string>

#include "fxp/foundation/game_logger.hpp"
#include "fxp/foundation/string_utils.hpp"

namespace fxp::ingest {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::toUpperCopy;
using foundation::trimCopy;

namespace {

GameResult<RuleSet> compileError(std::string message, std::string eventType = {}) {
    return GameResult<RuleSet>::err(
        GameError(ErrorCode::RuleCompileFailed, std::move(message), std::move(eventType)));
}

} // namespace

const CompiledRule* RuleSet::find(std::string_view eventType) const {
    auto wanted = toUpperCopy(eventType);
    for (const auto& rule : rules_) {
        if (rule.eventType == wanted) {
            return &rule;
        }
    }
    return nullptr;
}

const std::vector<std::string>& RuleCompiler::defaultHeadshotKeywords() {
    static const std::vector<std::string> keywords = {"HEADSHOT", "HS"};
    return keywords;
}

GameResult<RuleSet> RuleCompiler::compile(const YAML::Node& document) {
    if (!document || !document.IsMap()) {
        return compileError("rules document must be a mapping");
    }

    bool nested = static_cast<bool>(document["patterns"]);
    YAML::Node patterns = nested ? document["patterns"] : document;
    if (!patterns.IsMap()) {
        return compileError("'patterns' must be a mapping of event type to pattern");
    }

    RuleSet set;
    for (const auto& entry : patterns) {
        std::string rawName;
        try {
            rawName = entry.first.as<std::string>();
        } catch (const YAML::Exception&) {
            return compileError("event type names must be strings");
        }
        if (!nested && rawName == "headshot_keywords") {
            continue;
        }

        auto eventType = toUpperCopy(trimCopy(rawName));
        if (eventType.empty()) {
            return compileError("empty event type name");
        }
        if (set.find(eventType) != nullptr) {
            return compileError("duplicate rule for event type", eventType);
        }
        if (!entry.second.IsScalar()) {
            return compileError("pattern must be a string", eventType);
        }

        auto compiled = NamedRegex::compile(entry.second.Scalar());
        if (!compiled) {
            return compileError(std::string(compiled.error().message()), eventType);
        }
        set.rules_.push_back(CompiledRule{eventType, std::move(compiled).value()});
    }

    if (set.rules_.empty()) {
        return compileError("rules document defines no patterns");
    }

    if (auto keywords = document["headshot_keywords"]; keywords && !keywords.IsNull()) {
        if (!keywords.IsSequence()) {
            return compileError("'headshot_keywords' must be a list");
        }
        for (const auto& keyword : keywords) {
            if (!keyword.IsScalar()) {
                return compileError("headshot keywords must be strings");
            }
            auto upper = toUpperCopy(trimCopy(keyword.Scalar()));
            if (!upper.empty()) {
                set.headshotKeywords_.push_back(std::move(upper));
            }
        }
    }
    if (set.headshotKeywords_.empty()) {
        set.headshotKeywords_ = defaultHeadshotKeywords();
    }

    FXP_LOG_INFO(LogCategory::Parser,
                 "compiled " + std::to_string(set.rules_.size()) + " extraction rules, " +
                 std::to_string(set.headshotKeywords_.size()) + " headshot keywords");
    return GameResult<RuleSet>::ok(std::move(set));
}

GameResult<RuleSet> RuleCompiler::compileString(std::string_view yaml) {
    try {
        return compile(YAML::Load(std::string(yaml)));
    } catch (const YAML::Exception& e) {
        return compileError(std::string("failed to parse rules: ") + e.what());
    }
}

GameResult<RuleSet> RuleCompiler::compileFile(const std::filesystem::path& path) {
    YAML::Node document;
    try {
        document = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        return compileError("failed to load rules file " + path.string() + ": " + e.what());
    }
    return compile(document);
}

} // namespace fxp::ingest
