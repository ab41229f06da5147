/// @file named_regex.cpp
/// @brief Named-group translation for std::regex.

#include "fxp/ingest/named_regex.hpp"

#include <cctype>
#include <unordered_map>

namespace fxp::ingest {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

namespace {

bool isNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Read `name` terminated by @p close starting at @p pos; advance past close.
bool readGroupName(std::string_view p, std::size_t& pos, char close, std::string& name) {
    name.clear();
    while (pos < p.size() && isNameChar(p[pos])) {
        name += p[pos++];
    }
    if (name.empty() || pos >= p.size() || p[pos] != close) {
        return false;
    }
    ++pos;
    return true;
}

struct Translation {
    std::string pattern;
    std::map<std::size_t, std::string> names;
    bool icase = false;
};

GameResult<Translation> translate(std::string_view p) {
    auto fail = [&](const std::string& why) {
        return GameResult<Translation>::err(GameError(
            ErrorCode::RuleCompileFailed, why + " in pattern: " + std::string(p)));
    };

    Translation t;
    std::unordered_map<std::string, std::size_t> byName;
    std::size_t groupCount = 0;
    std::size_t pos = 0;

    if (p.substr(0, 4) == "(?i)") {
        t.icase = true;
        pos = 4;
    }

    auto backReference = [&](const std::string& name) -> bool {
        auto it = byName.find(name);
        if (it == byName.end()) {
            return false;
        }
        // Wrapped so a following literal digit cannot extend the number.
        t.pattern += "(?:\\" + std::to_string(it->second) + ")";
        return true;
    };

    std::string name;
    while (pos < p.size()) {
        char c = p[pos];

        if (c == '\\') {
            if (pos + 1 >= p.size()) {
                return fail("trailing backslash");
            }
            if (p[pos + 1] == 'k' && pos + 2 < p.size() && p[pos + 2] == '<') {
                pos += 3;
                if (!readGroupName(p, pos, '>', name) || !backReference(name)) {
                    return fail("bad back-reference");
                }
                continue;
            }
            t.pattern.append(p.substr(pos, 2));
            pos += 2;
            continue;
        }

        if (c == '[') {
            // Copy the class verbatim; a leading ']' is a literal member.
            t.pattern += '[';
            ++pos;
            if (pos < p.size() && p[pos] == '^') {
                t.pattern += '^';
                ++pos;
            }
            if (pos < p.size() && p[pos] == ']') {
                t.pattern += "\\]";
                ++pos;
            }
            bool closed = false;
            while (pos < p.size()) {
                if (p[pos] == '\\' && pos + 1 < p.size()) {
                    t.pattern.append(p.substr(pos, 2));
                    pos += 2;
                    continue;
                }
                t.pattern += p[pos];
                if (p[pos++] == ']') {
                    closed = true;
                    break;
                }
            }
            if (!closed) {
                return fail("unterminated character class");
            }
            continue;
        }

        if (c == '(') {
            std::string_view rest = p.substr(pos);
            if (rest.substr(0, 4) == "(?P<" ||
                (rest.substr(0, 3) == "(?<" && rest.size() > 3 &&
                 rest[3] != '=' && rest[3] != '!')) {
                pos += rest[2] == 'P' ? 4 : 3;
                if (!readGroupName(p, pos, '>', name)) {
                    return fail("malformed group name");
                }
                if (byName.count(name) != 0) {
                    return fail("duplicate group name '" + name + "'");
                }
                ++groupCount;
                byName.emplace(name, groupCount);
                t.names.emplace(groupCount, name);
                t.pattern += '(';
                continue;
            }
            if (rest.substr(0, 4) == "(?P=") {
                pos += 4;
                if (!readGroupName(p, pos, ')', name) || !backReference(name)) {
                    return fail("bad back-reference");
                }
                continue;
            }
            if (rest.size() < 2 || rest[1] != '?') {
                ++groupCount;
            }
            t.pattern += '(';
            ++pos;
            continue;
        }

        t.pattern += c;
        ++pos;
    }
    return GameResult<Translation>::ok(std::move(t));
}

} // namespace

GameResult<NamedRegex> NamedRegex::compile(std::string_view pattern) {
    auto translated = translate(pattern);
    if (!translated) {
        return GameResult<NamedRegex>::err(translated.error());
    }

    NamedRegex rx;
    rx.source_ = std::string(pattern);
    rx.translated_ = std::move(translated.value().pattern);
    rx.names_ = std::move(translated.value().names);

    auto flags = std::regex::ECMAScript;
    if (translated.value().icase) {
        flags |= std::regex::icase;
    }
    try {
        rx.regex_ = std::regex(rx.translated_, flags);
    } catch (const std::regex_error& e) {
        return GameResult<NamedRegex>::err(GameError(
            ErrorCode::RuleCompileFailed,
            std::string("invalid pattern '") + rx.source_ + "': " + e.what()));
    }
    return GameResult<NamedRegex>::ok(std::move(rx));
}

bool NamedRegex::search(std::string_view text, Captures& out) const {
    out.clear();
    std::match_results<std::string_view::const_iterator> match;
    try {
        if (!std::regex_search(text.begin(), text.end(), match, regex_)) {
            return false;
        }
    } catch (const std::regex_error&) {
        // error_complexity / error_stack on pathological input
        return false;
    }
    for (const auto& [index, name] : names_) {
        if (index < match.size() && match[index].matched) {
            out.emplace(name, match[index].str());
        }
    }
    return true;
}

std::vector<std::string> NamedRegex::groupNames() const {
    std::vector<std::string> names;
    names.reserve(names_.size());
    for (const auto& [index, name] : names_) {
        names.push_back(name);
    }
    return names;
}

} // namespace fxp::ingest
