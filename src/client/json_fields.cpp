#include "json_fields.h"

#include <regex>
#include <stdexcept>

namespace tether::internal {

namespace {

std::string KeyPattern(std::string_view key, std::string_view value_pattern) {
    std::string pattern;
    pattern.reserve(key.size() + value_pattern.size() + 8);
    pattern += "\"";
    pattern += key;
    pattern += "\"";
    pattern += "\\s*:\\s*";
    pattern += value_pattern;
    return pattern;
}

std::optional<std::string> MatchFirstGroup(const std::string& text, const std::string& pattern) {
    const std::regex re(pattern);
    std::smatch m;
    if (!std::regex_search(text, m, re) || m.size() < 2) {
        return std::nullopt;
    }
    return m[1].str();
}

std::string JsonUnescape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '\\' || i + 1 == s.size()) {
            out += s[i];
            continue;
        }
        switch (s[++i]) {
        case 'n': out += '\n'; break;
        case 'r': out += '\r'; break;
        case 't': out += '\t'; break;
        default:
            out += s[i];
            break;
        }
    }
    return out;
}

}  // namespace

std::string JsonEscape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s) {
        switch (c) {
        case '\\': out += "\\\\"; break;
        case '"': out += "\\\""; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:
            out += c;
            break;
        }
    }
    return out;
}

std::optional<std::string> ExtractJsonStringField(const std::string& text, std::string_view key) {
    auto value = MatchFirstGroup(text, KeyPattern(key, "\"((?:[^\"\\\\]|\\\\.)*)\""));
    if (!value) {
        return std::nullopt;
    }
    return JsonUnescape(*value);
}

std::optional<long long> ExtractJsonIntField(const std::string& text, std::string_view key) {
    auto value = MatchFirstGroup(text, KeyPattern(key, "(-?[0-9]+)"));
    if (!value) {
        return std::nullopt;
    }
    try {
        return std::stoll(*value);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<bool> ExtractJsonBoolField(const std::string& text, std::string_view key) {
    auto value = MatchFirstGroup(text, KeyPattern(key, "(true|false)"));
    if (!value) {
        return std::nullopt;
    }
    return *value == "true";
}

std::optional<std::string> ExtractJsonObjectField(const std::string& text, std::string_view key) {
    return MatchFirstGroup(text, KeyPattern(key, "\\{([^}]*)\\}"));
}

std::string EraseJsonObjectField(const std::string& text, std::string_view key) {
    const std::regex re(KeyPattern(key, "\\{[^}]*\\}"));
    return std::regex_replace(text, re, "\"\":null");
}

}  // namespace tether::internal
