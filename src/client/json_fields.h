#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace tether::internal {

// Minimal field extraction for flat JSON documents (connection info files,
// server error bodies). Nested objects are handled by extracting the object
// body first and running the extractors over it.

std::string JsonEscape(std::string_view s);

std::optional<std::string> ExtractJsonStringField(const std::string& text, std::string_view key);
std::optional<long long> ExtractJsonIntField(const std::string& text, std::string_view key);
std::optional<bool> ExtractJsonBoolField(const std::string& text, std::string_view key);

// Body of a nested object value, without the braces. Nested objects inside
// that value are not supported.
std::optional<std::string> ExtractJsonObjectField(const std::string& text, std::string_view key);

// |text| with the "key": {...} member removed.
std::string EraseJsonObjectField(const std::string& text, std::string_view key);

}  // namespace tether::internal
