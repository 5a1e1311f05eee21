#pragma once

#include <optional>
#include <string>
#include <json/json.h>

namespace minstrel::util {

// Strict parse of a complete document; nullopt (with errors filled) on failure
std::optional<Json::Value> parse_json(const std::string& text, std::string* errors = nullptr);

// Compact by default, two-space indentation when pretty
std::string write_json(const Json::Value& value, bool pretty = false);

// Null-safe member accessors: missing key or wrong type yields fallback
std::string json_string(const Json::Value& object, const char* key, const std::string& fallback = "");
int64_t json_int64(const Json::Value& object, const char* key, int64_t fallback = 0);

}  // namespace minstrel::util
