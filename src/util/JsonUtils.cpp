#include "util/JsonUtils.hpp"
#include <memory>

namespace minstrel::util {

std::optional<Json::Value> parse_json(const std::string& text, std::string* errors) {
    Json::CharReaderBuilder builder;
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string parse_errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &parse_errors)) {
        if (errors) *errors = parse_errors;
        return std::nullopt;
    }
    return root;
}

std::string write_json(const Json::Value& value, bool pretty) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = pretty ? "  " : "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

std::string json_string(const Json::Value& object, const char* key, const std::string& fallback) {
    if (!object.isObject()) return fallback;
    const Json::Value& value = object[key];
    return value.isString() ? value.asString() : fallback;
}

int64_t json_int64(const Json::Value& object, const char* key, int64_t fallback) {
    if (!object.isObject()) return fallback;
    const Json::Value& value = object[key];
    return value.isIntegral() ? value.asInt64() : fallback;
}

}  // namespace minstrel::util
