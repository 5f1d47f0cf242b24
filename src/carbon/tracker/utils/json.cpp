#include <carbon/tracker/utils/json.h>

#include <cmath>

namespace carbon::tracker::json {

std::optional<JsonDocument> parse_json(JsonParser &parser, const char *data,
                                       std::size_t size) {
    auto doc = parser.parse(data, size);
    if (doc.error()) {
        return std::nullopt;
    }
    return doc.value();
}

bool has_field(const JsonDocument &doc, const char *key) {
    if (!doc.is_object()) return false;
    auto field = doc[key];
    return !field.error() && !field.value().is_null();
}

std::optional<JsonDocument> get_object_field(const JsonDocument &doc,
                                             const char *key) {
    if (!doc.is_object()) return std::nullopt;
    auto field = doc[key];
    if (field.error() || !field.value().is_object()) {
        return std::nullopt;
    }
    return field.value();
}

std::string get_string_field(const JsonDocument &doc, const char *key) {
    if (!doc.is_object()) return "";

    auto field = doc[key];
    if (field.error()) return "";

    auto str_result = field.value().get_string();
    if (str_result.error()) return "";
    return std::string(str_result.value());
}

std::uint64_t get_uint64_field(const JsonDocument &doc, const char *key) {
    if (!doc.is_object()) return 0;

    auto field = doc[key];
    if (field.error()) return 0;

    auto value = field.value();
    if (value.is_uint64()) {
        return value.get_uint64().value();
    } else if (value.is_int64()) {
        auto v = value.get_int64().value();
        return v < 0 ? 0 : static_cast<std::uint64_t>(v);
    } else if (value.is_double()) {
        double v = value.get_double().value();
        if (!std::isfinite(v) || v < 0) return 0;
        return static_cast<std::uint64_t>(v);
    }
    // Token counts are never strings in the usage schema
    return 0;
}

}  // namespace carbon::tracker::json
