#ifndef CARBON_TRACKER_UTILS_JSON_H
#define CARBON_TRACKER_UTILS_JSON_H

#include <simdjson.h>

#include <cstdint>
#include <optional>
#include <string>

namespace carbon::tracker::json {
using JsonParser = simdjson::dom::parser;
using JsonDocument = simdjson::dom::element;

/**
 * Parse one JSON document. Returns std::nullopt on malformed input; the
 * returned element is only valid while `parser` is alive and unused.
 */
std::optional<JsonDocument> parse_json(JsonParser &parser, const char *data,
                                       std::size_t size);

bool has_field(const JsonDocument &doc, const char *key);
std::optional<JsonDocument> get_object_field(const JsonDocument &doc,
                                             const char *key);
std::string get_string_field(const JsonDocument &doc, const char *key);
std::uint64_t get_uint64_field(const JsonDocument &doc, const char *key);
}  // namespace carbon::tracker::json

#endif  // CARBON_TRACKER_UTILS_JSON_H
