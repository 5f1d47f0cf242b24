#include <carbon/tracker/common/constants.h>
#include <carbon/tracker/parser/line_validator.h>

namespace carbon::tracker {

namespace {

// Optional string field: absent and null are fine, any other type is not.
bool read_optional_string(const json::JsonDocument &obj, const char *key,
                          std::string &out) {
    if (!json::has_field(obj, key)) {
        return true;
    }
    auto str = obj[key].value().get_string();
    if (str.error()) {
        return false;
    }
    out = std::string(str.value());
    return true;
}

bool read_optional_count(const json::JsonDocument &obj, const char *key,
                         std::uint64_t &out) {
    if (!json::has_field(obj, key)) {
        out = 0;
        return true;
    }
    if (!obj[key].value().is_number()) {
        return false;
    }
    out = json::get_uint64_field(obj, key);
    return true;
}

}  // namespace

LineResult validate_line(json::JsonParser &parser, const std::string &line,
                         const std::string &synthetic_id) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
        return LineResult::skip("blank line");
    }

    auto parsed = json::parse_json(parser, line.data(), line.size());
    if (!parsed || !parsed->is_object()) {
        return LineResult::skip("malformed JSON");
    }
    const json::JsonDocument &entry = *parsed;

    auto type_field = entry["type"];
    if (type_field.error() || !type_field.value().is_string()) {
        return LineResult::skip("missing type discriminator");
    }
    if (json::get_string_field(entry, "type") !=
        constants::parser::ASSISTANT_TYPE) {
        return LineResult::skip("not an assistant turn");
    }

    std::string request_id, uuid, parent_id;
    if (!read_optional_string(entry, "requestId", request_id) ||
        !read_optional_string(entry, "uuid", uuid) ||
        !read_optional_string(entry, "parentMessageId", parent_id)) {
        return LineResult::skip("identifier is not a string");
    }

    auto message = json::get_object_field(entry, "message");
    if (!message) {
        return LineResult::skip("no message payload");
    }
    auto usage = json::get_object_field(*message, "usage");
    if (!usage) {
        return LineResult::skip("no usage payload");
    }

    UsageRecord record;
    if (!read_optional_count(*usage, "input_tokens", record.input_tokens) ||
        !read_optional_count(*usage, "output_tokens", record.output_tokens) ||
        !read_optional_count(*usage, "cache_creation_input_tokens",
                             record.cache_creation_tokens) ||
        !read_optional_count(*usage, "cache_read_input_tokens",
                             record.cache_read_tokens)) {
        return LineResult::skip("token count is not a number");
    }

    std::string model;
    if (!read_optional_string(*message, "model", model)) {
        return LineResult::skip("model is not a string");
    }
    record.model = model.empty() ? constants::parser::UNKNOWN_MODEL : model;

    if (!request_id.empty()) {
        record.request_id = request_id;
    } else if (!uuid.empty()) {
        record.request_id = uuid;
    } else if (!parent_id.empty()) {
        record.request_id = parent_id;
    } else {
        record.request_id = synthetic_id;
    }

    std::string timestamp = json::get_string_field(entry, "timestamp");
    if (!timestamp.empty()) {
        record.timestamp = utils::parse_iso8601(timestamp);
    }

    return LineResult::valid(std::move(record));
}

}  // namespace carbon::tracker
