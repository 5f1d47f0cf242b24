#include "testing_utilities.h"

#include <carbon/tracker/common/constants.h>
#include <carbon/tracker/utils/filesystem.h>
#include <carbon/tracker/utils/logger.h>
#include <carbon/tracker/utils/time.h>
#include <fmt/format.h>

#include <fstream>
#include <random>

namespace carbon_tracker_test {

using namespace carbon::tracker;

std::string make_usage_line(const UsageLine& line) {
    std::string out = R"({"type":"assistant")";
    if (!line.request_id.empty()) {
        out += fmt::format(R"(,"requestId":"{}")", line.request_id);
    }
    if (!line.timestamp.empty()) {
        out += fmt::format(R"(,"timestamp":"{}")", line.timestamp);
    }
    out += fmt::format(
        R"(,"message":{{"model":"{}","usage":{{"input_tokens":{},)"
        R"("output_tokens":{},"cache_creation_input_tokens":{},)"
        R"("cache_read_input_tokens":{}}}}}}})",
        line.model, line.input_tokens, line.output_tokens,
        line.cache_creation_tokens, line.cache_read_tokens);
    return out;
}

SessionRecord make_session_record(const std::string& session_id,
                                  const std::string& project_identifier,
                                  std::uint64_t input_tokens,
                                  std::uint64_t output_tokens) {
    SessionRecord record;
    record.session_id = session_id;
    record.project_path = "/work/" + project_identifier;
    record.project_identifier = project_identifier;
    record.input_tokens = input_tokens;
    record.output_tokens = output_tokens;
    record.total_tokens = input_tokens + output_tokens;
    record.energy_wh = static_cast<double>(record.total_tokens) * 0.000018;
    record.co2_grams = record.energy_wh * 0.3;
    record.primary_model = "claude-sonnet-4-20250514";
    record.created_at = utils::Clock::now();
    record.updated_at = record.created_at;
    return record;
}

TestEnvironment::TestEnvironment() {
    logger::set_log_level("off");
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(100000, 999999);

    fs::path temp_base = fs::temp_directory_path();
    fs::path test_path =
        temp_base / ("carbon_tracker_test_" + std::to_string(dis(gen)));

    std::error_code ec;
    if (fs::create_directories(test_path, ec)) {
        test_dir = test_path.string();
    }
}

TestEnvironment::~TestEnvironment() {
    if (!test_dir.empty()) {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }
}

const std::string& TestEnvironment::get_dir() const { return test_dir; }
bool TestEnvironment::is_valid() const { return !test_dir.empty(); }

Settings TestEnvironment::settings() const {
    Settings settings;
    settings.set_home_dir(test_dir).set_batch_delay(
        std::chrono::milliseconds(0));
    return settings;
}

std::string TestEnvironment::database_path() const {
    return settings().database_path();
}

std::string TestEnvironment::write_file(const std::string& relative_path,
                                        const std::string& content) {
    fs::path path = fs::path(test_dir) / relative_path;
    fs::create_directories(path.parent_path());
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    f << content;
    return path.string();
}

std::string TestEnvironment::create_directory(
    const std::string& relative_path) {
    fs::path path = fs::path(test_dir) / relative_path;
    fs::create_directories(path);
    return path.string();
}

std::string TestEnvironment::create_transcript(
    const std::string& project_dir, const std::string& session_id,
    const std::vector<std::string>& lines) {
    fs::path projects = fs::path(settings().projects_dir());
    fs::path path = projects / project_dir /
                    (session_id + constants::parser::LOG_EXTENSION);
    std::string content;
    for (const auto& line : lines) {
        content += line + "\n";
    }
    return write_file(fs::relative(path, test_dir).string(), content);
}

std::string TestEnvironment::create_subagent_log(
    const std::string& transcript_path, const std::string& agent_name,
    const std::vector<std::string>& lines) {
    fs::path transcript(transcript_path);
    fs::path path = transcript.parent_path() / transcript.stem() /
                    constants::parser::SUBAGENT_DIR /
                    (constants::parser::SUBAGENT_PREFIX + agent_name +
                     constants::parser::LOG_EXTENSION);
    std::string content;
    for (const auto& line : lines) {
        content += line + "\n";
    }
    return write_file(fs::relative(path, test_dir).string(), content);
}

}  // namespace carbon_tracker_test
