#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <carbon/tracker/parser/line_validator.h>
#include <carbon/tracker/parser/session_parser.h>
#include <carbon/tracker/parser/transcripts.h>
#include <carbon/tracker/utils/filesystem.h>
#include <carbon/tracker/utils/time.h>
#include <doctest/doctest.h>

#include <string>
#include <vector>

#include "testing_utilities.h"

using namespace carbon::tracker;
using namespace carbon_tracker_test;

TEST_CASE("Line validator - accepted and skipped lines") {
    json::JsonParser parser;

    SUBCASE("Assistant turn with usage") {
        UsageLine line;
        line.request_id = "req_1";
        line.input_tokens = 100;
        line.output_tokens = 50;
        line.cache_read_tokens = 10;
        line.timestamp = "2025-01-15T10:30:00.000Z";
        auto result = validate_line(parser, make_usage_line(line), "syn");
        REQUIRE(result.is_valid());
        CHECK(result.record.request_id == "req_1");
        CHECK(result.record.model == "claude-sonnet-4-20250514");
        CHECK(result.record.total_tokens() == 160);
        CHECK(result.record.timestamp.has_value());
    }

    SUBCASE("Non-assistant turn is skipped") {
        auto result = validate_line(
            parser, R"({"type":"user","message":{"content":"hi"}})", "syn");
        CHECK_FALSE(result.is_valid());
    }

    SUBCASE("Malformed JSON is skipped") {
        auto result = validate_line(parser, "{not json", "syn");
        CHECK_FALSE(result.is_valid());
        CHECK(result.reason == "malformed JSON");
    }

    SUBCASE("Assistant turn without usage is skipped") {
        auto result = validate_line(
            parser, R"({"type":"assistant","message":{"model":"x"}})", "syn");
        CHECK_FALSE(result.is_valid());
    }

    SUBCASE("Wrongly typed token count is skipped") {
        auto result = validate_line(
            parser,
            R"({"type":"assistant","message":{"usage":{"input_tokens":"12"}}})",
            "syn");
        CHECK_FALSE(result.is_valid());
    }

    SUBCASE("Missing counts default to zero and model to unknown") {
        auto result = validate_line(
            parser,
            R"({"type":"assistant","uuid":"u-1","message":{"usage":{"output_tokens":7}}})",
            "syn");
        REQUIRE(result.is_valid());
        CHECK(result.record.model == "unknown");
        CHECK(result.record.input_tokens == 0);
        CHECK(result.record.output_tokens == 7);
        CHECK(result.record.request_id == "u-1");
    }

    SUBCASE("Synthetic id when no identifier is present") {
        auto result = validate_line(
            parser,
            R"({"type":"assistant","message":{"usage":{"input_tokens":1}}})",
            "synthetic-a.jsonl-3");
        REQUIRE(result.is_valid());
        CHECK(result.record.request_id == "synthetic-a.jsonl-3");
    }
}

TEST_CASE("Session parser - deduplication by request id") {
    TestEnvironment env;
    REQUIRE(env.is_valid());

    UsageLine first;
    first.request_id = "req_1";
    first.input_tokens = 100;
    first.output_tokens = 50;
    UsageLine repeated = first;
    repeated.output_tokens = 999;  // streamed update of the same request
    UsageLine second;
    second.request_id = "req_2";
    second.input_tokens = 10;
    second.output_tokens = 5;

    std::string transcript = env.create_transcript(
        "-tmp-project", "session-1",
        {make_usage_line(first), make_usage_line(repeated),
         make_usage_line(second)});

    SessionParser parser;
    ParseStats stats;
    auto records = parser.parse_file(transcript, &stats);
    REQUIRE(records.size() == 2);
    CHECK(records[0].output_tokens == 50);
    CHECK(stats.duplicates == 1);
    CHECK(stats.records == 2);

    SessionUsage usage = parser.parse(transcript, "/tmp/project");
    CHECK(usage.session_id == "session-1");
    CHECK(usage.project_path == "/tmp/project");
    CHECK(usage.totals.input_tokens == 110);
    CHECK(usage.totals.output_tokens == 55);
    CHECK(usage.totals.total_tokens() == 165);
}

TEST_CASE("Session parser - malformed lines do not abort parsing") {
    TestEnvironment env;
    REQUIRE(env.is_valid());

    UsageLine good;
    good.request_id = "req_ok";
    good.input_tokens = 20;
    std::string transcript = env.create_transcript(
        "-tmp-project", "session-2",
        {"{truncated", R"({"type":"summary","summary":"x"})", "",
         make_usage_line(good)});

    SessionParser parser;
    ParseStats stats;
    auto records = parser.parse_file(transcript, &stats);
    REQUIRE(records.size() == 1);
    CHECK(records[0].request_id == "req_ok");
    CHECK(stats.skipped == 2);
    CHECK(stats.lines == 3);
}

TEST_CASE("Session parser - subagent logs are folded in") {
    TestEnvironment env;
    REQUIRE(env.is_valid());

    UsageLine main_line;
    main_line.request_id = "req_main";
    main_line.input_tokens = 100;
    std::string transcript = env.create_transcript(
        "-tmp-project", "session-3", {make_usage_line(main_line)});

    UsageLine agent_line;
    agent_line.request_id = "req_agent";
    agent_line.model = "claude-3-5-haiku-20241022";
    agent_line.input_tokens = 40;
    env.create_subagent_log(transcript, "a1", {make_usage_line(agent_line)});
    // Not an agent log; ignored
    env.write_file("other.jsonl", make_usage_line(agent_line));

    auto subagents = find_subagent_logs(transcript);
    REQUIRE(subagents.size() == 1);
    CHECK(fs::path(subagents[0]).filename() == "agent-a1.jsonl");

    SessionParser parser;
    SessionUsage usage = parser.parse(transcript, "/tmp/project");
    CHECK(usage.records.size() == 2);
    CHECK(usage.totals.input_tokens == 140);
    CHECK(usage.model_breakdown.size() == 2);
}

TEST_CASE("Session parser - primary model and time range") {
    TestEnvironment env;
    REQUIRE(env.is_valid());

    UsageLine sonnet;
    sonnet.request_id = "r1";
    sonnet.input_tokens = 100;
    sonnet.timestamp = "2025-01-15T10:00:00.000Z";
    UsageLine opus;
    opus.request_id = "r2";
    opus.model = "claude-opus-4-20250514";
    opus.input_tokens = 300;
    opus.timestamp = "2025-01-15T11:00:00.000Z";
    UsageLine sonnet_again;
    sonnet_again.request_id = "r3";
    sonnet_again.input_tokens = 150;
    sonnet_again.timestamp = "2025-01-15T09:00:00.000Z";

    std::string transcript = env.create_transcript(
        "-tmp-project", "session-4",
        {make_usage_line(sonnet), make_usage_line(opus),
         make_usage_line(sonnet_again)});

    SessionParser parser;
    SessionUsage usage = parser.parse(transcript, "/tmp/project");
    CHECK(usage.primary_model == "claude-opus-4-20250514");
    REQUIRE(usage.started_at.has_value());
    REQUIRE(usage.ended_at.has_value());
    CHECK(utils::format_iso8601(*usage.started_at) ==
          "2025-01-15T09:00:00.000Z");
    CHECK(utils::format_iso8601(*usage.ended_at) ==
          "2025-01-15T11:00:00.000Z");

    SUBCASE("Ties go to the model seen first") {
        UsageLine a;
        a.request_id = "t1";
        a.model = "model-a";
        a.input_tokens = 10;
        UsageLine b = a;
        b.request_id = "t2";
        b.model = "model-b";
        std::string tie = env.create_transcript(
            "-tmp-project", "session-tie",
            {make_usage_line(a), make_usage_line(b)});
        CHECK(parser.parse(tie, "/tmp/project").primary_model == "model-a");
    }
}

TEST_CASE("Session parser - missing transcript yields an empty summary") {
    TestEnvironment env;
    REQUIRE(env.is_valid());

    SessionParser parser;
    SessionUsage usage =
        parser.parse(env.get_dir() + "/-nowhere/absent.jsonl", "/nowhere");
    CHECK(usage.empty());
    CHECK(usage.session_id == "absent");
    CHECK(usage.primary_model == "unknown");
    CHECK(usage.totals.total_tokens() == 0);
}

TEST_CASE("Transcript discovery") {
    TestEnvironment env;
    REQUIRE(env.is_valid());
    Settings settings = env.settings();

    env.create_transcript("-work-alpha", "s-a", {});
    env.create_transcript("-work-beta", "s-b", {});

    CHECK(find_all_transcripts(settings).size() == 2);
    auto found = find_transcript_path(settings, "s-b");
    REQUIRE(found.has_value());
    CHECK(session_id_from_path(*found) == "s-b");
    CHECK_FALSE(find_transcript_path(settings, "s-missing").has_value());
}
