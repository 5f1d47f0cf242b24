#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <carbon/tracker/common/constants.h>
#include <carbon/tracker/ingest/ingestor.h>
#include <carbon/tracker/store/error.h>
#include <carbon/tracker/store/readonly.h>
#include <carbon/tracker/store/session_store.h>
#include <carbon/tracker/utils/filesystem.h>
#include <carbon/tracker/utils/time.h>
#include <doctest/doctest.h>

#include <chrono>
#include <string>

#include "testing_utilities.h"

using namespace carbon::tracker;
using namespace carbon_tracker_test;

TEST_CASE("Session store - open creates schema") {
    TestEnvironment env;
    REQUIRE(env.is_valid());

    std::string path = env.database_path();
    CHECK_FALSE(fs::exists(path));
    {
        SessionStore store(path);
        CHECK(store.schema_version() == 5);
    }
    CHECK(fs::exists(path));
}

TEST_CASE("Session store - upsert keeps created_at") {
    TestEnvironment env;
    REQUIRE(env.is_valid());
    SessionStore store(env.database_path());

    auto created = *utils::parse_iso8601("2025-01-15T10:00:00.000Z");
    SessionRecord record = make_session_record("s1", "local_abcd1234");
    record.created_at = created;
    record.updated_at = created;
    store.upsert_session(record);

    auto stored = store.get_session("s1");
    REQUIRE(stored.has_value());
    CHECK(stored->input_tokens == 1000);
    CHECK(stored->needs_sync);
    CHECK(utils::format_iso8601(stored->created_at) ==
          "2025-01-15T10:00:00.000Z");

    SUBCASE("Second upsert replaces counts, not the creation time") {
        SessionRecord updated = record;
        updated.input_tokens = 5000;
        updated.total_tokens = 5500;
        updated.created_at = created + std::chrono::hours(5);
        updated.updated_at = created + std::chrono::hours(6);
        store.upsert_session(updated);

        auto after = store.get_session("s1");
        REQUIRE(after.has_value());
        CHECK(after->input_tokens == 5000);
        CHECK(after->total_tokens == 5500);
        CHECK(utils::format_iso8601(after->created_at) ==
              "2025-01-15T10:00:00.000Z");
        CHECK(utils::format_iso8601(after->updated_at) ==
              "2025-01-15T16:00:00.000Z");
        CHECK(store.get_all_session_ids().size() == 1);
    }

    SUBCASE("Upsert marks a synced row dirty again") {
        store.mark_synced({record});
        CHECK_FALSE(store.get_session("s1")->needs_sync);
        store.upsert_session(record);
        CHECK(store.get_session("s1")->needs_sync);
    }

    CHECK(store.session_exists("s1"));
    CHECK_FALSE(store.session_exists("s2"));
    CHECK_FALSE(store.get_session("s2").has_value());
}

TEST_CASE("Session store - statistics") {
    TestEnvironment env;
    REQUIRE(env.is_valid());
    SessionStore store(env.database_path());

    store.upsert_session(make_session_record("a1", "proj_a", 1000, 500));
    store.upsert_session(make_session_record("a2", "proj_a", 2000, 0));
    store.upsert_session(make_session_record("b1", "proj_b", 100, 100));

    AggregateStats all = store.get_aggregate_stats();
    CHECK(all.total_sessions == 3);
    CHECK(all.total_tokens == 3700);
    CHECK(all.total_input_tokens == 3100);
    CHECK(all.total_output_tokens == 600);

    AggregateStats a = store.get_aggregate_stats("proj_a");
    CHECK(a.total_sessions == 2);
    CHECK(a.total_tokens == 3500);

    AggregateStats none = store.get_aggregate_stats("proj_missing");
    CHECK(none.total_sessions == 0);
    CHECK(none.total_co2_grams == 0.0);

    auto daily = store.get_daily_stats(7);
    REQUIRE(daily.size() == 1);
    CHECK(daily[0].sessions == 3);
    CHECK(daily[0].tokens == 3700);

    auto projects = store.get_project_stats(7);
    REQUIRE(projects.size() == 2);
    CHECK(projects[0].tokens + projects[1].tokens == 3700);

    SUBCASE("Project removal") {
        CHECK(store.delete_project_sessions("proj_a") == 2);
        CHECK(store.get_aggregate_stats().total_sessions == 1);
        CHECK(store.delete_project_sessions("proj_a") == 0);
    }
}

TEST_CASE("Session store - configuration") {
    TestEnvironment env;
    REQUIRE(env.is_valid());
    SessionStore store(env.database_path());

    CHECK_FALSE(store.get_config("sync_enabled").has_value());
    store.set_config("sync_enabled", "true");
    CHECK(store.get_config("sync_enabled") == std::string("true"));
    store.set_config("sync_enabled", "false");
    CHECK(store.get_config("sync_enabled") == std::string("false"));
    store.delete_config("sync_enabled");
    CHECK_FALSE(store.get_config("sync_enabled").has_value());

    store.set_project_config("abcd1234", "project_name", "website");
    CHECK(store.get_project_config("abcd1234", "project_name") ==
          std::string("website"));
    CHECK_FALSE(
        store.get_project_config("ffff0000", "project_name").has_value());
    store.delete_project_config("abcd1234", "project_name");
    CHECK_FALSE(
        store.get_project_config("abcd1234", "project_name").has_value());

    SUBCASE("installed_at is written once") {
        auto first = *utils::parse_iso8601("2025-02-01T00:00:00.000Z");
        store.set_installed_at(first);
        store.set_installed_at(first + std::chrono::hours(48));
        auto installed = store.get_installed_at();
        REQUIRE(installed.has_value());
        CHECK(utils::format_iso8601(*installed) ==
              "2025-02-01T00:00:00.000Z");
    }
}

TEST_CASE("Session store - unsynced bookkeeping") {
    TestEnvironment env;
    REQUIRE(env.is_valid());
    SessionStore store(env.database_path());

    for (int i = 0; i < 5; ++i) {
        store.upsert_session(
            make_session_record("s" + std::to_string(i), "proj"));
    }
    CHECK(store.count_unsynced() == 5);

    auto batch = store.get_unsynced_sessions(3);
    REQUIRE(batch.size() == 3);
    CHECK(store.mark_synced(batch) == 3);
    CHECK(store.count_unsynced() == 2);

    SUBCASE("A row updated after it was read stays dirty") {
        auto rest = store.get_unsynced_sessions();
        REQUIRE(rest.size() == 2);
        SessionRecord changed = rest[0];
        changed.updated_at += std::chrono::seconds(30);
        changed.output_tokens += 10;
        store.upsert_session(changed);

        CHECK(store.mark_synced(rest) == 1);
        CHECK(store.count_unsynced() == 1);
        CHECK(store.get_session(changed.session_id)->needs_sync);
    }

    SUBCASE("A rewrite with an unchanged updated_at stays dirty") {
        auto rest = store.get_unsynced_sessions();
        REQUIRE(rest.size() == 2);
        SessionRecord changed = rest[0];
        changed.total_tokens += 200;
        changed.input_tokens += 200;
        store.upsert_session(changed);

        auto stored = store.get_session(changed.session_id);
        REQUIRE(stored.has_value());
        CHECK(stored->revision == rest[0].revision + 1);
        CHECK(stored->updated_at == rest[0].updated_at);

        CHECK(store.mark_synced(rest) == 1);
        CHECK(store.get_session(changed.session_id)->needs_sync);
        CHECK(store.mark_synced({*stored}) == 1);
        CHECK(store.count_unsynced() == 0);
    }
}

TEST_CASE("Session store - read-only access") {
    TestEnvironment env;
    REQUIRE(env.is_valid());
    std::string path = env.database_path();

    auto missing = query_readonly(
        path, [](SessionStore &store) { return store.count_unsynced(); });
    CHECK_FALSE(missing.has_value());
    CHECK_FALSE(fs::exists(path));

    with_store(path, [](SessionStore &store) {
        store.upsert_session(make_session_record("s1", "proj"));
    });

    auto count = query_readonly(
        path, [](SessionStore &store) { return store.count_unsynced(); });
    REQUIRE(count.has_value());
    CHECK(*count == 1);

    SessionStore reader(path, SqliteDatabase::Mode::READ_ONLY);
    CHECK_THROWS_AS(reader.set_config("k", "v"), StoreError);
}

TEST_CASE("Ingestor - parse, calculate and store") {
    TestEnvironment env;
    REQUIRE(env.is_valid());
    Settings settings = env.settings();
    SessionStore store(settings.database_path());
    Ingestor ingestor(settings, store);

    UsageLine line;
    line.request_id = "req_1";
    line.input_tokens = 600;
    line.output_tokens = 400;
    line.timestamp = "2025-03-01T12:00:00.000Z";
    env.create_transcript("-tmp-project", "sess-1", {make_usage_line(line)});
    env.create_transcript("-tmp-project", "sess-empty",
                          {R"({"type":"user"})"});

    auto record = ingestor.ingest_session("sess-1", "/tmp/project");
    REQUIRE(record.has_value());
    CHECK(record->total_tokens == 1000);
    CHECK(record->energy_wh == doctest::Approx(0.018));
    CHECK(record->project_identifier.rfind("local_", 0) == 0);
    CHECK(utils::format_iso8601(record->created_at) ==
          "2025-03-01T12:00:00.000Z");
    CHECK(store.session_exists("sess-1"));

    CHECK_FALSE(ingestor.ingest_session("sess-empty").has_value());
    CHECK_FALSE(ingestor.ingest_session("sess-missing").has_value());

    SUBCASE("Backfill skips stored sessions") {
        env.create_transcript("-tmp-other", "sess-2",
                              {make_usage_line(line)});
        CHECK(ingestor.backfill() == 1);
        CHECK(ingestor.backfill() == 0);
        CHECK(store.get_all_session_ids().size() == 2);
    }
}

TEST_CASE("Timestamps") {
    auto ts = utils::parse_iso8601("2025-01-15T10:30:00.250Z");
    REQUIRE(ts.has_value());
    CHECK(utils::format_iso8601(*ts) == "2025-01-15T10:30:00.250Z");
    auto whole = utils::parse_iso8601("2025-01-15T10:30:00Z");
    REQUIRE(whole.has_value());
    CHECK(utils::format_iso8601(*whole) == "2025-01-15T10:30:00.000Z");
    CHECK_FALSE(utils::parse_iso8601("yesterday").has_value());

    utils::Timestamp now = *ts;
    CHECK(utils::format_relative_time(std::nullopt, now) == "never");
    CHECK(utils::format_relative_time(now - std::chrono::seconds(20), now) ==
          "just now");
    CHECK(utils::format_relative_time(now - std::chrono::minutes(1), now) ==
          "1 minute ago");
    CHECK(utils::format_relative_time(now - std::chrono::minutes(5), now) ==
          "5 minutes ago");
    CHECK(utils::format_relative_time(now - std::chrono::hours(3), now) ==
          "3 hours ago");
    CHECK(utils::format_relative_time(now - std::chrono::hours(49), now) ==
          "2 days ago");
}
