#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <carbon/tracker/parser/project_identifier.h>
#include <carbon/tracker/utils/hash.h>
#include <carbon/tracker/utils/logger.h>
#include <doctest/doctest.h>

#include <optional>
#include <string>

#include "testing_utilities.h"

using namespace carbon::tracker;
using namespace carbon_tracker_test;

TEST_CASE("Hashing") {
    CHECK(utils::sha256_hex("") ==
          "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    CHECK(utils::short_hash("") == "e3b0c442");
    CHECK(ProjectIdentifierResolver::project_hash("/a/b").size() == 8);

    std::string id = utils::generate_machine_user_id();
    REQUIRE(id.size() == 36);
    CHECK(id[8] == '-');
    CHECK(id[13] == '-');
    CHECK(id[18] == '-');
    CHECK(id[23] == '-');
    CHECK(id == utils::generate_machine_user_id());
}

TEST_CASE("Log level mapping") {
    CHECK(logger::set_log_level("DEBUG") == 0);
    CHECK(logger::get_log_level_string() == "debug");
    CHECK(logger::set_log_level("warning") == 0);
    CHECK(logger::get_log_level_int() == 3);
    CHECK(logger::set_log_level("bogus") == 0);
    CHECK(logger::get_log_level_string() == "info");
    CHECK(logger::set_log_level("") == -1);
    CHECK(carbon_tracker_set_log_level(nullptr) == -1);
    CHECK(carbon_tracker_set_log_level_int(7) == -1);
    CHECK(carbon_tracker_set_log_level_int(6) == 0);
    CHECK(std::string(carbon_tracker_get_log_level_string()) == "off");
}

TEST_CASE("Git remote parsing") {
    SUBCASE("HTTPS") {
        auto remote = parse_git_remote("https://github.com/acme/widgets.git");
        REQUIRE(remote.has_value());
        CHECK(remote->org == "acme");
        CHECK(remote->repo == "widgets");
        CHECK(parse_git_remote("https://gitlab.com/acme/widgets")->repo ==
              "widgets");
    }

    SUBCASE("SSH") {
        auto remote = parse_git_remote("git@github.com:acme/widgets.git");
        REQUIRE(remote.has_value());
        CHECK(remote->org == "acme");
        CHECK(remote->repo == "widgets");
    }

    SUBCASE("Unrecognized") {
        CHECK_FALSE(parse_git_remote("/srv/git/widgets.git").has_value());
        CHECK_FALSE(parse_git_remote("").has_value());
    }
}

TEST_CASE("Project identifier resolution") {
    TestEnvironment env;
    REQUIRE(env.is_valid());

    std::string plain = env.create_directory("plain");
    std::string repo = env.create_directory("repo");
    env.write_file("repo/.git/config",
                   "[core]\n\trepositoryformatversion = 0\n"
                   "[remote \"upstream\"]\n\turl = git@github.com:other/x.git\n"
                   "[remote \"origin\"]\n"
                   "\turl = https://github.com/acme/widgets.git\n"
                   "\tfetch = +refs/heads/*:refs/remotes/origin/*\n");

    SUBCASE("Local project") {
        ProjectIdentifierResolver resolver;
        CHECK(resolver.resolve(plain) ==
              "local_" + ProjectIdentifierResolver::project_hash(plain));
    }

    SUBCASE("Git origin") {
        ProjectIdentifierResolver resolver;
        CHECK(read_origin_url(repo) ==
              std::string("https://github.com/acme/widgets.git"));
        CHECK(resolver.resolve(repo) ==
              "acme_widgets_" + ProjectIdentifierResolver::project_hash(repo));
    }

    SUBCASE("Worktree pointing at a common git directory") {
        std::string worktree = env.create_directory("worktree");
        std::string gitdir = env.create_directory("repo/.git/worktrees/wt");
        env.write_file("worktree/.git", "gitdir: " + gitdir + "\n");
        env.write_file("repo/.git/worktrees/wt/commondir", "../..\n");
        CHECK(read_origin_url(worktree) ==
              std::string("https://github.com/acme/widgets.git"));
    }

    SUBCASE("Configured name wins") {
        std::string hash = ProjectIdentifierResolver::project_hash(repo);
        ProjectIdentifierResolver resolver(
            [hash](const std::string &h) -> std::optional<std::string> {
                if (h == hash) return std::string("website");
                return std::nullopt;
            });
        CHECK(resolver.resolve(repo) == "website_" + hash);
        CHECK(resolver.resolve(plain).rfind("local_", 0) == 0);
    }
}
