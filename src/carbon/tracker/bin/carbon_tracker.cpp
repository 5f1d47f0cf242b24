#include <carbon/tracker/carbon/format.h>
#include <carbon/tracker/common/config.h>
#include <carbon/tracker/common/constants.h>
#include <carbon/tracker/common/settings.h>
#include <carbon/tracker/ingest/ingestor.h>
#include <carbon/tracker/store/readonly.h>
#include <carbon/tracker/store/session_store.h>
#include <carbon/tracker/sync/error.h>
#include <carbon/tracker/sync/http_transport.h>
#include <carbon/tracker/sync/orchestrator.h>
#include <carbon/tracker/utils/hash.h>
#include <carbon/tracker/utils/json.h>
#include <carbon/tracker/utils/logger.h>
#include <carbon/tracker/utils/time.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <argparse/argparse.hpp>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>

using namespace carbon::tracker;

namespace {

struct HookPayload {
    std::string session_id;
    std::string project_path;
    std::string transcript_path;
};

// Hook payloads arrive as a single JSON object on stdin. "project_path"
// wins over "cwd" when both are present.
std::optional<HookPayload> read_hook_payload(std::istream &in) {
    std::string input((std::istreambuf_iterator<char>(in)),
                      std::istreambuf_iterator<char>());
    if (input.empty()) {
        return std::nullopt;
    }

    json::JsonParser parser;
    auto doc = json::parse_json(parser, input.data(), input.size());
    if (!doc) {
        spdlog::error("Hook payload is not valid JSON");
        return std::nullopt;
    }

    HookPayload payload;
    payload.session_id = json::get_string_field(*doc, "session_id");
    payload.project_path = json::get_string_field(*doc, "project_path");
    if (payload.project_path.empty()) {
        payload.project_path = json::get_string_field(*doc, "cwd");
    }
    payload.transcript_path = json::get_string_field(*doc, "transcript_path");
    return payload;
}

int run_ingest(const Settings &settings, const argparse::ArgumentParser &cmd) {
    HookPayload payload;
    payload.session_id = cmd.get<std::string>("--session-id");
    payload.project_path = cmd.get<std::string>("--project-path");
    payload.transcript_path = cmd.get<std::string>("--transcript");

    if (payload.session_id.empty() && payload.transcript_path.empty()) {
        auto from_stdin = read_hook_payload(std::cin);
        if (!from_stdin) {
            spdlog::error("No session id given on the command line or stdin");
            return 1;
        }
        payload = *from_stdin;
    }
    if (payload.session_id.empty() && payload.transcript_path.empty()) {
        spdlog::error("Hook payload carries neither session_id nor "
                      "transcript_path");
        return 1;
    }

    std::optional<SessionRecord> record;
    try {
        SessionStore store(settings.database_path());
        store.set_installed_at();
        Ingestor ingestor(settings, store);
        if (!payload.transcript_path.empty()) {
            record = ingestor.ingest(payload.transcript_path,
                                     payload.session_id, payload.project_path);
        } else {
            record = ingestor.ingest_session(payload.session_id,
                                             payload.project_path);
        }
    } catch (const std::exception &e) {
        spdlog::error("Ingestion failed: {}", e.what());
        return 1;
    }

    if (record && !cmd.get<bool>("--no-sync")) {
        HttpTransport transport(settings);
        sync_session_if_enabled(settings, transport, record->session_id);
    }
    return 0;
}

// Authentication failures end user-run syncs with the re-authentication
// hint on stderr; the hook path in run_ingest stays silent.
template <typename Fn>
int run_foreground_sync(Fn &&deliver) {
    try {
        return deliver() ? 0 : 1;
    } catch (const SyncError &e) {
        if (e.type() == SyncError::Type::AUTHENTICATION_ERROR) {
            std::cerr << e.what() << std::endl;
        } else {
            spdlog::error("Sync failed: {}", e.what());
        }
    } catch (const std::exception &e) {
        spdlog::error("Sync failed: {}", e.what());
    }
    return 1;
}

int run_sync(const Settings &settings) {
    HttpTransport transport(settings);
    return run_foreground_sync(
        [&]() { return batch_sync_now(settings, transport); });
}

int run_sync_session(const Settings &settings,
                     const argparse::ArgumentParser &cmd) {
    HttpTransport transport(settings);
    std::string session_id = cmd.get<std::string>("session_id");
    return run_foreground_sync(
        [&]() { return sync_session_now(settings, transport, session_id); });
}

int run_backfill(const Settings &settings) {
    try {
        SessionStore store(settings.database_path());
        store.set_installed_at();
        Ingestor ingestor(settings, store);
        std::size_t count = ingestor.backfill();
        std::cout << fmt::format("Backfilled {} session(s)", count)
                  << std::endl;
    } catch (const std::exception &e) {
        spdlog::error("Backfill failed: {}", e.what());
        return 1;
    }
    return 0;
}

struct StatusReport {
    AggregateStats stats;
    std::optional<utils::Timestamp> installed_at;
    std::size_t unsynced = 0;
    bool sync_enabled = false;
};

int run_status(const Settings &settings, const argparse::ArgumentParser &cmd) {
    std::string project = cmd.get<std::string>("--project");
    auto report = query_readonly(
        settings.database_path(), [&project](SessionStore &store) {
            StatusReport r;
            r.stats = store.get_aggregate_stats(project);
            r.installed_at = store.get_installed_at();
            r.unsynced = store.count_unsynced();
            r.sync_enabled = get_sync_identity(store).has_value();
            return r;
        });
    if (!report) {
        std::cout << "No sessions tracked yet" << std::endl;
        return 0;
    }

    const AggregateStats &s = report->stats;
    CarbonEquivalents eq = calculate_equivalents(s.total_co2_grams);
    std::cout << fmt::format("Sessions:   {}\n", s.total_sessions)
              << fmt::format("Tokens:     {} (in {}, out {}, cache write {}, "
                             "cache read {})\n",
                             s.total_tokens, s.total_input_tokens,
                             s.total_output_tokens,
                             s.total_cache_creation_tokens,
                             s.total_cache_read_tokens)
              << fmt::format("Energy:     {}\n",
                             format_energy(s.total_energy_wh))
              << fmt::format("CO2:        {}\n", format_co2(s.total_co2_grams))
              << fmt::format("            ~{:.2f} km driven, {:.1f} phone "
                             "charges, {:.1f} LED hours\n",
                             eq.km_driven, eq.phone_charges,
                             eq.led_light_hours)
              << fmt::format("Tracking since: {}\n",
                             utils::format_relative_time(report->installed_at))
              << fmt::format("Sync:       {} ({} pending)\n",
                             report->sync_enabled ? "enabled" : "disabled",
                             report->unsynced);
    return 0;
}

int run_enable_sync(const Settings &settings,
                    const argparse::ArgumentParser &cmd) {
    std::string name = cmd.get<std::string>("--name");
    if (name.empty()) {
        spdlog::error("--name must not be empty");
        return 1;
    }
    try {
        SessionStore store(settings.database_path());
        if (!store.get_config(constants::config_keys::USER_ID)) {
            store.set_config(constants::config_keys::USER_ID,
                             utils::generate_machine_user_id());
        }
        store.set_config(constants::config_keys::USER_NAME, name);
        store.set_config(constants::config_keys::SYNC_ENABLED, "true");
        store.set_installed_at();
    } catch (const std::exception &e) {
        spdlog::error("Could not enable sync: {}", e.what());
        return 1;
    }
    std::cout << "Sync enabled for " << name << std::endl;
    return 0;
}

int run_remove_project(const Settings &settings,
                       const argparse::ArgumentParser &cmd) {
    std::string identifier = cmd.get<std::string>("project_identifier");
    try {
        SessionStore store(settings.database_path());
        std::size_t removed = store.delete_project_sessions(identifier);
        std::cout << fmt::format("Removed {} session(s) of {}", removed,
                                 identifier)
                  << std::endl;
    } catch (const std::exception &e) {
        spdlog::error("Could not remove project {}: {}", identifier,
                      e.what());
        return 1;
    }
    return 0;
}

}  // namespace

int main(int argc, char *argv[]) {
    Settings settings = Settings::from_environment();

    argparse::ArgumentParser program("carbon-tracker",
                                     CARBON_TRACKER_PACKAGE_VERSION);
    program.add_description(
        "Estimate and track the energy use and CO2 emissions of assistant "
        "sessions");

    program.add_argument("--log-level")
        .help(
            "Set logging level (trace, debug, info, warn, error, critical, "
            "off)")
        .default_value<std::string>(settings.log_level());

    argparse::ArgumentParser ingest_cmd("ingest");
    ingest_cmd.add_description(
        "Ingest one session; reads the hook payload from stdin when no "
        "session is given");
    ingest_cmd.add_argument("-s", "--session-id")
        .help("Session id")
        .default_value(std::string(""));
    ingest_cmd.add_argument("-p", "--project-path")
        .help("Raw project path (decoded from the log directory if omitted)")
        .default_value(std::string(""));
    ingest_cmd.add_argument("-t", "--transcript")
        .help("Path to the session usage log")
        .default_value(std::string(""));
    ingest_cmd.add_argument("--no-sync")
        .help("Do not sync the session after ingesting it")
        .flag();

    argparse::ArgumentParser sync_cmd("sync");
    sync_cmd.add_description("Deliver every unsynced session");

    argparse::ArgumentParser sync_session_cmd("sync-session");
    sync_session_cmd.add_description("Deliver one session");
    sync_session_cmd.add_argument("session_id").help("Session id");

    argparse::ArgumentParser backfill_cmd("backfill");
    backfill_cmd.add_description(
        "Ingest every usage log whose session is not stored yet");

    argparse::ArgumentParser status_cmd("status");
    status_cmd.add_description("Show accumulated totals");
    status_cmd.add_argument("--project")
        .help("Restrict totals to one project identifier")
        .default_value(std::string(""));

    argparse::ArgumentParser enable_sync_cmd("enable-sync");
    enable_sync_cmd.add_description("Turn on sync under a display name");
    enable_sync_cmd.add_argument("-n", "--name")
        .help("Display name sent with every session")
        .required();

    argparse::ArgumentParser remove_project_cmd("remove-project");
    remove_project_cmd.add_description(
        "Delete every stored session of one project");
    remove_project_cmd.add_argument("project_identifier")
        .help("Project identifier as stored with the sessions");

    program.add_subparser(ingest_cmd);
    program.add_subparser(sync_cmd);
    program.add_subparser(sync_session_cmd);
    program.add_subparser(backfill_cmd);
    program.add_subparser(status_cmd);
    program.add_subparser(enable_sync_cmd);
    program.add_subparser(remove_project_cmd);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception &err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    std::string log_level = program.get<std::string>("--log-level");
    logger::init_stderr_logger(log_level);
    settings.set_log_level(log_level);

    if (program.is_subcommand_used(ingest_cmd)) {
        return run_ingest(settings, ingest_cmd);
    }
    if (program.is_subcommand_used(sync_cmd)) {
        return run_sync(settings);
    }
    if (program.is_subcommand_used(sync_session_cmd)) {
        return run_sync_session(settings, sync_session_cmd);
    }
    if (program.is_subcommand_used(backfill_cmd)) {
        return run_backfill(settings);
    }
    if (program.is_subcommand_used(status_cmd)) {
        return run_status(settings, status_cmd);
    }
    if (program.is_subcommand_used(enable_sync_cmd)) {
        return run_enable_sync(settings, enable_sync_cmd);
    }
    if (program.is_subcommand_used(remove_project_cmd)) {
        return run_remove_project(settings, remove_project_cmd);
    }

    std::cerr << program;
    return 1;
}
