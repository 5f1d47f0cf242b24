#include <carbon/tracker/common/constants.h>
#include <carbon/tracker/parser/path_codec.h>
#include <carbon/tracker/parser/transcripts.h>
#include <carbon/tracker/utils/filesystem.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>

namespace carbon::tracker {

using namespace carbon::tracker::constants::parser;

namespace {
bool has_prefix(const std::string &value, const std::string &prefix) {
    return value.compare(0, prefix.size(), prefix) == 0;
}
}  // namespace

std::optional<std::string> find_transcript_path(
    const Settings &settings, const std::string &session_id,
    const std::string &project_path) {
    const fs::path projects_dir(settings.projects_dir());
    const std::string file_name = session_id + LOG_EXTENSION;
    std::error_code ec;

    if (!project_path.empty()) {
        fs::path candidate =
            projects_dir / encode_project_path(project_path) / file_name;
        if (fs::is_regular_file(candidate, ec)) {
            return candidate.string();
        }
    }

    if (!fs::is_directory(projects_dir, ec)) {
        return std::nullopt;
    }
    for (fs::directory_iterator it(projects_dir, ec), end; !ec && it != end;
         it.increment(ec)) {
        fs::path candidate = it->path() / file_name;
        if (fs::is_regular_file(candidate, ec)) {
            return candidate.string();
        }
    }
    if (ec) {
        spdlog::debug("Error scanning {}: {}", projects_dir.string(),
                      ec.message());
    }
    return std::nullopt;
}

std::vector<std::string> find_all_transcripts(const Settings &settings) {
    std::vector<std::string> transcripts;
    const fs::path projects_dir(settings.projects_dir());
    std::error_code ec;
    if (!fs::is_directory(projects_dir, ec)) {
        return transcripts;
    }

    for (fs::directory_iterator it(projects_dir, ec), end; !ec && it != end;
         it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_directory(entry_ec)) continue;
        for (fs::directory_iterator file(it->path(), entry_ec), fend;
             !entry_ec && file != fend; file.increment(entry_ec)) {
            if (file->path().extension() == LOG_EXTENSION &&
                file->is_regular_file(entry_ec)) {
                transcripts.push_back(file->path().string());
            }
        }
    }
    std::sort(transcripts.begin(), transcripts.end());
    return transcripts;
}

std::vector<std::string> find_subagent_logs(
    const std::string &transcript_path) {
    std::vector<std::string> logs;
    fs::path primary(transcript_path);
    fs::path subagents_dir =
        primary.parent_path() / primary.stem() / SUBAGENT_DIR;

    std::error_code ec;
    if (!fs::is_directory(subagents_dir, ec)) {
        return logs;
    }
    for (fs::directory_iterator it(subagents_dir, ec), end; !ec && it != end;
         it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (has_prefix(name, SUBAGENT_PREFIX) &&
            it->path().extension() == LOG_EXTENSION) {
            logs.push_back(it->path().string());
        }
    }
    std::sort(logs.begin(), logs.end());
    return logs;
}

std::string session_id_from_path(const std::string &transcript_path) {
    fs::path path(transcript_path);
    if (path.extension() == LOG_EXTENSION) {
        return path.stem().string();
    }
    return path.filename().string();
}

}  // namespace carbon::tracker
