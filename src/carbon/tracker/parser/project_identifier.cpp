#include <carbon/tracker/parser/project_identifier.h>
#include <carbon/tracker/utils/file.h>
#include <carbon/tracker/utils/filesystem.h>
#include <carbon/tracker/utils/hash.h>
#include <spdlog/spdlog.h>

#include <regex>
#include <sstream>
#include <system_error>

namespace carbon::tracker {

namespace {

std::string trim(const std::string &s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::optional<fs::path> git_config_path(const fs::path &project) {
    std::error_code ec;
    fs::path dot_git = project / ".git";
    if (fs::is_directory(dot_git, ec)) {
        return dot_git / "config";
    }
    if (!fs::is_regular_file(dot_git, ec)) {
        return std::nullopt;
    }

    // Worktree: ".git" holds "gitdir: <path>"
    std::string content;
    if (!utils::read_file(dot_git.string(), content)) {
        return std::nullopt;
    }
    const std::string marker = "gitdir:";
    auto pos = content.find(marker);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    fs::path gitdir(trim(content.substr(pos + marker.size())));
    if (gitdir.is_relative()) {
        gitdir = project / gitdir;
    }
    std::string commondir;
    if (utils::read_file((gitdir / "commondir").string(), commondir)) {
        fs::path common(trim(commondir));
        gitdir = common.is_relative() ? gitdir / common : common;
    }
    return gitdir / "config";
}

}  // namespace

std::optional<GitRemote> parse_git_remote(const std::string &url) {
    static const std::regex https_re(
        R"(https?://[^/]+/([^/]+)/([^/\s]+?)(?:\.git)?$)");
    static const std::regex ssh_re(
        R"(git@[^:]+:([^/]+)/([^/\s]+?)(?:\.git)?$)");

    std::smatch match;
    if (std::regex_search(url, match, https_re) ||
        std::regex_search(url, match, ssh_re)) {
        return GitRemote{match[1].str(), match[2].str()};
    }
    return std::nullopt;
}

std::optional<std::string> read_origin_url(const std::string &project_path) {
    auto config_path = git_config_path(fs::path(project_path));
    if (!config_path) {
        return std::nullopt;
    }

    std::string content;
    if (!utils::read_file(config_path->string(), content)) {
        return std::nullopt;
    }

    std::istringstream in(content);
    std::string line;
    bool in_origin = false;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;
        if (line[0] == '[') {
            in_origin = line == "[remote \"origin\"]";
            continue;
        }
        if (!in_origin) continue;
        auto eq = line.find('=');
        if (eq != std::string::npos && trim(line.substr(0, eq)) == "url") {
            std::string url = trim(line.substr(eq + 1));
            if (!url.empty()) return url;
        }
    }
    return std::nullopt;
}

std::string ProjectIdentifierResolver::project_hash(
    const std::string &project_path) {
    return utils::short_hash(project_path);
}

std::string ProjectIdentifierResolver::resolve(
    const std::string &project_path) const {
    const std::string hash = project_hash(project_path);

    if (lookup_) {
        auto custom = lookup_(hash);
        if (custom && !custom->empty()) {
            return *custom + "_" + hash;
        }
    }

    if (auto url = read_origin_url(project_path)) {
        if (auto remote = parse_git_remote(*url)) {
            return remote->org + "_" + remote->repo + "_" + hash;
        }
        spdlog::debug("Unrecognized origin remote for {}: {}", project_path,
                      *url);
    }

    return "local_" + hash;
}

}  // namespace carbon::tracker
