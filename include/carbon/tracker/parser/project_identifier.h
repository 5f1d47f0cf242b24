#ifndef CARBON_TRACKER_PARSER_PROJECT_IDENTIFIER_H
#define CARBON_TRACKER_PARSER_PROJECT_IDENTIFIER_H

#include <functional>
#include <optional>
#include <string>

namespace carbon::tracker {

struct GitRemote {
    std::string org;
    std::string repo;
};

/**
 * Parse `<org>/<repo>` from an origin URL. Accepts
 * `https://host/org/repo(.git)` and `git@host:org/repo(.git)`.
 */
std::optional<GitRemote> parse_git_remote(const std::string &url);

/**
 * Read `[remote "origin"] url` from the repository config of
 * `project_path`. Worktrees with a `.git` file are followed.
 */
std::optional<std::string> read_origin_url(const std::string &project_path);

/**
 * Maps a raw project path to a stable identifier:
 *   custom name configured -> `<name>_<hash>`
 *   git origin remote      -> `<org>_<repo>_<hash>`
 *   otherwise              -> `local_<hash>`
 * where hash is the 8-hex short hash of the raw path.
 */
class ProjectIdentifierResolver {
   public:
    /** Returns the configured display name for a project hash, if any. */
    using NameLookup =
        std::function<std::optional<std::string>(const std::string &)>;

    ProjectIdentifierResolver() = default;
    explicit ProjectIdentifierResolver(NameLookup lookup)
        : lookup_(std::move(lookup)) {}

    std::string resolve(const std::string &project_path) const;

    static std::string project_hash(const std::string &project_path);

   private:
    NameLookup lookup_;
};

}  // namespace carbon::tracker

#endif  // CARBON_TRACKER_PARSER_PROJECT_IDENTIFIER_H
