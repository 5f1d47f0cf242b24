#ifndef CARBON_TRACKER_PARSER_PATH_CODEC_H
#define CARBON_TRACKER_PARSER_PATH_CODEC_H

#include <string>

namespace carbon::tracker {

/** "/a/b-c" -> "-a-b-c": every path separator becomes the filler. */
std::string encode_project_path(const std::string &project_path);

/**
 * Best-effort inverse of encode_project_path.
 *
 * The encoding is lossy whenever a directory name itself contains the
 * filler. Each filler boundary is tried first as a separator (kept only if
 * the prefix is an existing directory) and then as a literal character; the
 * first candidate that exists on disk wins. When two real directories both
 * match, the one with more separators is returned. If nothing resolves, or
 * the search exceeds its segment/state bounds, the encoded string is
 * returned unchanged.
 */
std::string decode_project_dir(const std::string &encoded);

}  // namespace carbon::tracker

#endif  // CARBON_TRACKER_PARSER_PATH_CODEC_H
