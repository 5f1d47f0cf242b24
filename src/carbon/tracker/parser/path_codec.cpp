#include <carbon/tracker/common/constants.h>
#include <carbon/tracker/parser/path_codec.h>
#include <carbon/tracker/utils/filesystem.h>
#include <spdlog/spdlog.h>

#include <optional>
#include <system_error>
#include <vector>

namespace carbon::tracker {

using constants::parser::MAX_DECODE_SEGMENTS;
using constants::parser::MAX_DECODE_STATES;
using constants::parser::PATH_FILLER;

std::string encode_project_path(const std::string &project_path) {
    std::string encoded = project_path;
    for (char &c : encoded) {
        if (c == '/') c = PATH_FILLER;
    }
    return encoded;
}

namespace {

class PathDecoder {
   public:
    explicit PathDecoder(std::vector<std::string> segments)
        : segments_(std::move(segments)), states_(0), exhausted_(false) {}

    std::optional<std::string> run() {
        return visit(1, fs::path("/"), segments_[0]);
    }

    bool exhausted() const { return exhausted_; }

   private:
    // `base` is an existing directory; `current` is the segment being built.
    std::optional<std::string> visit(std::size_t index, const fs::path &base,
                                     const std::string &current) {
        if (++states_ > MAX_DECODE_STATES) {
            exhausted_ = true;
            return std::nullopt;
        }

        std::error_code ec;
        if (index == segments_.size()) {
            if (current.empty()) return std::nullopt;
            fs::path candidate = base / current;
            if (fs::exists(candidate, ec)) {
                return candidate.string();
            }
            return std::nullopt;
        }

        if (!current.empty()) {
            fs::path prefix = base / current;
            if (fs::is_directory(prefix, ec)) {
                auto found = visit(index + 1, prefix, segments_[index]);
                if (found || exhausted_) return found;
            }
        }

        return visit(index + 1, base,
                     current + PATH_FILLER + segments_[index]);
    }

    std::vector<std::string> segments_;
    std::size_t states_;
    bool exhausted_;
};

}  // namespace

std::string decode_project_dir(const std::string &encoded) {
    if (encoded.size() < 2 || encoded.front() != PATH_FILLER) {
        return encoded;
    }

    std::vector<std::string> segments;
    std::size_t start = 1;
    while (true) {
        std::size_t pos = encoded.find(PATH_FILLER, start);
        segments.push_back(encoded.substr(start, pos - start));
        if (pos == std::string::npos) break;
        start = pos + 1;
    }

    if (segments.size() > MAX_DECODE_SEGMENTS) {
        spdlog::debug("Not decoding {}: {} segments exceeds limit", encoded,
                      segments.size());
        return encoded;
    }

    PathDecoder decoder(std::move(segments));
    auto decoded = decoder.run();
    if (decoded) {
        return *decoded;
    }
    if (decoder.exhausted()) {
        spdlog::debug("Gave up decoding {} after {} states", encoded,
                      MAX_DECODE_STATES);
    }
    return encoded;
}

}  // namespace carbon::tracker
