#include <carbon/tracker/utils/time.h>

#include <cctype>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace carbon::tracker::utils {

std::string format_iso8601(Timestamp ts) {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      ts.time_since_epoch())
                      .count();
    std::time_t secs = static_cast<std::time_t>(millis / 1000);
    long long ms = millis % 1000;
    if (ms < 0) {
        ms += 1000;
        secs -= 1;
    }

    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03lldZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                  tm.tm_min, tm.tm_sec, ms);
    return buffer;
}

std::optional<Timestamp> parse_iso8601(const std::string &text) {
    if (text.size() < 19) {
        return std::nullopt;
    }
    std::tm tm{};
    std::istringstream ss(text.substr(0, 19));
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }
    std::time_t t = timegm(&tm);
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    Timestamp out = Clock::from_time_t(t);

    if (text.size() > 19 && text[19] == '.') {
        std::size_t end = 20;
        while (end < text.size() &&
               std::isdigit(static_cast<unsigned char>(text[end]))) {
            ++end;
        }
        std::string frac = text.substr(20, end - 20);
        if (!frac.empty()) {
            while (frac.size() < 3) {
                frac.push_back('0');
            }
            out += std::chrono::milliseconds(std::stoi(frac.substr(0, 3)));
        }
    }
    return out;
}

std::string format_relative_time(const std::optional<Timestamp> &then,
                                 Timestamp now) {
    if (!then) {
        return "never";
    }
    auto minutes =
        std::chrono::duration_cast<std::chrono::minutes>(now - *then).count();
    if (minutes < 1) {
        return "just now";
    }
    auto plural = [](long long n, const char *unit) {
        return std::to_string(n) + " " + unit + (n == 1 ? "" : "s") + " ago";
    };
    if (minutes < 60) {
        return plural(minutes, "minute");
    }
    long long hours = minutes / 60;
    if (hours < 24) {
        return plural(hours, "hour");
    }
    return plural(hours / 24, "day");
}

}  // namespace carbon::tracker::utils
