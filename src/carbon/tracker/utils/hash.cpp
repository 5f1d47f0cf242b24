#include <carbon/tracker/utils/hash.h>
#include <picosha2.h>
#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>

#include <cstdlib>

namespace carbon::tracker::utils {

std::string sha256_hex(const std::string &input) {
    picosha2::hash256_one_by_one hasher;
    hasher.process(input.begin(), input.end());
    hasher.finish();

    std::string hex_str;
    picosha2::get_hash_hex_string(hasher, hex_str);
    return hex_str;
}

std::string short_hash(const std::string &input) {
    return sha256_hex(input).substr(0, 8);
}

static std::string current_username() {
    if (struct passwd *pw = getpwuid(getuid())) {
        if (pw->pw_name) return pw->pw_name;
    }
    const char *user = std::getenv("USER");
    return user ? user : "";
}

std::string generate_machine_user_id() {
    char host[256] = {0};
    if (gethostname(host, sizeof(host) - 1) != 0) {
        host[0] = '\0';
    }
    std::string hex = sha256_hex(std::string(host) + ":" + current_username());
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) +
           "-" + hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

}  // namespace carbon::tracker::utils
