#include <carbon/tracker/utils/file.h>
#include <sys/stat.h>
#include <sys/types.h>

#include <fstream>
#include <sstream>

namespace carbon::tracker::utils {

time_t get_file_modification_time(const std::string &file_path) {
    struct stat st;
    if (stat(file_path.c_str(), &st) == 0) {
        return st.st_mtime;
    }
    return 0;
}

time_t get_file_creation_time(const std::string &file_path) {
    struct stat st;
    if (stat(file_path.c_str(), &st) != 0) {
        return 0;
    }
#if defined(__APPLE__)
    return st.st_birthtimespec.tv_sec;
#else
    // ctime can be later than mtime after a chmod; take the earlier one
    return st.st_ctime < st.st_mtime ? st.st_ctime : st.st_mtime;
#endif
}

bool read_file(const std::string &file_path, std::string &out) {
    std::ifstream in(file_path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    out = buffer.str();
    return true;
}

}  // namespace carbon::tracker::utils
