#include "Utils.hpp"
#include <sys/stat.h>
#include <sys/types.h>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <thread>

namespace companion {
namespace utils {

std::string get_timestamp_string(const std::string& format) {
    auto now = std::time(nullptr);
    auto tm = *std::localtime(&now);

    std::ostringstream oss;
    oss << std::put_time(&tm, format.c_str());
    return oss.str();
}

bool ensure_directory_exists(const std::string& path) {
    struct stat info;

    if (stat(path.c_str(), &info) == 0) {
        return S_ISDIR(info.st_mode);
    }

    // Try to create directory
    return mkdir(path.c_str(), 0755) == 0;
}

bool ensure_parent_directory(const std::string& file_path) {
    auto slash = file_path.find_last_of('/');
    if (slash == std::string::npos || slash == 0) {
        return true;
    }
    return ensure_directory_exists(file_path.substr(0, slash));
}

bool file_exists(const std::string& path) {
    struct stat info;
    return stat(path.c_str(), &info) == 0 && S_ISREG(info.st_mode);
}

double seconds_since(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

void sleep_seconds(double seconds) {
    if (seconds <= 0.0) return;
    std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
}

long long unix_time_seconds() {
    return static_cast<long long>(std::time(nullptr));
}

} // namespace utils
} // namespace companion
