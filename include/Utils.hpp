#pragma once

#include "RobotTypes.hpp"
#include <string>

namespace companion {
namespace utils {

/**
 * @brief Get current timestamp string (for filenames and log headers)
 * @param format Format string (default: "%Y%m%d_%H%M%S")
 * @return Timestamp string
 */
std::string get_timestamp_string(const std::string& format = "%Y%m%d_%H%M%S");

/**
 * @brief Create directory if it doesn't exist
 * @param path Directory path
 * @return true if directory exists or was created
 */
bool ensure_directory_exists(const std::string& path);

/**
 * @brief Create the parent directory of a file path (one level)
 */
bool ensure_parent_directory(const std::string& file_path);

/** Check whether a regular file exists */
bool file_exists(const std::string& path);

/** Seconds elapsed since @p start on the steady clock */
double seconds_since(Clock::time_point start);

/** Sleep for a fractional number of seconds (no-op for <= 0) */
void sleep_seconds(double seconds);

/** Seconds since the unix epoch (wall clock) */
long long unix_time_seconds();

} // namespace utils
} // namespace companion
