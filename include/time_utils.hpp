#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <chrono>
#include <string>

/**
 * @brief Get the current local time formatted as YYYY-MM-DD HH:MM:SS.
 */
std::string timestamp();

/**
 * @brief Format an elapsed time as `1h2m3s`, or `850ms` below one second.
 */
std::string format_elapsed(std::chrono::milliseconds elapsed);

#endif // TIME_UTILS_HPP
