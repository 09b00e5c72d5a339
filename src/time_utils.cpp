#include "time_utils.hpp"
#include <ctime>

std::string timestamp() {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buf);
}

std::string format_elapsed(std::chrono::milliseconds elapsed) {
    long long ms = elapsed.count();
    if (ms < 0)
        ms = 0;
    if (ms < 1000)
        return std::to_string(ms) + "ms";
    long long total = ms / 1000;
    long long h = total / 3600;
    long long m = (total / 60) % 60;
    long long s = total % 60;
    std::string out;
    if (h > 0)
        out += std::to_string(h) + "h";
    if (m > 0 || h > 0)
        out += std::to_string(m) + "m";
    out += std::to_string(s) + "s";
    return out;
}
