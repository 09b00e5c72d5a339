#include "parse_utils.hpp"
#include <algorithm>
#include <cctype>
#include <limits>

static std::string lowercase(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v;
}

size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    if (value.empty())
        return 0;
    size_t v = 0;
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return 0;
        size_t digit = static_cast<size_t>(c - '0');
        if (v > (std::numeric_limits<size_t>::max() - digit) / 10)
            return 0;
        v = v * 10 + digit;
    }
    if (v < min || v > max)
        return 0;
    ok = true;
    return v;
}

size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    std::string val = lowercase(value);
    if (!val.empty() && val.back() == 'b')
        val.pop_back();
    size_t mult = 1;
    if (!val.empty()) {
        switch (val.back()) {
        case 'k':
            mult = 1024;
            break;
        case 'm':
            mult = 1024 * 1024;
            break;
        case 'g':
            mult = 1024 * 1024 * 1024;
            break;
        default:
            break;
        }
        if (mult != 1)
            val.pop_back();
    }
    bool num_ok = false;
    size_t n = parse_size_t(val, 0, std::numeric_limits<size_t>::max(), num_ok);
    if (!num_ok || n > std::numeric_limits<size_t>::max() / mult)
        return 0;
    size_t bytes = n * mult;
    if (bytes < min || bytes > max)
        return 0;
    ok = true;
    return bytes;
}

bool parse_bool(const std::string& value, bool& ok) {
    std::string v = lowercase(value);
    ok = true;
    if (v.empty() || v == "1" || v == "true" || v == "yes" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "no" || v == "off")
        return false;
    ok = false;
    return false;
}
