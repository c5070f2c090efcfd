#include "parse_utils.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

namespace simpletimer {

static std::string lower(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v;
}

static bool all_digits(const std::string& v) {
    return !v.empty() &&
           std::all_of(v.begin(), v.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool parse_bool(const std::string& value, bool& ok) {
    std::string v = lower(value);
    ok = true;
    if (v == "" || v == "1" || v == "true" || v == "yes")
        return true;
    if (v == "0" || v == "false" || v == "no")
        return false;
    ok = false;
    return false;
}

size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    if (!all_digits(value))
        return 0;
    try {
        unsigned long long v = std::stoull(value);
        if (v < min || v > max)
            return 0;
        ok = true;
        return static_cast<size_t>(v);
    } catch (const std::out_of_range&) {
        return 0;
    }
}

size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    std::string val = lower(value);
    unsigned long long mult = 1;
    auto ends_with = [&](const std::string& suf) {
        return val.size() >= suf.size() &&
               val.compare(val.size() - suf.size(), suf.size(), suf) == 0;
    };
    if (ends_with("kb")) {
        mult = 1024ull;
        val.erase(val.size() - 2);
    } else if (ends_with("mb")) {
        mult = 1024ull * 1024;
        val.erase(val.size() - 2);
    } else if (ends_with("gb")) {
        mult = 1024ull * 1024 * 1024;
        val.erase(val.size() - 2);
    } else if (ends_with("b")) {
        val.pop_back();
    }
    bool num_ok = false;
    size_t n = parse_size_t(val, 0, std::numeric_limits<size_t>::max(), num_ok);
    if (!num_ok || (n != 0 && mult > std::numeric_limits<size_t>::max() / n))
        return 0;
    size_t bytes = static_cast<size_t>(n * mult);
    if (bytes < min || bytes > max)
        return 0;
    ok = true;
    return bytes;
}

} // namespace simpletimer
