#include "time_utils.hpp"
#include "clock.hpp"
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <vector>

namespace simpletimer {

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buf);
}

HmsParts separate_hms(double seconds) {
    HmsParts parts;
    // whole hours first, then whole minutes of what is left
    parts.hours = static_cast<long long>(seconds / 3600);
    seconds -= static_cast<double>(parts.hours) * 3600;
    parts.minutes = static_cast<long long>(seconds / 60);
    seconds -= static_cast<double>(parts.minutes) * 60;
    parts.seconds = seconds;
    return parts;
}

std::string default_format_spec(bool fractional) {
    // width 9 = 2 digits + dot + 6 decimals
    return std::string("%02d:%02d:") + (fractional ? "%09.6f" : "%02d");
}

std::string default_format_spec() { return default_format_spec(hires_available()); }

std::string format_hms(long long hours, long long minutes, double seconds) {
    bool fractional = std::trunc(seconds) != seconds;
    return sprintf_hms(default_format_spec(fractional), hours, minutes, seconds);
}

std::string format_hms(const HmsParts& parts) {
    return format_hms(parts.hours, parts.minutes, parts.seconds);
}

std::string format_hms(double total_seconds) { return format_hms(separate_hms(total_seconds)); }

template <typename T> static std::string printf_one(const std::string& spec, T value) {
    int n = std::snprintf(nullptr, 0, spec.c_str(), value);
    if (n <= 0)
        return "";
    std::vector<char> buf(static_cast<size_t>(n) + 1);
    std::snprintf(buf.data(), buf.size(), spec.c_str(), value);
    return std::string(buf.data(), static_cast<size_t>(n));
}

std::string format_number(double value) {
    std::string out = printf_one("%.15g", value);
    if (out == "-0")
        out = "0";
    return out;
}

std::string sprintf_hms(const std::string& fmt, long long hours, long long minutes,
                        double seconds) {
    const double args[] = {static_cast<double>(hours), static_cast<double>(minutes), seconds};
    const size_t nargs = sizeof(args) / sizeof(args[0]);
    size_t next = 0;
    std::string out;
    size_t i = 0;
    while (i < fmt.size()) {
        char c = fmt[i];
        if (c != '%') {
            out += c;
            ++i;
            continue;
        }
        if (i + 1 < fmt.size() && fmt[i + 1] == '%') {
            out += '%';
            i += 2;
            continue;
        }
        size_t j = i + 1;
        std::string flags;
        while (j < fmt.size() && std::strchr("-+ #0", fmt[j]) != nullptr)
            flags += fmt[j++];
        std::string width;
        while (j < fmt.size() && fmt[j] >= '0' && fmt[j] <= '9')
            width += fmt[j++];
        std::string precision;
        if (j < fmt.size() && fmt[j] == '.') {
            precision += fmt[j++];
            while (j < fmt.size() && fmt[j] >= '0' && fmt[j] <= '9')
                precision += fmt[j++];
        }
        // length modifiers carry no meaning here; the value type follows the conversion
        while (j < fmt.size() && std::strchr("hlLqjzt", fmt[j]) != nullptr)
            ++j;
        if (j >= fmt.size()) {
            out += fmt.substr(i);
            break;
        }
        char conv = fmt[j];
        std::string spec = "%" + flags + width + precision;
        double value = next < nargs ? args[next] : 0.0;
        if (std::strchr("di", conv) != nullptr) {
            out += printf_one(spec + "lld", static_cast<long long>(value));
        } else if (std::strchr("uoxX", conv) != nullptr) {
            out += printf_one(spec + "ll" + conv,
                              static_cast<unsigned long long>(static_cast<long long>(value)));
        } else if (conv == 'c') {
            out += printf_one(spec + "c", static_cast<int>(value));
        } else if (std::strchr("fFeEgGaA", conv) != nullptr) {
            out += printf_one(spec + conv, value);
        } else if (conv == 's') {
            std::string text = next < nargs ? format_number(value) : "";
            out += printf_one(spec + "s", text.c_str());
        } else {
            // not a conversion we render; keep the text verbatim
            out += fmt.substr(i, j - i + 1);
            i = j + 1;
            continue;
        }
        ++next;
        i = j + 1;
    }
    return out;
}

} // namespace simpletimer
