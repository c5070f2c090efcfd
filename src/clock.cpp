#include "clock.hpp"
#include "logger.hpp"
#include <chrono>
#include <ctime>
#ifndef _WIN32
#include <sys/time.h>
#endif

namespace simpletimer {

static const std::int64_t usecs_per_sec = 1000000;

// Returns false when no sub-second reading could be taken.
static bool read_hires(Timestamp& out) {
#ifdef _WIN32
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(since_epoch).count();
    out.seconds = us / usecs_per_sec;
    out.microseconds = us % usecs_per_sec;
    return true;
#else
    struct timeval tv;
    if (gettimeofday(&tv, nullptr) != 0)
        return false;
    out.seconds = static_cast<std::int64_t>(tv.tv_sec);
    out.microseconds = static_cast<std::int64_t>(tv.tv_usec);
    return true;
#endif
}

bool hires_available() {
    static const bool available = [] {
        Timestamp probe;
        bool ok = read_hires(probe);
        log_debug("Sub-second clock probe", {{"available", ok ? "true" : "false"}});
        return ok;
    }();
    return available;
}

Timestamp now(bool hires) {
    Timestamp ts;
    if (hires && read_hires(ts))
        return ts;
    ts.seconds = static_cast<std::int64_t>(std::time(nullptr));
    ts.microseconds = 0;
    return ts;
}

double tv_interval(const Timestamp& start, const Timestamp& end) {
    std::int64_t secs = end.seconds - start.seconds;
    std::int64_t usecs = end.microseconds - start.microseconds;
    if (usecs < 0) {
        --secs;
        usecs += usecs_per_sec;
    }
    return static_cast<double>(secs) + static_cast<double>(usecs) / usecs_per_sec;
}

} // namespace simpletimer
