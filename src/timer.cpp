#include "timer.hpp"
#include "logger.hpp"
#include <cstdio>
#include <cstdlib>
#include <ostream>

namespace simpletimer {

std::optional<FormatKind> parse_format_kind(const std::string& name) {
    if (name == "short")
        return FormatKind::Short;
    if (name == "rps")
        return FormatKind::Rps;
    if (name == "human")
        return FormatKind::Human;
    if (name == "full")
        return FormatKind::Full;
    if (name == "hms")
        return FormatKind::Hms;
    if (name == "elapsed")
        return FormatKind::Elapsed;
    return std::nullopt;
}

const char* format_kind_name(FormatKind kind) {
    switch (kind) {
    case FormatKind::Short:
        return "short";
    case FormatKind::Rps:
        return "rps";
    case FormatKind::Human:
        return "human";
    case FormatKind::Full:
        return "full";
    case FormatKind::Hms:
        return "hms";
    case FormatKind::Elapsed:
        return "elapsed";
    }
    return "short";
}

Timer::Timer() : Timer(TimerOptions{}) {}

Timer::Timer(const TimerOptions& opts)
    : hires_(opts.hires.value_or(true) && hires_available()), hms_format_(opts.hms),
      string_format_(opts.string) {
    if (!opts.format.empty()) {
        log_warning("Timer option 'format' is deprecated.  Use 'hms' (or 'string')");
        if (hms_format_.empty())
            hms_format_ = opts.format;
    }
    if (hms_format_.empty())
        hms_format_ = default_format_spec(hires_);
    if (opts.start)
        start();
}

void Timer::start() {
    // an old stop time must not survive a restart
    stopped_.reset();
    started_ = now();
    log_debug("Timer started", {{"hires", hires_ ? "true" : "false"}});
}

void Timer::stop() {
    if (stopped_)
        return;
    stopped_ = now();
    log_debug("Timer stopped");
}

double Timer::stop_elapsed() {
    stop();
    return elapsed();
}

double Timer::elapsed() const {
    if (!started_)
        throw NotStartedError();
    Timestamp end = stopped_ ? *stopped_ : now();
    if (hires_)
        return tv_interval(*started_, end);
    return static_cast<double>(end.seconds - started_->seconds);
}

HmsParts Timer::hms_parts() const { return separate_hms(elapsed()); }

std::string Timer::hms(const std::string& format) const {
    HmsParts p = hms_parts();
    return sprintf_hms(format.empty() ? hms_format_ : format, p.hours, p.minutes, p.seconds);
}

std::string Timer::string() const { return string(string_format_); }

std::string Timer::string(FormatKind kind) const { return render(kind, elapsed()); }

std::string Timer::string(const StringFormat& format) const {
    if (const auto* kind = std::get_if<FormatKind>(&format))
        return string(*kind);
    const auto& callback = std::get<FormatCallback>(format);
    if (!callback)
        throw UnknownFormatError("<empty callback>");
    return callback(*this);
}

std::string Timer::string(const std::string& name) const {
    std::optional<FormatKind> kind = parse_format_kind(name);
    if (!kind)
        throw UnknownFormatError(name);
    return string(*kind);
}

Timestamp Timer::now() const { return simpletimer::now(hires_); }

std::string Timer::render(FormatKind kind, double seconds) const {
    HmsParts p = separate_hms(seconds);
    switch (kind) {
    case FormatKind::Short:
        return format_number(seconds) + "s (" +
               sprintf_hms(hms_format_, p.hours, p.minutes, p.seconds) + ")";
    case FormatKind::Rps: {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%f", seconds);
        std::string shown = buf;
        // the rate is taken from the value as displayed
        double shown_value = std::strtod(buf, nullptr);
        std::string rate = "??";
        if (shown_value != 0) {
            std::snprintf(buf, sizeof(buf), "%.3f", 1 / shown_value);
            rate = buf;
        }
        return shown + "s (" + rate + "/s)";
    }
    case FormatKind::Human:
    case FormatKind::Full: {
        std::string human = std::to_string(p.hours) + " hours " + std::to_string(p.minutes) +
                            " minutes " + format_number(p.seconds) + " seconds";
        if (kind == FormatKind::Human)
            return human;
        return format_number(seconds) + " seconds (" + human + ")";
    }
    case FormatKind::Hms:
        return sprintf_hms(hms_format_, p.hours, p.minutes, p.seconds);
    case FormatKind::Elapsed:
        return format_number(seconds);
    }
    throw UnknownFormatError(format_kind_name(kind));
}

std::string to_string(const Timer& timer) { return timer.string(); }

std::ostream& operator<<(std::ostream& os, const Timer& timer) { return os << timer.string(); }

double operator+(const Timer& lhs, const Timer& rhs) { return lhs.elapsed() + rhs.elapsed(); }

} // namespace simpletimer
