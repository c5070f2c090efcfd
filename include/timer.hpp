#ifndef TIMER_HPP
#define TIMER_HPP

#include <functional>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include "clock.hpp"
#include "time_utils.hpp"

namespace simpletimer {

class Timer;

/**
 * @brief Thrown when an elapsed-time query is made on a timer that was never
 *        started.
 */
class NotStartedError : public std::runtime_error {
  public:
    NotStartedError() : std::runtime_error("Timer never started!") {}
};

/**
 * @brief Thrown when string() is asked for a format it does not know.
 */
class UnknownFormatError : public std::runtime_error {
  public:
    explicit UnknownFormatError(const std::string& name)
        : std::runtime_error("Unknown format: " + name), name_(name) {}

    const std::string& format_name() const noexcept { return name_; }

  private:
    std::string name_;
};

/**
 * @brief Built-in renderings for Timer::string().
 *
 * - `Short`   total seconds followed by hms: `123s (00:02:03)`
 * - `Rps`     total seconds followed by a per-second rate: `4.743616s (0.211/s)`
 * - `Human`   units spelled out: `6 hours 4 minutes 12 seconds`
 * - `Full`    total seconds plus `Human`: `2 seconds (0 hours 0 minutes 2 seconds)`
 * - `Hms`     the result of Timer::hms()
 * - `Elapsed` the result of Timer::elapsed() as text
 */
enum class FormatKind { Short, Rps, Human, Full, Hms, Elapsed };

/// Caller-supplied rendering, invoked with the timer being rendered.
using FormatCallback = std::function<std::string(const Timer&)>;

/// Either a named rendering or a callback.
using StringFormat = std::variant<FormatKind, FormatCallback>;

/**
 * @brief Look up a rendering by name ("short", "rps", "human", "full", "hms",
 *        "elapsed").
 */
std::optional<FormatKind> parse_format_kind(const std::string& name);

/**
 * @brief Name of a rendering, the inverse of parse_format_kind().
 */
const char* format_kind_name(FormatKind kind);

/**
 * @brief Construction options for Timer.
 */
struct TimerOptions {
    /// Start the clock in the constructor.
    bool start = true;
    /// Use the sub-second clock. Unset means hires_available(). A request for
    /// sub-second precision degrades to whole seconds when it is unavailable.
    std::optional<bool> hires;
    /// printf-style template used by Timer::hms(). Empty means
    /// default_format_spec(hires).
    std::string hms;
    /// Default rendering for Timer::string().
    StringFormat string = FormatKind::Short;
    /// Deprecated alias for `hms`. Logs a warning when set.
    std::string format;
};

/**
 * @brief A small stopwatch.
 *
 * Records a start time and optionally a stop time, and reports the time in
 * between in several string formats.
 *
 * @code
 * simpletimer::Timer t;
 * do_something();
 * std::cout << "something took: " << t << "\n";
 * @endcode
 *
 * A timer is owned by one caller; concurrent use needs external locking.
 */
class Timer {
  public:
    Timer();
    explicit Timer(const TimerOptions& opts);

    /**
     * @brief Set the clock to the current time and forget any stop time.
     */
    void start();

    /// Alias for start().
    void restart() { start(); }

    /**
     * @brief Record the stop time.
     *
     * A timer that is already stopped keeps its first stop time. Does not
     * compute the elapsed time, so it never throws.
     */
    void stop();

    /**
     * @brief stop() and return the elapsed time at that moment.
     *
     * @throws NotStartedError if the timer was never started.
     */
    double stop_elapsed();

    /**
     * @brief Seconds elapsed since start(), up to the stop time if stopped.
     *
     * @throws NotStartedError if the timer was never started.
     */
    double elapsed() const;

    /**
     * @brief Elapsed time separated into hours, minutes and seconds.
     */
    HmsParts hms_parts() const;

    /**
     * @brief Elapsed time rendered through a printf-style template.
     *
     * @param format Template with three slots (hours, minutes, seconds). Empty
     *               uses the template from the options.
     */
    std::string hms(const std::string& format = "") const;

    /**
     * @brief Elapsed time as text in the configured default format.
     */
    std::string string() const;
    std::string string(FormatKind kind) const;
    std::string string(const StringFormat& format) const;

    /**
     * @brief Elapsed time as text in the format named @p name.
     *
     * @throws UnknownFormatError if @p name is not a known format.
     */
    std::string string(const std::string& name) const;
    std::string string(const char* name) const { return string(std::string(name)); }

    /// Current time in this timer's resolution.
    Timestamp now() const;

    bool hires() const { return hires_; }
    bool started() const { return started_.has_value(); }
    bool stopped() const { return stopped_.has_value(); }
    const std::string& hms_format() const { return hms_format_; }
    const StringFormat& string_format() const { return string_format_; }

    explicit operator double() const { return elapsed(); }

  private:
    std::string render(FormatKind kind, double seconds) const;

    bool hires_;
    std::optional<Timestamp> started_;
    std::optional<Timestamp> stopped_;
    std::string hms_format_;
    StringFormat string_format_;
};

/// Same as Timer::string().
std::string to_string(const Timer& timer);

std::ostream& operator<<(std::ostream& os, const Timer& timer);

/// Sum of both timers' elapsed seconds.
double operator+(const Timer& lhs, const Timer& rhs);

} // namespace simpletimer

#endif // TIMER_HPP
