#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>

namespace simpletimer {

/**
 * @brief A duration split into whole hours, whole minutes and the remaining
 *        (possibly fractional) seconds.
 */
struct HmsParts {
    long long hours = 0;
    long long minutes = 0;
    double seconds = 0.0;
};

/**
 * @brief Get the current local time formatted as YYYY-MM-DD HH:MM:SS.
 */
std::string timestamp();

/**
 * @brief Separate a number of seconds into hours, minutes and seconds.
 *
 * No day rollover is applied; hours grow without bound.
 */
HmsParts separate_hms(double seconds);

/**
 * @brief Default printf-style template for an HMS rendering.
 *
 * @param fractional `true` yields `%02d:%02d:%09.6f` (00:00:00.000000),
 *                   `false` yields `%02d:%02d:%02d` (00:00:00).
 */
std::string default_format_spec(bool fractional);

/**
 * @brief Default template chosen by the availability of a sub-second clock.
 */
std::string default_format_spec();

/**
 * @brief Format hours, minutes and seconds with the template that fits the
 *        seconds value (fractional or whole).
 */
std::string format_hms(long long hours, long long minutes, double seconds);
std::string format_hms(const HmsParts& parts);

/**
 * @brief Split @p total_seconds with separate_hms() and format the result.
 */
std::string format_hms(double total_seconds);

/**
 * @brief Render hours, minutes and seconds through a printf-style template.
 *
 * Each conversion consumes the next value. Integer conversions (d, i, u, o,
 * x, X, c) truncate it, floating conversions (f, F, e, E, g, G, a, A) take it
 * as is and `%s` renders it with format_number(). `%%` is a literal percent.
 * Conversions past the third value render as zero.
 */
std::string sprintf_hms(const std::string& fmt, long long hours, long long minutes,
                        double seconds);

/**
 * @brief Default number-to-string conversion (`3`, `4.743616`, `0.25`).
 */
std::string format_number(double value);

} // namespace simpletimer

#endif // TIME_UTILS_HPP
