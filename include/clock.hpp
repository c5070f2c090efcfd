#ifndef CLOCK_HPP
#define CLOCK_HPP

#include <cstdint>

namespace simpletimer {

/**
 * @brief A point in wall-clock time.
 *
 * Seconds since the epoch plus a microsecond remainder. Readings taken from
 * the coarse clock always carry a zero microsecond component.
 */
struct Timestamp {
    std::int64_t seconds = 0;
    std::int64_t microseconds = 0;
};

/**
 * @brief Check whether a sub-second clock is available.
 *
 * The probe runs once per process on first use and the result is cached.
 * Safe to call from multiple threads.
 */
bool hires_available();

/**
 * @brief Read the current wall-clock time.
 *
 * @param hires Use the microsecond clock when `true`, whole seconds otherwise.
 *              A failed sub-second read falls back to the coarse clock.
 */
Timestamp now(bool hires);

/**
 * @brief Exact interval between two timestamps in fractional seconds.
 *
 * The microsecond component borrows across the second boundary.
 */
double tv_interval(const Timestamp& start, const Timestamp& end);

} // namespace simpletimer

#endif // CLOCK_HPP
