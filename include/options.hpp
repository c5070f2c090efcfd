#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <map>
#include <string>
#include "logger.hpp"
#include "timer.hpp"

namespace simpletimer {

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;
    size_t max_log_size = 0;
    size_t max_log_files = 1;
    bool json_log = false;
    bool compress_logs = false;
};

/**
 * @brief Build timer options from a flattened option map.
 *
 * Recognized keys: `--start`, `--hires`, `--hms`, `--string` and the
 * deprecated `--format`. Unknown keys are ignored.
 *
 * @throws std::runtime_error on an invalid value.
 */
TimerOptions parse_timer_options(const std::map<std::string, std::string>& cfg_opts);

/**
 * @brief Build logging options from a flattened option map.
 *
 * Recognized keys: `--log-file`, `--log-level`, `--max-log-size`,
 * `--max-log-files`, `--json-log`, `--compress-logs`.
 *
 * @throws std::runtime_error on an invalid value.
 */
LoggingOptions parse_logging_options(const std::map<std::string, std::string>& cfg_opts);

/**
 * @brief Configure the logger. Opens the log file when one is named;
 *        otherwise only the level and output flags are applied.
 */
void apply_logging_options(const LoggingOptions& opts);

} // namespace simpletimer

#endif // OPTIONS_HPP
