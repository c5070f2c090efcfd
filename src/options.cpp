// options.cpp
//
// Turn flattened configuration maps into timer and logging options.

#include <limits>
#include <map>
#include <stdexcept>
#include <string>

#include "options.hpp"
#include "parse_utils.hpp"

namespace simpletimer {

static bool cfg_flag(const std::map<std::string, std::string>& cfg_opts, const std::string& key) {
    bool ok = false;
    bool v = parse_bool(cfg_opts.at(key), ok);
    if (!ok)
        throw std::runtime_error("Invalid value for " + key);
    return v;
}

TimerOptions parse_timer_options(const std::map<std::string, std::string>& cfg_opts) {
    TimerOptions opts;
    if (cfg_opts.count("--start"))
        opts.start = cfg_flag(cfg_opts, "--start");
    if (cfg_opts.count("--hires"))
        opts.hires = cfg_flag(cfg_opts, "--hires");
    if (cfg_opts.count("--hms"))
        opts.hms = cfg_opts.at("--hms");
    if (cfg_opts.count("--format"))
        opts.format = cfg_opts.at("--format");
    if (cfg_opts.count("--string")) {
        auto kind = parse_format_kind(cfg_opts.at("--string"));
        if (!kind)
            throw std::runtime_error("Invalid value for --string");
        opts.string = *kind;
    }
    return opts;
}

LoggingOptions parse_logging_options(const std::map<std::string, std::string>& cfg_opts) {
    LoggingOptions opts;
    bool ok = false;
    if (cfg_opts.count("--log-file"))
        opts.log_file = cfg_opts.at("--log-file");
    if (cfg_opts.count("--log-level")) {
        if (!parse_log_level(cfg_opts.at("--log-level"), opts.log_level))
            throw std::runtime_error("Invalid value for --log-level");
    }
    if (cfg_opts.count("--max-log-size")) {
        opts.max_log_size =
            parse_bytes(cfg_opts.at("--max-log-size"), 0, std::numeric_limits<size_t>::max(), ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-size");
    }
    if (cfg_opts.count("--max-log-files")) {
        opts.max_log_files = parse_size_t(cfg_opts.at("--max-log-files"), 0, 1000, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-files");
    }
    if (cfg_opts.count("--json-log"))
        opts.json_log = cfg_flag(cfg_opts, "--json-log");
    if (cfg_opts.count("--compress-logs"))
        opts.compress_logs = cfg_flag(cfg_opts, "--compress-logs");
    return opts;
}

void apply_logging_options(const LoggingOptions& opts) {
    set_json_logging(opts.json_log);
    set_log_compression(opts.compress_logs);
    if (opts.log_file.empty()) {
        set_log_level(opts.log_level);
        return;
    }
    init_logger(opts.log_file, opts.log_level, opts.max_log_size, opts.max_log_files);
}

} // namespace simpletimer
