#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <map>
#include <string>

namespace simpletimer {

/**
 * @brief Load configuration options from a YAML file.
 *
 * Top-level scalar keys become `--<key>` entries in @p opts. Keys of a nested
 * mapping (a section such as `Timer:` or `Logging:`) are flattened the same
 * way. Sequences are ignored.
 *
 * @param path  Filesystem path to the YAML configuration file.
 * @param opts  Map receiving option values.
 * @param error Output string capturing a human-readable error message on
 *              failure.
 * @return `true` if the configuration was loaded successfully; `false`
 *         otherwise.
 */
bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

/**
 * @brief Load configuration options from a JSON file.
 *
 * Same layout rules as load_yaml_config(); the root must be an object.
 */
bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

/**
 * @brief Load a YAML or JSON file chosen by its extension (.yaml, .yml, .json).
 */
bool load_config(const std::string& path, std::map<std::string, std::string>& opts,
                 std::string& error);

} // namespace simpletimer

#endif // CONFIG_UTILS_HPP
