#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <map>
#include <string>
#include <vector>

/**
 * @brief Option values read from a configuration file.
 *
 * Keys are long option names with their leading dashes (`--verbose`). A
 * scalar yields one value, a sequence yields one value per element and a
 * null yields a single empty value (a bare flag).
 */
using ConfigValues = std::map<std::string, std::vector<std::string>>;

/**
 * @brief Load configuration options from a YAML file.
 *
 * Top-level keys map to options. A top-level key whose value is a map is a
 * category (`Logging:`) whose own keys are read as options.
 *
 * @param path  Filesystem path to the YAML configuration file.
 * @param opts  Map receiving option values.
 * @param error Output string capturing a human-readable error message on
 *              failure.
 * @return `true` if the configuration was loaded successfully; `false`
 *         otherwise.
 */
bool load_yaml_config(const std::string& path, ConfigValues& opts, std::string& error);

/**
 * @brief Load configuration options from a JSON file.
 *
 * Same layout rules as @ref load_yaml_config with a JSON object at the root.
 *
 * @param path  Filesystem path to the JSON configuration file.
 * @param opts  Map receiving option values.
 * @param error Output string capturing a human-readable error message on
 *              failure.
 * @return `true` if the configuration was loaded successfully; `false`
 *         otherwise.
 */
bool load_json_config(const std::string& path, ConfigValues& opts, std::string& error);

#endif // CONFIG_UTILS_HPP
