#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "audit_types.hpp"
#include "logger.hpp"

enum class OutputFormat { Text, Json };

struct LoggingOptions {
    std::filesystem::path log_file;
    LogLevel log_level = LogLevel::INFO;
    size_t max_log_size = 0;
    size_t max_log_files = 1;
    bool json_log = false;
    bool compress_logs = false;
};

struct Options {
    std::filesystem::path repos_directory;
    std::filesystem::path ssh_private_key;
    std::string username = "git";
    std::vector<std::string> qualifying_prefixes{"https://github.com/", "git@github.com:"};
    bool verbose = false;
    OutputFormat format = OutputFormat::Text;
    bool quiet = false;
    bool strict = false;
    bool show_help = false;
    bool print_version = false;
    LoggingOptions logging;
    std::filesystem::path config_file;

    /// Settings handed to the scanner.
    AuditConfig audit_config() const;
};

/**
 * @brief Parse command line arguments and configuration files.
 *
 * Values from `--config-yaml` / `--config-json` are applied first and then
 * overridden by the command line. Defaults for the repositories directory
 * and key path are not resolved here; see @ref resolve_defaults.
 *
 * @throws std::runtime_error on unknown options or invalid values.
 */
Options parse_options(int argc, char* argv[]);

/**
 * @brief Fill in the repositories directory (current directory) and the
 *        private key (`<home>/.ssh/id_rsa`) when they were not given.
 *
 * @throws std::runtime_error when the home directory cannot be determined.
 */
void resolve_defaults(Options& opts);

/// @return Home directory from `HOME` or the password database.
/// @throws std::runtime_error when neither is available.
std::filesystem::path home_directory();

/**
 * @brief Checks that must pass before any entry is looked at.
 *
 * The key path must exist and be a regular file and the repositories
 * directory must be readable.
 *
 * @throws std::runtime_error describing the first failed check.
 */
void validate_preflight(const Options& opts);

#endif // OPTIONS_HPP
