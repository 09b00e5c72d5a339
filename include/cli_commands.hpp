#ifndef CLI_COMMANDS_HPP
#define CLI_COMMANDS_HPP

#include <ostream>

#include "git_backend.hpp"
#include "options.hpp"

namespace cli {

/// Exit code when every check passed (or `--strict` was not requested).
constexpr int EXIT_OK = 0;
/// Exit code for option and pre-flight failures.
constexpr int EXIT_FATAL = 1;
/// Exit code for `--strict` runs that found unsynced work.
constexpr int EXIT_UNSYNCED = 2;

/**
 * @brief Set up the file logger described by @a opts.
 *
 * @throws std::runtime_error if the log file cannot be opened.
 */
void configure_logging(const LoggingOptions& opts);

/**
 * @brief Scan the repositories directory and print one report per entry.
 *
 * Options must already be resolved and pre-flight checked.
 *
 * @return @ref EXIT_OK, or @ref EXIT_UNSYNCED in strict mode when a branch
 *         is not synced or an entry failed.
 */
int run_audit(const Options& opts, git::Backend& backend, std::ostream& out);

} // namespace cli

#endif // CLI_COMMANDS_HPP
