/**
 * @file syncaudit.cpp
 * @brief CLI entry point for the branch synchronization audit.
 *
 * Parses options, runs the pre-flight checks and scans the repositories
 * directory with the libgit2 backend.
 */

#include <iostream>

#include "cli_commands.hpp"
#include "git_utils.hpp"
#include "help_text.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "version.hpp"

/**
 * @brief Application entry point.
 *
 * @return 0 on success or when printing help/version, 1 on option or
 *         pre-flight errors, 2 for strict runs that found unsynced branches.
 */
int main(int argc, char* argv[]) {
    git::GitInitGuard git_guard;
    try {
        Options opts = parse_options(argc, argv);
        if (opts.show_help) {
            print_help(std::cout, argv[0]);
            return cli::EXIT_OK;
        }
        if (opts.print_version) {
            std::cout << SYNCAUDIT_VERSION << "\n";
            return cli::EXIT_OK;
        }
        resolve_defaults(opts);
        validate_preflight(opts);
        cli::configure_logging(opts.logging);
        git::Libgit2Backend backend;
        int rc = cli::run_audit(opts, backend, std::cout);
        shutdown_logger();
        return rc;
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        shutdown_logger();
        return cli::EXIT_FATAL;
    }
}
