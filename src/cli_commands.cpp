#include "cli_commands.hpp"

#include <chrono>
#include <stdexcept>

#include "logger.hpp"
#include "report_writer.hpp"
#include "scanner.hpp"

namespace cli {

void configure_logging(const LoggingOptions& opts) {
    if (opts.log_file.empty())
        return;
    if (!init_logger(opts.log_file.string(), opts.log_level, opts.max_log_size,
                     opts.max_log_files))
        throw std::runtime_error("Failed to open log file: " + opts.log_file.string());
    set_json_logging(opts.json_log);
    set_log_compression(opts.compress_logs);
}

int run_audit(const Options& opts, git::Backend& backend, std::ostream& out) {
    const auto start = std::chrono::steady_clock::now();
    ReportWriter writer(out, opts.format);
    if (logger_initialized())
        log_info("Starting audit", {{"directory", opts.repos_directory.string()},
                                    {"ssh_private_key", opts.ssh_private_key.string()}});
    ScanSummary summary =
        scan_directory(opts.repos_directory, backend, opts.audit_config(),
                       [&writer](const EntryReport& report) { writer.write(report); });
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    if (!opts.quiet)
        writer.write_summary(summary, elapsed);
    if (opts.strict && !summary.all_synced())
        return EXIT_UNSYNCED;
    return EXIT_OK;
}

} // namespace cli
