#ifndef REPORT_WRITER_HPP
#define REPORT_WRITER_HPP

#include <chrono>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

#include "audit_types.hpp"
#include "options.hpp"
#include "scanner.hpp"

/// JSON representation of one entry report.
nlohmann::json entry_to_json(const EntryReport& report);

/// JSON representation of the scan totals.
nlohmann::json summary_to_json(const ScanSummary& summary, std::chrono::milliseconds elapsed);

/// One-line human readable scan summary.
std::string render_summary(const ScanSummary& summary, std::chrono::milliseconds elapsed);

/**
 * @brief Emits entry reports to the output stream and the file logger.
 *
 * Each call to @ref write prints the whole report at once, in diagnostic
 * order, so entries never interleave.
 */
class ReportWriter {
    std::ostream& out_;
    OutputFormat format_;

  public:
    ReportWriter(std::ostream& out, OutputFormat format) : out_(out), format_(format) {}

    void write(const EntryReport& report);
    void write_summary(const ScanSummary& summary, std::chrono::milliseconds elapsed);
};

#endif // REPORT_WRITER_HPP
