#include "report_writer.hpp"

#include "logger.hpp"
#include "time_utils.hpp"

using nlohmann::json;

static void log_diagnostic(const EntryReport& report, const Diagnostic& d) {
    LogFields fields{{"entry", report.path.string()}};
    switch (d.severity) {
    case Severity::Info:
        log_info(d.message, fields);
        break;
    case Severity::Warning:
        log_warning(d.message, fields);
        break;
    case Severity::Error:
        log_error(d.message, fields);
        break;
    case Severity::Critical:
        log_critical(d.message, fields);
        break;
    }
}

json entry_to_json(const EntryReport& report) {
    json j;
    j["entry"] = report.path.string();
    j["kind"] = to_string(report.kind);
    j["failed"] = report.failed;
    j["remotes"] = json::array();
    for (const auto& r : report.remotes)
        j["remotes"].push_back({{"name", r.name}, {"url", r.url}, {"qualifies", r.qualifies}});
    j["fetches"] = json::array();
    for (const auto& f : report.fetches) {
        json fj{{"remote", f.remote}, {"fetched", f.fetched}};
        if (!f.fetched)
            fj["reason"] = f.reason;
        j["fetches"].push_back(fj);
    }
    j["branches"] = json::array();
    for (const auto& b : report.branches) {
        json bj{{"branch", b.branch}, {"upstream", b.upstream}, {"remote", b.remote}};
        bj["status"] = b.status ? json(to_string(*b.status)) : json(nullptr);
        j["branches"].push_back(bj);
    }
    j["diagnostics"] = json::array();
    for (const auto& d : report.diagnostics)
        j["diagnostics"].push_back({{"severity", to_string(d.severity)}, {"message", d.message}});
    return j;
}

json summary_to_json(const ScanSummary& summary, std::chrono::milliseconds elapsed) {
    json statuses = json::object();
    for (const auto& [status, count] : summary.statuses)
        statuses[to_string(status)] = count;
    return json{{"summary",
                 {{"entries", summary.entries},
                  {"repositories", summary.repositories},
                  {"failed_entries", summary.failed_entries},
                  {"branches", summary.branches},
                  {"unclassified_branches", summary.unclassified_branches},
                  {"statuses", statuses},
                  {"elapsed_ms", elapsed.count()}}}};
}

std::string render_summary(const ScanSummary& summary, std::chrono::milliseconds elapsed) {
    std::string out = "Scanned " + std::to_string(summary.entries) + " entries (" +
                      std::to_string(summary.repositories) + " repositories, " +
                      std::to_string(summary.failed_entries) + " failed) in " +
                      format_elapsed(elapsed) + ": " + std::to_string(summary.branches) +
                      " branches";
    for (const auto& [status, count] : summary.statuses)
        out += ", " + std::string(to_string(status)) + "=" + std::to_string(count);
    if (summary.unclassified_branches > 0)
        out += ", unclassified=" + std::to_string(summary.unclassified_branches);
    return out;
}

void ReportWriter::write(const EntryReport& report) {
    if (format_ == OutputFormat::Json) {
        out_ << entry_to_json(report).dump(-1, ' ', false, json::error_handler_t::replace)
             << '\n';
    } else {
        for (const auto& d : report.diagnostics)
            out_ << d.message << '\n';
    }
    out_.flush();
    if (logger_initialized()) {
        for (const auto& d : report.diagnostics)
            log_diagnostic(report, d);
    }
}

void ReportWriter::write_summary(const ScanSummary& summary, std::chrono::milliseconds elapsed) {
    if (format_ == OutputFormat::Json)
        out_ << summary_to_json(summary, elapsed).dump() << '\n';
    else
        out_ << render_summary(summary, elapsed) << '\n';
    out_.flush();
    if (logger_initialized())
        log_info(render_summary(summary, elapsed));
}
