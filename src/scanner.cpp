#include "scanner.hpp"

#include <algorithm>
#include <exception>
#include <set>
#include <stdexcept>
#include <string>
#include <system_error>

#include "branch_auditor.hpp"
#include "diagnostics.hpp"
#include "logger.hpp"
#include "remote_qualifier.hpp"
#include "remote_syncer.hpp"

namespace fs = std::filesystem;

void ScanSummary::add(const EntryReport& report) {
    ++entries;
    if (report.kind == EntryKind::Repository)
        ++repositories;
    if (report.failed)
        ++failed_entries;
    for (const auto& b : report.branches) {
        ++branches;
        if (b.status)
            ++statuses[*b.status];
        else
            ++unclassified_branches;
    }
}

bool ScanSummary::all_synced() const {
    if (failed_entries > 0 || unclassified_branches > 0)
        return false;
    for (const auto& [status, count] : statuses) {
        if (status != SyncStatus::Synced && count > 0)
            return false;
    }
    return true;
}

std::vector<fs::path> list_entries(const fs::path& dir, std::vector<std::string>& errors) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec)
        throw std::runtime_error("Failed to read repositories directory " + dir.string() + ": " +
                                 ec.message());
    std::vector<fs::path> out;
    for (fs::directory_iterator end; it != end;) {
        out.push_back(it->path());
        it.increment(ec);
        if (ec) {
            // The iterator is unusable after a failed increment.
            errors.push_back(ec.message());
            break;
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

static void handle_repository(git::Repository& repo, const AuditConfig& cfg, Diagnostics& diag,
                              EntryReport& report) {
    auto remotes = collect_remotes(repo, cfg.qualifying_prefixes, diag);
    for (const auto& r : remotes)
        report.remotes.push_back(r.descriptor);
    report.fetches = sync_remotes(remotes, cfg, diag);
    const std::set<std::string> synced = synced_remote_names(report.fetches);
    audit_branches(repo, synced, diag, report.branches);
}

static void handle_entry(const fs::path& p, git::Backend& backend, const AuditConfig& cfg,
                         Diagnostics& diag, EntryReport& report) {
    fs::file_status st = fs::symlink_status(p);
    if (fs::is_symlink(st)) {
        report.kind = EntryKind::Symlink;
        diag.warning(msg::symlink(p));
        return;
    }
    if (fs::is_regular_file(st)) {
        report.kind = EntryKind::File;
        diag.error(msg::plain_file(p));
        return;
    }
    std::string err;
    auto repo = backend.open(p, &err);
    if (!repo) {
        report.kind = EntryKind::NotRepository;
        diag.error(msg::not_a_repository(p, err));
        return;
    }
    report.kind = EntryKind::Repository;
    diag.detail(msg::is_repository(p));
    handle_repository(*repo, cfg, diag, report);
}

EntryReport process_entry(const fs::path& p, git::Backend& backend, const AuditConfig& cfg) {
    Diagnostics diag(p, cfg.verbose);
    EntryReport report;
    report.path = p;
    diag.detail(msg::looking_at_entry(p));
    try {
        handle_entry(p, backend, cfg, diag, report);
    } catch (const std::exception& e) {
        report.failed = true;
        diag.error(msg::entry_failed(p, e.what()));
        if (logger_initialized())
            log_error("Entry processing failed", {{"entry", p.string()}, {"error", e.what()}});
    }
    report.diagnostics = diag.take();
    return report;
}

ScanSummary scan_directory(const fs::path& dir, git::Backend& backend, const AuditConfig& cfg,
                           const EntrySink& sink) {
    std::vector<std::string> errors;
    auto entries = list_entries(dir, errors);
    if (logger_initialized())
        log_info("Scanning repositories directory",
                 {{"directory", dir.string()}, {"entries", std::to_string(entries.size())}});
    ScanSummary summary;
    for (const auto& p : entries) {
        EntryReport report = process_entry(p, backend, cfg);
        summary.add(report);
        sink(report);
    }
    for (const auto& e : errors) {
        EntryReport report;
        report.failed = true;
        report.diagnostics.push_back(
            Diagnostic{Severity::Error, msg::directory_entry_error(e), false});
        summary.add(report);
        sink(report);
    }
    return summary;
}
