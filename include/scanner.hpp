#ifndef SCANNER_HPP
#define SCANNER_HPP

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <vector>

#include "audit_types.hpp"
#include "git_backend.hpp"

/**
 * @brief Counters accumulated over a whole scan.
 */
struct ScanSummary {
    size_t entries = 0;
    size_t repositories = 0;
    size_t failed_entries = 0;
    size_t branches = 0;
    size_t unclassified_branches = 0; ///< Branches abandoned without a status
    std::map<SyncStatus, size_t> statuses;

    void add(const EntryReport& report);
    /// @return `true` when every branch is synced and no entry failed.
    bool all_synced() const;
};

using EntrySink = std::function<void(const EntryReport&)>;

/**
 * @brief List the entries of @p dir (one level) in sorted order.
 *
 * @param errors Receives one message per entry that could not be read.
 * @throws std::runtime_error if the directory cannot be opened.
 */
std::vector<std::filesystem::path> list_entries(const std::filesystem::path& dir,
                                                std::vector<std::string>& errors);

/**
 * @brief Audit a single directory entry.
 *
 * Symlinks and plain files are diagnosed without touching the backend. Any
 * exception escaping the pipeline is turned into one diagnostic and marks
 * the report as failed; nothing propagates to the caller.
 */
EntryReport process_entry(const std::filesystem::path& p, git::Backend& backend,
                          const AuditConfig& cfg);

/**
 * @brief Audit every entry of @p dir in turn.
 *
 * @p sink receives each report as soon as its entry is finished, so the
 * output of two entries never interleaves.
 *
 * @throws std::runtime_error if @p dir cannot be read.
 */
ScanSummary scan_directory(const std::filesystem::path& dir, git::Backend& backend,
                           const AuditConfig& cfg, const EntrySink& sink);

#endif // SCANNER_HPP
