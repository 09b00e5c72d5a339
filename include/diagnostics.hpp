#ifndef DIAGNOSTICS_HPP
#define DIAGNOSTICS_HPP

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "audit_types.hpp"

/**
 * @brief Ordered collector for the diagnostics of one directory entry.
 *
 * Messages are kept in emission order. Verbose-only messages are dropped at
 * collection time unless verbose output was requested. The collected list is
 * handed back to the caller through @ref take, never printed from here.
 */
class Diagnostics {
    std::filesystem::path entry_;
    bool verbose_;
    std::vector<Diagnostic> items_;

  public:
    Diagnostics(std::filesystem::path entry, bool verbose)
        : entry_(std::move(entry)), verbose_(verbose) {}

    const std::filesystem::path& entry() const { return entry_; }

    /// Record an informational line shown only in verbose mode.
    void detail(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    void critical(const std::string& message);
    void add(Diagnostic d);

    size_t size() const { return items_.size(); }
    const std::vector<Diagnostic>& items() const { return items_; }

    /// Move the collected diagnostics out, leaving the collector empty.
    std::vector<Diagnostic> take();
};

/**
 * Message builders for every outcome the audit reports. Each returns the
 * fully rendered line including its marker.
 */
namespace msg {
using std::filesystem::path;

std::string looking_at_entry(const path& p);
std::string symlink(const path& p);
std::string plain_file(const path& p);
std::string not_a_repository(const path& p, const std::string& reason);
std::string is_repository(const path& p);
std::string remote_bad_name(const path& p, const std::string& name_bytes);
std::string remote_not_found(const path& p, const std::string& remote, const std::string& reason);
std::string remote_bad_url(const path& p, const std::string& remote, const std::string& url_bytes);
std::string remote_unqualified(const path& p, const std::string& remote, const std::string& url);
std::string remote_fetched(const path& p, const std::string& remote);
std::string remote_fetch_failed(const path& p, const std::string& remote,
                                const std::string& reason);
std::string branch_name_error(const path& p, const std::string& reason);
std::string branch_bad_name(const path& p, const std::string& name_bytes);
std::string looking_at_branch(const path& p, const std::string& branch);
std::string no_upstream(const path& p, const std::string& branch, const std::string& reason);
std::string upstream_name(const path& p, const std::string& branch, const std::string& upstream);
std::string upstream_remote_name(const path& p, const std::string& branch,
                                 const std::string& remote);
std::string upstream_remote_error(const path& p, const std::string& branch,
                                  const std::string& refname, const std::string& reason);
std::string upstream_remote_not_synced(const path& p, const std::string& branch,
                                       const std::string& remote);
std::string branch_operation_failed(const path& p, const std::string& branch,
                                    const std::string& reason);
std::string synced(const path& p, const std::string& branch);
std::string ahead_of_upstream(const path& p, const std::string& branch);
std::string diverged(const path& p, const std::string& branch);
std::string entry_failed(const path& p, const std::string& reason);
std::string directory_entry_error(const std::string& reason);
} // namespace msg

#endif // DIAGNOSTICS_HPP
