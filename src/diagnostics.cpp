#include "diagnostics.hpp"

#include <utility>

#include "text_utils.hpp"

void Diagnostics::add(Diagnostic d) {
    if (d.verbose_only && !verbose_)
        return;
    items_.push_back(std::move(d));
}

void Diagnostics::detail(const std::string& message) {
    add(Diagnostic{Severity::Info, message, true});
}

void Diagnostics::info(const std::string& message) {
    add(Diagnostic{Severity::Info, message, false});
}

void Diagnostics::warning(const std::string& message) {
    add(Diagnostic{Severity::Warning, message, false});
}

void Diagnostics::error(const std::string& message) {
    add(Diagnostic{Severity::Error, message, false});
}

void Diagnostics::critical(const std::string& message) {
    add(Diagnostic{Severity::Critical, message, false});
}

std::vector<Diagnostic> Diagnostics::take() {
    std::vector<Diagnostic> out;
    out.swap(items_);
    return out;
}

namespace msg {

static const char* const NOTE = "\xF0\x9F\x93\x9D";        // memo
static const char* const WARN = "\xE2\x9A\xA0\xEF\xB8\x8F"; // warning sign
static const char* const MISPLACED = "\xE2\x9D\x97";        // exclamation mark
static const char* const ALERT = "\xF0\x9F\x9A\xA8";        // rotating light
static const char* const LOSS = "\xF0\x9F\x92\xA5";         // collision
static const char* const OK = "\xE2\x9C\x85";               // check mark

static std::string at(const char* marker, const path& p) {
    return std::string(marker) + " " + p.string() + ": ";
}

std::string looking_at_entry(const path& p) {
    return std::string(NOTE) + " Looking at the entry " + p.string();
}

std::string symlink(const path& p) {
    return std::string(WARN) + " Found symlink: " + p.string() +
           ". Skipping it; what a symlink means in this directory is not defined.";
}

std::string plain_file(const path& p) {
    return std::string(MISPLACED) + " Found file: " + p.string() +
           ". Files are not backed up by pushing; move it somewhere safe if needed.";
}

std::string not_a_repository(const path& p, const std::string& reason) {
    return std::string(MISPLACED) + " " + reason + ": " + p.string() +
           ". This is not a git repository.";
}

std::string is_repository(const path& p) { return at(NOTE, p) + "This is a git repository"; }

std::string remote_bad_name(const path& p, const std::string& name_bytes) {
    return at(ALERT, p) + "Remote " + utf8_lossy(name_bytes) +
           " skipped because its name is not valid UTF-8";
}

std::string remote_not_found(const path& p, const std::string& remote, const std::string& reason) {
    return at(ALERT, p) + "Remote " + remote + " not found: " + reason;
}

std::string remote_bad_url(const path& p, const std::string& remote, const std::string& url_bytes) {
    return at(ALERT, p) + "Remote " + remote + " has a bad url: " + utf8_lossy(url_bytes);
}

std::string remote_unqualified(const path& p, const std::string& remote, const std::string& url) {
    return at(WARN, p) + "Remote " + remote + " (" + url + ") is not a qualifying remote";
}

std::string remote_fetched(const path& p, const std::string& remote) {
    return at(NOTE, p) + "Synced remote " + remote;
}

std::string remote_fetch_failed(const path& p, const std::string& remote,
                                const std::string& reason) {
    return at(ALERT, p) + "Failed to fetch remote " + remote + ": " + reason;
}

std::string branch_name_error(const path& p, const std::string& reason) {
    return at(ALERT, p) + "Failed to get the name of a branch: " + reason;
}

std::string branch_bad_name(const path& p, const std::string& name_bytes) {
    return at(ALERT, p) + "Branch " + utf8_lossy(name_bytes) + " has an invalid UTF-8 name";
}

std::string looking_at_branch(const path& p, const std::string& branch) {
    return at(NOTE, p) + "Looking at branch " + branch;
}

std::string no_upstream(const path& p, const std::string& branch, const std::string& reason) {
    std::string out = at(LOSS, p) + "Local branch " + branch + " has no upstream tracking branch";
    if (!reason.empty())
        out += ": " + reason;
    return out;
}

std::string upstream_name(const path& p, const std::string& branch, const std::string& upstream) {
    return at(NOTE, p) + "Branch " + branch + " has upstream " + upstream;
}

std::string upstream_remote_name(const path& p, const std::string& branch,
                                 const std::string& remote) {
    return at(NOTE, p) + "Branch " + branch + " has upstream remote " + remote;
}

std::string upstream_remote_error(const path& p, const std::string& branch,
                                  const std::string& refname, const std::string& reason) {
    return at(ALERT, p) + "Could not resolve the remote of " + refname + " (branch " + branch +
           "): " + reason;
}

std::string upstream_remote_not_synced(const path& p, const std::string& branch,
                                       const std::string& remote) {
    return at(ALERT, p) + "Branch " + branch + " tracks remote " + remote +
           " which was not fetched";
}

std::string branch_operation_failed(const path& p, const std::string& branch,
                                    const std::string& reason) {
    return at(ALERT, p) + "An operation on branch " + branch + " failed: " + reason;
}

std::string synced(const path& p, const std::string& branch) {
    return at(OK, p) + "Local branch " + branch + " is synced with its upstream";
}

std::string ahead_of_upstream(const path& p, const std::string& branch) {
    return at(ALERT, p) + "Local branch " + branch + " is ahead of its upstream";
}

std::string diverged(const path& p, const std::string& branch) {
    return at(ALERT, p) + "Local branch " + branch + " has diverged from its upstream";
}

std::string entry_failed(const path& p, const std::string& reason) {
    return std::string(ALERT) + " Failed for the entry " + p.string() + ": " + reason;
}

std::string directory_entry_error(const std::string& reason) {
    return std::string(ALERT) + " Something unexpectedly failed while reading an entry: " + reason;
}

} // namespace msg
