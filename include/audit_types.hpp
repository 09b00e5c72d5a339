#ifndef AUDIT_TYPES_HPP
#define AUDIT_TYPES_HPP
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Classification of one local branch against its upstream.
 */
enum class SyncStatus {
    Synced,                  ///< Local history is contained in the upstream
    AheadOfUpstream,         ///< Upstream is a strict prefix of the local branch
    Diverged,                ///< Neither history contains the other
    NoUpstream,              ///< No tracking branch configured
    UpstreamRemoteNotSynced, ///< Upstream remote unqualified or its fetch failed
    NameUnresolvable         ///< Branch, upstream or remote name could not be resolved
};

/** @brief Severity attached to a diagnostic line. */
enum class Severity { Info = 0, Warning, Error, Critical };

/** @brief How a directory entry was classified by the scanner. */
enum class EntryKind { Unknown, Symlink, File, NotRepository, Repository };

/**
 * @brief One human-readable outcome produced while handling an entry.
 */
struct Diagnostic {
    Severity severity = Severity::Info;
    std::string message;
    bool verbose_only = false; ///< Emitted only when verbose output is enabled
};

/**
 * @brief A remote of the repository under audit.
 *
 * `qualifies` is computed once from the URL and never re-derived.
 */
struct RemoteDescriptor {
    std::string name;
    std::string url;
    bool qualifies = false;
};

/** @brief Result of fetching one qualifying remote. */
struct FetchOutcome {
    std::string remote;
    bool fetched = false;
    std::string reason; ///< Backend error text when the fetch failed
};

/**
 * @brief Final verdict for a local branch.
 *
 * `status` is empty when classification was abandoned because of an
 * unexpected backend error (e.g. an unborn branch that resolves to no commit).
 */
struct BranchOutcome {
    std::string branch;
    std::optional<SyncStatus> status;
    std::string upstream;
    std::string remote;
};

/**
 * @brief Everything produced while handling a single directory entry.
 *
 * Returned by value from entry processing; the caller decides when it is
 * flushed so that reports of two entries never interleave.
 */
struct EntryReport {
    std::filesystem::path path;
    EntryKind kind = EntryKind::Unknown;
    std::vector<Diagnostic> diagnostics;
    std::vector<RemoteDescriptor> remotes;
    std::vector<FetchOutcome> fetches;
    std::vector<BranchOutcome> branches;
    bool failed = false; ///< An unexpected error abandoned the entry
};

/**
 * @brief Settings shared by every entry of a scan.
 */
struct AuditConfig {
    std::filesystem::path ssh_private_key;
    std::string default_username = "git";
    std::vector<std::string> qualifying_prefixes{"https://github.com/", "git@github.com:"};
    bool verbose = false;
};

/** @return Stable lowercase identifier such as `ahead_of_upstream`. */
const char* to_string(SyncStatus status);

/** @return Lowercase severity name such as `warning`. */
const char* to_string(Severity severity);

/** @return Lowercase entry kind name such as `repository`. */
const char* to_string(EntryKind kind);

#endif // AUDIT_TYPES_HPP
