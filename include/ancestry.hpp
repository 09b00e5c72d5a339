#ifndef ANCESTRY_HPP
#define ANCESTRY_HPP

#include "audit_types.hpp"
#include "git_backend.hpp"

/**
 * @brief Check whether @p candidate is reachable from @p of through parents.
 *
 * A fresh topological walk is seeded at @p of for every call. A commit is its
 * own ancestor.
 *
 * @throws git::GitError when the history cannot be walked.
 */
bool is_ancestor(git::Repository& repo, const git::CommitId& candidate, const git::CommitId& of);

/**
 * @brief Classify a local commit against its upstream commit.
 *
 * The cheap containment check (local inside upstream) runs first; the
 * reverse walk only happens when it fails.
 *
 * @return `Synced`, `AheadOfUpstream` or `Diverged`.
 */
SyncStatus classify_ancestry(git::Repository& repo, const git::CommitId& local,
                             const git::CommitId& upstream);

#endif // ANCESTRY_HPP
