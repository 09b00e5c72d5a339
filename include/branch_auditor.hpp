#ifndef BRANCH_AUDITOR_HPP
#define BRANCH_AUDITOR_HPP

#include <set>
#include <string>
#include <vector>

#include "audit_types.hpp"
#include "diagnostics.hpp"
#include "git_backend.hpp"

/**
 * @brief Decide the sync status of one local branch.
 *
 * Checks run in order and the first failing one decides the status: branch
 * name, upstream presence, upstream remote name, remote fetched this run,
 * commit resolution, then ancestry. Only branches whose upstream remote is in
 * @p synced_remotes reach the ancestry walk.
 *
 * @param repo           Repository the branch belongs to.
 * @param branch         Local branch to audit.
 * @param synced_remotes Remotes fetched successfully for this repository.
 * @param diag           Collector for the entry being processed.
 * @return Outcome with an empty status when commit resolution failed.
 * @throws git::GitError when the ancestry walk fails.
 */
BranchOutcome audit_branch(git::Repository& repo, const git::Branch& branch,
                           const std::set<std::string>& synced_remotes, Diagnostics& diag);

/**
 * @brief Audit every local branch of @p repo, appending to @p out.
 *
 * Outcomes are appended as they are decided so that a later
 * git::GitError leaves the earlier ones in place.
 */
void audit_branches(git::Repository& repo, const std::set<std::string>& synced_remotes,
                    Diagnostics& diag, std::vector<BranchOutcome>& out);

#endif // BRANCH_AUDITOR_HPP
