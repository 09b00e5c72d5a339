#ifndef REMOTE_SYNCER_HPP
#define REMOTE_SYNCER_HPP

#include <set>
#include <string>
#include <vector>

#include "audit_types.hpp"
#include "diagnostics.hpp"
#include "git_backend.hpp"
#include "remote_qualifier.hpp"

/**
 * @brief Pick the credential answering an authentication challenge.
 *
 * A username-only challenge gets a bare username; every other challenge gets
 * SSH public-key authentication with the configured private key. The
 * username is the one embedded in the URL, else `cfg.default_username`.
 */
git::Credential select_credential(const git::CredentialChallenge& challenge,
                                  const AuditConfig& cfg);

/**
 * @brief Fetch every qualifying remote, one after another.
 *
 * Unqualified candidates are not touched. A failed fetch is diagnosed and
 * recorded; the remaining remotes are still attempted.
 *
 * @return One outcome per qualifying remote, in candidate order.
 */
std::vector<FetchOutcome> sync_remotes(std::vector<RemoteCandidate>& remotes,
                                       const AuditConfig& cfg, Diagnostics& diag);

/// @return Names of the remotes whose fetch succeeded.
std::set<std::string> synced_remote_names(const std::vector<FetchOutcome>& outcomes);

#endif // REMOTE_SYNCER_HPP
