#ifndef REMOTE_QUALIFIER_HPP
#define REMOTE_QUALIFIER_HPP

#include <memory>
#include <string>
#include <vector>

#include "audit_types.hpp"
#include "diagnostics.hpp"
#include "git_backend.hpp"

/**
 * @brief Check whether a remote URL belongs to a trusted host.
 *
 * The comparison is a case-sensitive prefix match without any URL
 * normalization.
 *
 * @param url      Remote URL as configured in the repository.
 * @param prefixes Accepted URL prefixes.
 * @return `true` if @p url starts with one of @p prefixes.
 */
bool remote_qualifies(const std::string& url, const std::vector<std::string>& prefixes);

/**
 * @brief A remote whose name and URL could be read, with its open handle.
 */
struct RemoteCandidate {
    RemoteDescriptor descriptor;
    std::unique_ptr<git::Remote> handle;
};

/**
 * @brief Enumerate and qualify the remotes of a repository.
 *
 * Remotes with a name that is not valid UTF-8, that cannot be looked up or
 * that have no URL are diagnosed and left out; unqualified remotes are
 * diagnosed and returned with `qualifies == false`.
 *
 * @throws git::GitError when the remote list itself cannot be read.
 */
std::vector<RemoteCandidate> collect_remotes(git::Repository& repo,
                                             const std::vector<std::string>& prefixes,
                                             Diagnostics& diag);

#endif // REMOTE_QUALIFIER_HPP
