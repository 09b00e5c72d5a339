#ifndef GIT_BACKEND_HPP
#define GIT_BACKEND_HPP

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace git {
namespace fs = std::filesystem;

/// 40 character hexadecimal commit identifier.
using CommitId = std::string;

/**
 * @brief Unexpected failure reported by the version-control backend.
 *
 * Expected conditions (not a repository, missing upstream, unknown remote)
 * are reported through null or empty returns and an error string instead.
 */
class GitError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Authentication request raised by the backend during a fetch.
 */
struct CredentialChallenge {
    std::string url;
    std::optional<std::string> username_from_url;
    bool username_only = false; ///< The server only wants a username
};

/**
 * @brief Credential handed back to the backend.
 */
struct Credential {
    enum class Kind { UsernameOnly, SshPrivateKey };
    Kind kind = Kind::UsernameOnly;
    std::string username;
    fs::path private_key; ///< Only meaningful for `SshPrivateKey`
};

using CredentialProvider = std::function<Credential(const CredentialChallenge&)>;

/**
 * @brief Lazy topological walk over commit ancestry.
 *
 * A walk is consumed once; start a new one for every query.
 */
class RevWalk {
  public:
    virtual ~RevWalk() = default;
    /// @return Next commit, or `std::nullopt` when the walk is exhausted.
    /// @throws GitError when the history cannot be read.
    virtual std::optional<CommitId> next() = 0;
};

class Remote {
  public:
    virtual ~Remote() = default;
    virtual std::string name() const = 0;
    /// @return Configured URL or `std::nullopt` if it is missing or not text.
    virtual std::optional<std::string> url() const = 0;
    /// Raw URL bytes for diagnostics, empty when no URL is configured.
    virtual std::string url_bytes() const = 0;
    /**
     * @brief Fetch the remote using its configured refspecs.
     *
     * @param credentials Called whenever the transport asks for credentials.
     * @param error       Receives the backend message on failure.
     * @return `true` when the fetch completed.
     */
    virtual bool fetch(const CredentialProvider& credentials, std::string* error) = 0;
};

class Branch {
  public:
    virtual ~Branch() = default;
    /**
     * @brief Short branch name as raw bytes (may not be valid UTF-8).
     * @return Name bytes or `std::nullopt` with @a error filled.
     */
    virtual std::optional<std::string> name_bytes(std::string* error) const = 0;
    /// Fully qualified reference name, e.g. `refs/remotes/origin/main`.
    virtual std::string reference_name() const = 0;
    /// @return Upstream tracking branch or `nullptr` with @a error filled.
    virtual std::unique_ptr<Branch> upstream(std::string* error) const = 0;
    /// @return Commit the branch points to after peeling symbolic references.
    virtual std::optional<CommitId> resolve(std::string* error) const = 0;
};

class Repository {
  public:
    virtual ~Repository() = default;
    /// @throws GitError when the remote list cannot be read.
    virtual std::vector<std::string> remote_names() = 0;
    virtual std::unique_ptr<Remote> find_remote(const std::string& name, std::string* error) = 0;
    /// @throws GitError when the branch list cannot be read.
    virtual std::vector<std::unique_ptr<Branch>> local_branches() = 0;
    /**
     * @brief Name of the remote owning a remote-tracking reference.
     *
     * @param refname Fully qualified name such as `refs/remotes/origin/main`.
     * @return Remote name bytes or `std::nullopt` with @a error filled.
     */
    virtual std::optional<std::string> branch_remote_name(const std::string& refname,
                                                          std::string* error) = 0;
    /// @throws GitError when the walk cannot be set up.
    virtual std::unique_ptr<RevWalk> walk_ancestors(const CommitId& seed) = 0;
};

class Backend {
  public:
    virtual ~Backend() = default;
    /**
     * @brief Open the repository at @a path.
     * @return Repository handle, or `nullptr` with @a error filled when the
     *         path is not a repository.
     */
    virtual std::unique_ptr<Repository> open(const fs::path& path, std::string* error) = 0;
};

} // namespace git

#endif // GIT_BACKEND_HPP
