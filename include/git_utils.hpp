#ifndef GIT_UTILS_HPP
#define GIT_UTILS_HPP

#include <git2.h>
#include <memory>
#include <string>

#include "git_backend.hpp"

namespace git {

/**
 * @brief RAII helper managing global libgit2 initialization.
 *
 * Instantiate once for the lifetime of the application to ensure all libgit2
 * operations are performed after initialization and before shutdown.
 */
struct GitInitGuard {
    GitInitGuard();  ///< Calls `git_libgit2_init()`
    ~GitInitGuard(); ///< Calls `git_libgit2_shutdown()`
};

// RAII wrappers for libgit2 resources
template <typename T, void (*Free)(T*)> struct GitHandle {
    T* h;
    explicit GitHandle(T* h_ = nullptr) : h(h_) {}
    ~GitHandle() {
        if (h)
            Free(h);
    }
    GitHandle(const GitHandle&) = delete;
    GitHandle& operator=(const GitHandle&) = delete;
    T* get() const { return h; }
};

using repo_ptr = GitHandle<git_repository, git_repository_free>;
using remote_ptr = GitHandle<git_remote, git_remote_free>;
using reference_ptr = GitHandle<git_reference, git_reference_free>;
using revwalk_ptr = GitHandle<git_revwalk, git_revwalk_free>;
using branch_iterator_ptr = GitHandle<git_branch_iterator, git_branch_iterator_free>;

/// Maximum credential callback invocations tolerated during one fetch.
constexpr int MAX_CREDENTIAL_ATTEMPTS = 3;

/**
 * @brief Text of the last libgit2 error, or a generic message.
 */
std::string last_error_message();

/**
 * @brief Convert a libgit2 object ID to a hexadecimal string.
 */
std::string oid_to_hex(const git_oid& oid);

/**
 * @brief Backend implementation on top of libgit2.
 *
 * The caller must keep a @ref GitInitGuard alive while the backend and any
 * handle it produced are in use.
 */
class Libgit2Backend : public Backend {
  public:
    std::unique_ptr<Repository> open(const fs::path& path, std::string* error) override;
};

} // namespace git

#endif // GIT_UTILS_HPP
