#include "git_utils.hpp"
#include <string>
#include <utility>
#include <vector>

using namespace std;

namespace git {

/**
 * @brief Construct the RAII guard and initialize libgit2.
 * @return None.
 */
GitInitGuard::GitInitGuard() { git_libgit2_init(); }

/**
 * @brief Destroy the RAII guard and shutdown libgit2.
 * @return None.
 */
GitInitGuard::~GitInitGuard() { git_libgit2_shutdown(); }

string last_error_message() {
    const git_error* e = git_error_last();
    if (e && e->message)
        return e->message;
    return "Unknown libgit2 error";
}

/**
 * @brief Populate an error string with the last libgit2 error message.
 *
 * @param error Output string receiving the error description.
 * @return None.
 */
static void set_error(string* error) {
    if (error)
        *error = last_error_message();
}

string oid_to_hex(const git_oid& oid) {
    char buf[GIT_OID_HEXSZ + 1];
    git_oid_tostr(buf, sizeof(buf), &oid);
    return string(buf);
}

namespace {

/// State shared with the credential callback for the duration of one fetch.
struct FetchPayload {
    const CredentialProvider* provider;
    int attempts = 0;
    string failure;
};

/**
 * @brief libgit2 credential callback forwarding the challenge to the provider.
 *
 * The callback is invoked again whenever the server rejects the credential,
 * so the number of attempts is capped to avoid an endless authentication
 * loop with a rejected key.
 */
int credential_cb(git_credential** out, const char* url, const char* username_from_url,
                  unsigned int allowed_types, void* payload) {
    auto* fp = static_cast<FetchPayload*>(payload);
    if (++fp->attempts > MAX_CREDENTIAL_ATTEMPTS) {
        fp->failure = "authentication rejected after " + to_string(MAX_CREDENTIAL_ATTEMPTS) +
                      " attempts";
        return GIT_EAUTH;
    }
    CredentialChallenge challenge;
    challenge.url = url ? url : "";
    if (username_from_url && *username_from_url)
        challenge.username_from_url = string(username_from_url);
    challenge.username_only = (allowed_types & GIT_CREDENTIAL_USERNAME) != 0;
    Credential cred;
    try {
        cred = (*fp->provider)(challenge);
    } catch (const exception& e) {
        // Exceptions must not unwind through libgit2.
        fp->failure = string("credential provider failed: ") + e.what();
        return GIT_EUSER;
    }
    int rc = 0;
    if (cred.kind == Credential::Kind::UsernameOnly) {
        rc = git_credential_username_new(out, cred.username.c_str());
    } else {
        string key = cred.private_key.string();
        rc = git_credential_ssh_key_new(out, cred.username.c_str(), nullptr, key.c_str(), nullptr);
    }
    if (rc != 0)
        fp->failure = last_error_message();
    return rc;
}

class Libgit2RevWalk : public RevWalk {
    revwalk_ptr walk_;

  public:
    explicit Libgit2RevWalk(git_revwalk* walk) : walk_(walk) {}

    optional<CommitId> next() override {
        git_oid oid;
        int rc = git_revwalk_next(&oid, walk_.get());
        if (rc == GIT_ITEROVER)
            return nullopt;
        if (rc != 0)
            throw GitError("Failed to walk commit history: " + last_error_message());
        return oid_to_hex(oid);
    }
};

class Libgit2Remote : public Remote {
    remote_ptr remote_;

  public:
    explicit Libgit2Remote(git_remote* remote) : remote_(remote) {}

    string name() const override {
        const char* n = git_remote_name(remote_.get());
        return n ? n : "";
    }

    optional<string> url() const override {
        const char* u = git_remote_url(remote_.get());
        if (!u || !*u)
            return nullopt;
        return string(u);
    }

    string url_bytes() const override {
        const char* u = git_remote_url(remote_.get());
        return u ? u : "";
    }

    bool fetch(const CredentialProvider& credentials, string* error) override {
        FetchPayload payload{&credentials};
        git_fetch_options fetch_opts = GIT_FETCH_OPTIONS_INIT;
        fetch_opts.callbacks.credentials = credential_cb;
        fetch_opts.callbacks.payload = &payload;
        if (git_remote_fetch(remote_.get(), nullptr, &fetch_opts, nullptr) != 0) {
            if (error)
                *error = payload.failure.empty() ? last_error_message() : payload.failure;
            return false;
        }
        return true;
    }
};

class Libgit2Branch : public Branch {
    reference_ptr ref_;

  public:
    explicit Libgit2Branch(git_reference* ref) : ref_(ref) {}

    optional<string> name_bytes(string* error) const override {
        const char* name = nullptr;
        if (git_branch_name(&name, ref_.get()) != 0 || !name) {
            set_error(error);
            return nullopt;
        }
        return string(name);
    }

    string reference_name() const override {
        const char* name = git_reference_name(ref_.get());
        return name ? name : "";
    }

    unique_ptr<Branch> upstream(string* error) const override {
        git_reference* raw = nullptr;
        if (git_branch_upstream(&raw, ref_.get()) != 0) {
            set_error(error);
            return nullptr;
        }
        return make_unique<Libgit2Branch>(raw);
    }

    optional<CommitId> resolve(string* error) const override {
        git_reference* raw = nullptr;
        if (git_reference_resolve(&raw, ref_.get()) != 0) {
            set_error(error);
            return nullopt;
        }
        reference_ptr resolved(raw);
        const git_oid* oid = git_reference_target(resolved.get());
        if (!oid) {
            if (error)
                *error = string("Reference ") + reference_name() + " has no direct target";
            return nullopt;
        }
        return oid_to_hex(*oid);
    }
};

class Libgit2Repository : public Repository {
    repo_ptr repo_;

  public:
    explicit Libgit2Repository(git_repository* repo) : repo_(repo) {}

    vector<string> remote_names() override {
        git_strarray names{};
        if (git_remote_list(&names, repo_.get()) != 0)
            throw GitError("Failed to list remotes: " + last_error_message());
        vector<string> out;
        out.reserve(names.count);
        for (size_t i = 0; i < names.count; ++i)
            out.emplace_back(names.strings[i] ? names.strings[i] : "");
        git_strarray_dispose(&names);
        return out;
    }

    unique_ptr<Remote> find_remote(const string& name, string* error) override {
        git_remote* raw = nullptr;
        if (git_remote_lookup(&raw, repo_.get(), name.c_str()) != 0) {
            set_error(error);
            return nullptr;
        }
        return make_unique<Libgit2Remote>(raw);
    }

    vector<unique_ptr<Branch>> local_branches() override {
        git_branch_iterator* raw_it = nullptr;
        if (git_branch_iterator_new(&raw_it, repo_.get(), GIT_BRANCH_LOCAL) != 0)
            throw GitError("Failed to list branches: " + last_error_message());
        branch_iterator_ptr it(raw_it);
        vector<unique_ptr<Branch>> out;
        while (true) {
            git_reference* ref = nullptr;
            git_branch_t type;
            int rc = git_branch_next(&ref, &type, it.get());
            if (rc == GIT_ITEROVER)
                break;
            if (rc != 0)
                throw GitError("Failed to read branch: " + last_error_message());
            out.push_back(make_unique<Libgit2Branch>(ref));
        }
        return out;
    }

    optional<string> branch_remote_name(const string& refname, string* error) override {
        git_buf buf{};
        if (git_branch_remote_name(&buf, repo_.get(), refname.c_str()) != 0) {
            set_error(error);
            git_buf_dispose(&buf);
            return nullopt;
        }
        string name(buf.ptr ? buf.ptr : "", buf.size);
        git_buf_dispose(&buf);
        return name;
    }

    unique_ptr<RevWalk> walk_ancestors(const CommitId& seed) override {
        git_oid oid;
        if (git_oid_fromstr(&oid, seed.c_str()) != 0)
            throw GitError("Invalid commit id " + seed + ": " + last_error_message());
        git_revwalk* raw = nullptr;
        if (git_revwalk_new(&raw, repo_.get()) != 0)
            throw GitError("Failed to create revwalk: " + last_error_message());
        auto walk = make_unique<Libgit2RevWalk>(raw);
        if (git_revwalk_sorting(raw, GIT_SORT_TOPOLOGICAL) != 0 ||
            git_revwalk_push(raw, &oid) != 0)
            throw GitError("Failed to start revwalk at " + seed + ": " + last_error_message());
        return walk;
    }
};

} // namespace

unique_ptr<Repository> Libgit2Backend::open(const fs::path& path, string* error) {
    git_repository* raw = nullptr;
    if (git_repository_open(&raw, path.string().c_str()) != 0) {
        set_error(error);
        return nullptr;
    }
    return make_unique<Libgit2Repository>(raw);
}

} // namespace git
