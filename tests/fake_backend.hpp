#pragma once
// In-memory stand-in for the libgit2 backend. Repositories are described by
// plain structs; every handle reads the shared RepoSpec so tests can inspect
// what the code under test did (fetches, walks, credentials).

#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "git_backend.hpp"

namespace fake {

using git::CommitId;
namespace fs = std::filesystem;

struct RemoteSpec {
    std::optional<std::string> url;
    bool lookup_fails = false;
    bool fetch_fails = false;
    std::string fetch_error = "could not resolve host";
    /// Challenge presented to the credential provider during fetch.
    std::optional<git::CredentialChallenge> challenge;
    int fetch_count = 0;
    std::vector<git::Credential> credentials_seen;
};

struct BranchSpec {
    std::string name;
    bool name_fails = false;
    std::optional<CommitId> commit;       ///< Empty for an unresolvable branch
    std::optional<std::string> upstream; ///< Short upstream name, e.g. `origin/main`
};

struct RepoSpec {
    std::vector<std::string> remote_order;
    std::map<std::string, RemoteSpec> remotes;
    std::vector<BranchSpec> branches;
    /// Remote-tracking branches by short name (`origin/main`).
    std::map<std::string, CommitId> tracking;
    /// Overrides the remote derived from a remote-tracking ref name.
    std::map<std::string, std::string> remote_of_ref;
    std::set<std::string> remote_of_ref_fails;
    /// Parent edges of the commit graph.
    std::map<CommitId, std::vector<CommitId>> parents;
    bool list_remotes_throws = false;
    bool list_branches_throws = false;
    bool walk_throws = false;
    int walks = 0;

    void commit(const CommitId& id, std::vector<CommitId> parent_ids = {}) {
        parents[id] = std::move(parent_ids);
    }
};

class FakeWalk : public git::RevWalk {
    const RepoSpec& spec_;
    std::deque<CommitId> queue_;
    std::set<CommitId> seen_;

  public:
    FakeWalk(const RepoSpec& spec, const CommitId& seed) : spec_(spec) {
        queue_.push_back(seed);
        seen_.insert(seed);
    }

    std::optional<CommitId> next() override {
        if (spec_.walk_throws)
            throw git::GitError("object file is truncated");
        if (queue_.empty())
            return std::nullopt;
        CommitId id = queue_.front();
        queue_.pop_front();
        auto it = spec_.parents.find(id);
        if (it != spec_.parents.end()) {
            for (const auto& p : it->second) {
                if (seen_.insert(p).second)
                    queue_.push_back(p);
            }
        }
        return id;
    }
};

class FakeRemote : public git::Remote {
    std::string name_;
    RemoteSpec& spec_;

  public:
    FakeRemote(std::string name, RemoteSpec& spec) : name_(std::move(name)), spec_(spec) {}

    std::string name() const override { return name_; }
    std::optional<std::string> url() const override { return spec_.url; }
    std::string url_bytes() const override { return spec_.url.value_or(""); }

    bool fetch(const git::CredentialProvider& credentials, std::string* error) override {
        ++spec_.fetch_count;
        if (spec_.challenge)
            spec_.credentials_seen.push_back(credentials(*spec_.challenge));
        if (spec_.fetch_fails) {
            if (error)
                *error = spec_.fetch_error;
            return false;
        }
        return true;
    }
};

class FakeBranch : public git::Branch {
    const RepoSpec& spec_;
    BranchSpec branch_;
    bool remote_tracking_;

  public:
    FakeBranch(const RepoSpec& spec, BranchSpec branch, bool remote_tracking)
        : spec_(spec), branch_(std::move(branch)), remote_tracking_(remote_tracking) {}

    std::optional<std::string> name_bytes(std::string* error) const override {
        if (branch_.name_fails) {
            if (error)
                *error = "reference name is not valid";
            return std::nullopt;
        }
        return branch_.name;
    }

    std::string reference_name() const override {
        return (remote_tracking_ ? "refs/remotes/" : "refs/heads/") + branch_.name;
    }

    std::unique_ptr<git::Branch> upstream(std::string* error) const override {
        if (!branch_.upstream) {
            if (error)
                *error = "reference '" + reference_name() + "' does not have an upstream";
            return nullptr;
        }
        BranchSpec up;
        up.name = *branch_.upstream;
        auto it = spec_.tracking.find(up.name);
        if (it != spec_.tracking.end())
            up.commit = it->second;
        return std::make_unique<FakeBranch>(spec_, up, true);
    }

    std::optional<CommitId> resolve(std::string* error) const override {
        if (!branch_.commit) {
            if (error)
                *error = "reference '" + reference_name() + "' not found";
            return std::nullopt;
        }
        return branch_.commit;
    }
};

class FakeRepository : public git::Repository {
    RepoSpec& spec_;

  public:
    explicit FakeRepository(RepoSpec& spec) : spec_(spec) {}

    std::vector<std::string> remote_names() override {
        if (spec_.list_remotes_throws)
            throw git::GitError("failed to parse config");
        return spec_.remote_order;
    }

    std::unique_ptr<git::Remote> find_remote(const std::string& name, std::string* error) override {
        auto it = spec_.remotes.find(name);
        if (it == spec_.remotes.end() || it->second.lookup_fails) {
            if (error)
                *error = "remote '" + name + "' does not exist";
            return nullptr;
        }
        return std::make_unique<FakeRemote>(name, it->second);
    }

    std::vector<std::unique_ptr<git::Branch>> local_branches() override {
        if (spec_.list_branches_throws)
            throw git::GitError("corrupt loose reference file");
        std::vector<std::unique_ptr<git::Branch>> out;
        for (const auto& b : spec_.branches)
            out.push_back(std::make_unique<FakeBranch>(spec_, b, false));
        return out;
    }

    std::optional<std::string> branch_remote_name(const std::string& refname,
                                                  std::string* error) override {
        if (spec_.remote_of_ref_fails.count(refname)) {
            if (error)
                *error = "ambiguous remote for " + refname;
            return std::nullopt;
        }
        auto it = spec_.remote_of_ref.find(refname);
        if (it != spec_.remote_of_ref.end())
            return it->second;
        const std::string prefix = "refs/remotes/";
        std::string rest = refname.substr(prefix.size());
        return rest.substr(0, rest.find('/'));
    }

    std::unique_ptr<git::RevWalk> walk_ancestors(const CommitId& seed) override {
        ++spec_.walks;
        return std::make_unique<FakeWalk>(spec_, seed);
    }
};

class FakeBackend : public git::Backend {
  public:
    std::map<fs::path, RepoSpec> repos;
    std::vector<fs::path> opened;

    std::unique_ptr<git::Repository> open(const fs::path& path, std::string* error) override {
        opened.push_back(path);
        auto it = repos.find(path);
        if (it == repos.end()) {
            if (error)
                *error = "could not find repository at '" + path.string() + "'";
            return nullptr;
        }
        return std::make_unique<FakeRepository>(it->second);
    }
};

/// A repository with one qualifying remote `origin` and the given URL.
inline RepoSpec github_repo(const std::string& url = "https://github.com/org/repo.git") {
    RepoSpec spec;
    spec.remote_order = {"origin"};
    spec.remotes["origin"].url = url;
    return spec;
}

} // namespace fake
