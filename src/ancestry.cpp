#include "ancestry.hpp"

bool is_ancestor(git::Repository& repo, const git::CommitId& candidate, const git::CommitId& of) {
    if (candidate == of)
        return true;
    auto walk = repo.walk_ancestors(of);
    while (auto oid = walk->next()) {
        if (*oid == candidate)
            return true;
    }
    return false;
}

SyncStatus classify_ancestry(git::Repository& repo, const git::CommitId& local,
                             const git::CommitId& upstream) {
    if (is_ancestor(repo, local, upstream))
        return SyncStatus::Synced;
    if (is_ancestor(repo, upstream, local))
        return SyncStatus::AheadOfUpstream;
    return SyncStatus::Diverged;
}
