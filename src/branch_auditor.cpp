#include "branch_auditor.hpp"

#include "ancestry.hpp"
#include "text_utils.hpp"

BranchOutcome audit_branch(git::Repository& repo, const git::Branch& branch,
                           const std::set<std::string>& synced_remotes, Diagnostics& diag) {
    const auto& entry = diag.entry();
    BranchOutcome outcome;
    std::string err;

    auto name_bytes = branch.name_bytes(&err);
    if (!name_bytes) {
        diag.error(msg::branch_name_error(entry, err));
        outcome.status = SyncStatus::NameUnresolvable;
        return outcome;
    }
    outcome.branch = utf8_lossy(*name_bytes);
    diag.detail(msg::looking_at_branch(entry, outcome.branch));

    auto upstream = branch.upstream(&err);
    if (!upstream) {
        diag.critical(msg::no_upstream(entry, outcome.branch, err));
        outcome.status = SyncStatus::NoUpstream;
        return outcome;
    }

    err.clear();
    auto upstream_bytes = upstream->name_bytes(&err);
    if (!upstream_bytes) {
        diag.error(msg::branch_name_error(entry, err));
        outcome.status = SyncStatus::NameUnresolvable;
        return outcome;
    }
    if (!is_valid_utf8(*upstream_bytes)) {
        diag.error(msg::branch_bad_name(entry, *upstream_bytes));
        outcome.status = SyncStatus::NameUnresolvable;
        return outcome;
    }
    outcome.upstream = *upstream_bytes;
    diag.detail(msg::upstream_name(entry, outcome.branch, outcome.upstream));

    const std::string refname = upstream->reference_name();
    err.clear();
    auto remote = repo.branch_remote_name(refname, &err);
    if (remote && remote->empty())
        err = "empty remote name";
    if (!remote || remote->empty()) {
        diag.error(msg::upstream_remote_error(entry, outcome.branch, refname, err));
        outcome.status = SyncStatus::NameUnresolvable;
        return outcome;
    }
    if (!is_valid_utf8(*remote)) {
        diag.error(msg::remote_bad_name(entry, *remote));
        outcome.status = SyncStatus::NameUnresolvable;
        return outcome;
    }
    outcome.remote = *remote;
    diag.detail(msg::upstream_remote_name(entry, outcome.branch, outcome.remote));

    if (!synced_remotes.count(outcome.remote)) {
        diag.error(msg::upstream_remote_not_synced(entry, outcome.branch, outcome.remote));
        outcome.status = SyncStatus::UpstreamRemoteNotSynced;
        return outcome;
    }

    err.clear();
    auto local_commit = branch.resolve(&err);
    if (!local_commit) {
        diag.error(msg::branch_operation_failed(entry, outcome.branch, err));
        return outcome;
    }
    auto upstream_commit = upstream->resolve(&err);
    if (!upstream_commit) {
        diag.error(msg::branch_operation_failed(entry, outcome.branch, err));
        return outcome;
    }

    SyncStatus status = classify_ancestry(repo, *local_commit, *upstream_commit);
    outcome.status = status;
    switch (status) {
    case SyncStatus::Synced:
        diag.info(msg::synced(entry, outcome.branch));
        break;
    case SyncStatus::AheadOfUpstream:
        diag.error(msg::ahead_of_upstream(entry, outcome.branch));
        break;
    default:
        diag.error(msg::diverged(entry, outcome.branch));
        break;
    }
    return outcome;
}

void audit_branches(git::Repository& repo, const std::set<std::string>& synced_remotes,
                    Diagnostics& diag, std::vector<BranchOutcome>& out) {
    for (const auto& branch : repo.local_branches())
        out.push_back(audit_branch(repo, *branch, synced_remotes, diag));
}
