#include "remote_syncer.hpp"

#include "logger.hpp"

git::Credential select_credential(const git::CredentialChallenge& challenge,
                                  const AuditConfig& cfg) {
    git::Credential cred;
    cred.username = challenge.username_from_url.value_or(cfg.default_username);
    if (challenge.username_only) {
        cred.kind = git::Credential::Kind::UsernameOnly;
    } else {
        cred.kind = git::Credential::Kind::SshPrivateKey;
        cred.private_key = cfg.ssh_private_key;
    }
    return cred;
}

std::vector<FetchOutcome> sync_remotes(std::vector<RemoteCandidate>& remotes,
                                       const AuditConfig& cfg, Diagnostics& diag) {
    git::CredentialProvider provider = [&cfg](const git::CredentialChallenge& challenge) {
        return select_credential(challenge, cfg);
    };
    std::vector<FetchOutcome> out;
    for (auto& candidate : remotes) {
        if (!candidate.descriptor.qualifies)
            continue;
        FetchOutcome outcome;
        outcome.remote = candidate.descriptor.name;
        if (logger_initialized())
            log_debug("Fetching remote", {{"entry", diag.entry().string()},
                                          {"remote", outcome.remote},
                                          {"url", candidate.descriptor.url}});
        std::string err;
        outcome.fetched = candidate.handle->fetch(provider, &err);
        if (outcome.fetched) {
            diag.detail(msg::remote_fetched(diag.entry(), outcome.remote));
        } else {
            outcome.reason = err;
            diag.error(msg::remote_fetch_failed(diag.entry(), outcome.remote, err));
        }
        out.push_back(std::move(outcome));
    }
    return out;
}

std::set<std::string> synced_remote_names(const std::vector<FetchOutcome>& outcomes) {
    std::set<std::string> out;
    for (const auto& o : outcomes) {
        if (o.fetched)
            out.insert(o.remote);
    }
    return out;
}
