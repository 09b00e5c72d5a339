#include "remote_qualifier.hpp"

#include <utility>

#include "text_utils.hpp"

bool remote_qualifies(const std::string& url, const std::vector<std::string>& prefixes) {
    for (const auto& prefix : prefixes) {
        if (!prefix.empty() && starts_with(url, prefix))
            return true;
    }
    return false;
}

std::vector<RemoteCandidate> collect_remotes(git::Repository& repo,
                                             const std::vector<std::string>& prefixes,
                                             Diagnostics& diag) {
    std::vector<RemoteCandidate> out;
    for (const auto& name : repo.remote_names()) {
        if (!is_valid_utf8(name)) {
            diag.error(msg::remote_bad_name(diag.entry(), name));
            continue;
        }
        std::string err;
        auto remote = repo.find_remote(name, &err);
        if (!remote) {
            diag.error(msg::remote_not_found(diag.entry(), name, err));
            continue;
        }
        auto url = remote->url();
        if (!url || !is_valid_utf8(*url)) {
            diag.error(msg::remote_bad_url(diag.entry(), name, remote->url_bytes()));
            continue;
        }
        RemoteCandidate candidate;
        candidate.descriptor.name = name;
        candidate.descriptor.url = *url;
        candidate.descriptor.qualifies = remote_qualifies(*url, prefixes);
        if (!candidate.descriptor.qualifies)
            diag.warning(msg::remote_unqualified(diag.entry(), name, *url));
        candidate.handle = std::move(remote);
        out.push_back(std::move(candidate));
    }
    return out;
}
