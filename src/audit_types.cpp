#include "audit_types.hpp"

const char* to_string(SyncStatus status) {
    switch (status) {
    case SyncStatus::Synced:
        return "synced";
    case SyncStatus::AheadOfUpstream:
        return "ahead_of_upstream";
    case SyncStatus::Diverged:
        return "diverged";
    case SyncStatus::NoUpstream:
        return "no_upstream";
    case SyncStatus::UpstreamRemoteNotSynced:
        return "upstream_remote_not_synced";
    case SyncStatus::NameUnresolvable:
        return "name_unresolvable";
    }
    return "unknown";
}

const char* to_string(Severity severity) {
    switch (severity) {
    case Severity::Info:
        return "info";
    case Severity::Warning:
        return "warning";
    case Severity::Error:
        return "error";
    case Severity::Critical:
        return "critical";
    }
    return "unknown";
}

const char* to_string(EntryKind kind) {
    switch (kind) {
    case EntryKind::Unknown:
        return "unknown";
    case EntryKind::Symlink:
        return "symlink";
    case EntryKind::File:
        return "file";
    case EntryKind::NotRepository:
        return "not_repository";
    case EntryKind::Repository:
        return "repository";
    }
    return "unknown";
}
