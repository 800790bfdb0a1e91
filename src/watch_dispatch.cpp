#include "watch_dispatch.hpp"

namespace fs = std::filesystem;

namespace stackwatch {

bool is_within(const fs::path& path, const fs::path& base) {
    auto path_it = path.begin();
    for (auto base_it = base.begin(); base_it != base.end(); ++base_it, ++path_it) {
        if (base_it->empty()) {
            continue;  // Trailing separator.
        }
        if (path_it == path.end() || *path_it != *base_it) {
            return false;
        }
    }
    return true;
}

namespace {

bool in_scope(const WatchTarget& target, const std::string& path) {
    if (path.empty()) {
        return false;
    }
    fs::path p(path);
    if (target.recursive) {
        return p != target.path && is_within(p, target.path);
    }
    return p.parent_path() == target.path;
}

bool accepts(const WatchTarget& target, const std::string& path, bool is_directory) {
    return in_scope(target, path) && target.match_rule.matches(path, is_directory);
}

} // namespace

bool deliver_event(const WatchTarget& target, const FileEvent& event) {
    if (fs::path(event.src_path) == target.path) {
        if (event.type == FileEventType::Created && target.on_create) {
            target.on_create(event);
            return true;
        }
        if (event.type == FileEventType::Deleted && target.on_delete) {
            target.on_delete(event);
            return true;
        }
        return false;
    }

    if (!accepts(target, event.src_path, event.is_directory) || !target.on_event) {
        return false;
    }

    target.on_event(event);
    return true;
}

} // namespace stackwatch
