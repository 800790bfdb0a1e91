#include "watch_target.hpp"
#include <system_error>

namespace fs = std::filesystem;

namespace stackwatch {

std::string to_string(FileEventType type) {
    switch (type) {
        case FileEventType::Created:
            return "created";
        case FileEventType::Deleted:
            return "deleted";
        case FileEventType::Modified:
            return "modified";
        default:
            return "unknown";
    }
}

MatchRule::MatchRule(Kind kind, std::string pattern)
    : kind_(kind)
    , pattern_(std::move(pattern))
{
    if (kind_ == Kind::ExactFile) {
        regex_ = std::regex(pattern_, std::regex::ECMAScript);
    }
}

MatchRule MatchRule::exact_file(const fs::path& file_path) {
    return MatchRule(Kind::ExactFile, "^" + escape_regex(file_path.string()) + "$");
}

MatchRule MatchRule::any_in_tree() {
    return MatchRule(Kind::AnyInTree, "*");
}

bool MatchRule::matches(const std::string& path, bool is_directory) const {
    if (kind_ == Kind::AnyInTree) {
        return true;
    }
    if (is_directory) {
        return false;
    }
    return std::regex_match(path, regex_);
}

fs::path resolve_path(const std::string& path) {
    fs::path absolute = fs::absolute(fs::path(path));

    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(absolute, ec);
    if (ec) {
        resolved = absolute.lexically_normal();
    }

    // "src/" normalizes to "/cwd/src/"; drop the empty trailing component.
    if (!resolved.has_filename() && resolved != resolved.root_path()) {
        resolved = resolved.parent_path();
    }
    return resolved;
}

std::string escape_regex(const std::string& text) {
    static const std::string SPECIAL = "\\^$.|?*+()[]{}";

    std::string escaped;
    escaped.reserve(text.size() * 2);
    for (char c : text) {
        if (SPECIAL.find(c) != std::string::npos) {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

WatchTarget single_file_target(const std::string& file_path) {
    fs::path resolved = resolve_path(file_path);

    WatchTarget target;
    target.path = resolved.parent_path();
    target.recursive = false;
    target.static_folder = false;
    target.match_rule = MatchRule::exact_file(resolved);
    return target;
}

WatchTarget dir_target(const std::string& dir_path) {
    WatchTarget target;
    target.path = resolve_path(dir_path);
    target.recursive = true;
    target.static_folder = true;
    target.match_rule = MatchRule::any_in_tree();
    return target;
}

} // namespace stackwatch
