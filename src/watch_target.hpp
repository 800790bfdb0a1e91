#pragma once

/**
 * Watch targets produced by resource triggers.
 *
 * A watch target tells the observer which directory to subscribe to, how
 * deep, and which of the events seen there belong to the resource.
 */

#include <filesystem>
#include <functional>
#include <optional>
#include <regex>
#include <string>

namespace stackwatch {

/**
 * Kind of filesystem change reported by the observer.
 * A rename is reported as Deleted at the old path and Created at the new one.
 */
enum class FileEventType {
    Created,
    Deleted,
    Modified
};

/**
 * A single filesystem change.
 */
struct FileEvent {
    FileEventType type = FileEventType::Modified;
    std::string src_path;
    bool is_directory = false;
};

// Returns a short lowercase name for the event type ("created", "modified", ...).
std::string to_string(FileEventType type);

/**
 * Callback invoked for a change. The event is absent when the caller
 * triggers a change manually.
 */
using OnChangeCallback = std::function<void(const std::optional<FileEvent>&)>;

/**
 * Event filtering rule of a watch target.
 */
class MatchRule {
public:
    enum class Kind {
        ExactFile,  // Only the one file, directories excluded.
        AnyInTree   // Every entry, directories included.
    };

    // Rule matching exactly the given absolute file path.
    static MatchRule exact_file(const std::filesystem::path& file_path);

    // Rule matching any path.
    static MatchRule any_in_tree();

    Kind kind() const { return kind_; }

    // The pattern source: an anchored regex for ExactFile, "*" for AnyInTree.
    const std::string& pattern() const { return pattern_; }

    bool ignores_directories() const { return kind_ == Kind::ExactFile; }

    // Returns true if an event on the given path passes this rule.
    bool matches(const std::string& path, bool is_directory = false) const;

private:
    MatchRule(Kind kind, std::string pattern);

    Kind kind_;
    std::string pattern_;
    std::regex regex_;
};

/**
 * One thing for the observer to watch.
 */
struct WatchTarget {
    std::filesystem::path path;  // Directory subscribed to.
    bool recursive = false;
    bool static_folder = false;  // Whole subtree is one logical unit.
    MatchRule match_rule = MatchRule::any_in_tree();

    OnChangeCallback on_event;
    OnChangeCallback on_create;  // Empty when the target path itself is not tracked.
    OnChangeCallback on_delete;
};

// Resolves a path string to an absolute, normalized path without a trailing separator.
std::filesystem::path resolve_path(const std::string& path);

// Escapes every ECMAScript regex metacharacter in text.
std::string escape_regex(const std::string& text);

/**
 * Builds a target for a single file.
 *
 * The containing directory is watched non-recursively so creates and renames
 * of the file are seen even before it exists. Only on_event is left unset.
 */
WatchTarget single_file_target(const std::string& file_path);

/**
 * Builds a recursive, static-folder target for a directory tree.
 */
WatchTarget dir_target(const std::string& dir_path);

} // namespace stackwatch
