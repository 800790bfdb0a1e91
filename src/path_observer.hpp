#pragma once

/**
 * Linux inotify-based observer for watch targets.
 *
 * Subscribes to the directories named by registered watch targets and routes
 * every kernel event to the targets it belongs to. The process blocks on a
 * file descriptor until the kernel reports changes; no polling is involved.
 */

#include "watch_target.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace stackwatch {

/**
 * Observer that owns the kernel watches and the event delivery thread.
 *
 * Features:
 * - Recursive subscription for recursive targets, including directories
 *   created later
 * - Parent directory subscription so a target's own creation and deletion
 *   are seen
 * - Shared subscriptions for directories covered by several targets
 *
 * Callbacks run on the delivery thread. Exceptions they throw are logged.
 */
class PathObserver {
public:
    PathObserver();
    ~PathObserver();

    // Non-copyable
    PathObserver(const PathObserver&) = delete;
    PathObserver& operator=(const PathObserver&) = delete;

    /**
     * Registers a target and subscribes to its directories.
     * A missing target path is watched through its nearest existing ancestor.
     */
    void schedule(const WatchTarget& target);
    void schedule(const std::vector<WatchTarget>& targets);

    /**
     * Drops every target and kernel watch.
     */
    void unschedule_all();

    /**
     * Starts delivering events in a background thread.
     * Does nothing if already running.
     */
    void start();

    /**
     * Stops delivering events.
     * Blocks until the background thread has stopped.
     */
    void stop();

    bool is_running() const { return running_.load(); }

    /**
     * Routes one event to every registered target.
     * Returns the number of targets that handled it.
     */
    size_t dispatch(const FileEvent& event);

    size_t target_count() const;
    size_t watch_count() const;

private:
    void watch_loop();

    // Translates one kernel event and dispatches it.
    void handle_kernel_event(int wd, uint32_t mask, const std::string& name);

    // Watches directories that appear inside or above registered targets.
    void handle_new_directory(const std::string& path);

    void subscribe(const WatchTarget& target);

    // Add watch for a single directory (non-recursive)
    bool add_single_watch(const std::string& path);

    // Recursively add watches for all subdirectories
    void add_watches_recursive(const std::string& path);

    // Watches the closest existing ancestor of a missing path.
    void add_ancestor_watch(const std::string& path);

    // Drops the watches on a directory and everything below it.
    void remove_watches_below(const std::string& path);

    std::vector<WatchTarget> snapshot_targets() const;

    int inotify_fd_{-1};
    int pipe_fd_[2]{-1, -1};  // For signaling shutdown

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::thread watch_thread_;

    // Map from watch descriptor to directory path
    std::unordered_map<int, std::string> wd_to_path_;
    // Set of watched paths to avoid duplicates
    std::unordered_set<std::string> watched_paths_;
    mutable std::mutex watch_mutex_;

    std::vector<WatchTarget> targets_;
    mutable std::mutex targets_mutex_;
};

} // namespace stackwatch
