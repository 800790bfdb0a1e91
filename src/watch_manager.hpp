#pragma once

/**
 * Watch manager for a template and its resources.
 *
 * Loads the stacks, builds a trigger per watched resource plus one per
 * template file, and schedules their targets on a PathObserver. A validated
 * template change discards every trigger and rebuilds from a fresh load.
 */

#include "path_observer.hpp"
#include "stack.hpp"
#include "watch_target.hpp"
#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace stackwatch {

/**
 * Callback invoked when a watched resource or template changes.
 *
 * @param name Resource identifier, or template path for template changes
 * @param event The filesystem event behind the change
 */
using ChangeCallback = std::function<void(const std::string& name, const std::optional<FileEvent>& event)>;

/**
 * What to watch.
 */
struct WatchOptions {
    std::string template_file;
    std::vector<std::string> resources;  // Empty watches every supported resource.
};

class WatchManager {
public:
    WatchManager(WatchOptions options, ChangeCallback on_change);

    ~WatchManager();

    WatchManager(const WatchManager&) = delete;
    WatchManager& operator=(const WatchManager&) = delete;

    /**
     * Loads the stacks and rebuilds all targets without scheduling them.
     * Throws TemplateLoadError if the template cannot be loaded. Resources
     * that cannot be watched are logged and skipped.
     */
    void rebuild();

    /**
     * Builds the targets, schedules them and starts the observer.
     */
    void start();

    /**
     * Stops the observer.
     */
    void stop();

    /**
     * Applies a pending template change. Call from the thread that owns
     * the manager; never from a change callback.
     * Returns true if the targets were rebuilt.
     */
    bool poll();

    bool is_running() const { return observer_.is_running(); }

    std::vector<WatchTarget> targets() const;

    // Resources that resolved to targets in the last rebuild.
    std::vector<std::string> watched_resources() const;

    // Resources skipped in the last rebuild, with the reason.
    std::vector<std::string> skipped_resources() const;

private:
    void schedule_all();

    WatchOptions options_;
    ChangeCallback on_change_;
    PathObserver observer_;

    std::vector<WatchTarget> targets_;
    std::vector<std::string> watched_;
    std::vector<std::string> skipped_;
    mutable std::mutex state_mutex_;

    std::atomic<bool> template_changed_{false};
};

} // namespace stackwatch
