#include "path_observer.hpp"
#include "watch_dispatch.hpp"
#include "verbose.hpp"
#include <sys/inotify.h>
#include <sys/select.h>
#include <unistd.h>
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <cstring>
#include <cerrno>

namespace fs = std::filesystem;

namespace stackwatch {

// Events we care about. IN_MODIFY is left out so a save is reported once, on close.
static constexpr uint32_t WATCH_EVENTS =
    IN_CREATE | IN_DELETE | IN_CLOSE_WRITE | IN_MOVED_FROM | IN_MOVED_TO | IN_DELETE_SELF;

PathObserver::PathObserver() {
    inotify_fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd_ < 0) {
        std::cerr << "[PathObserver] Failed to initialize inotify: "
                  << strerror(errno) << std::endl;
    }

    // Create pipe for signaling shutdown
    if (pipe(pipe_fd_) < 0) {
        std::cerr << "[PathObserver] Failed to create pipe: "
                  << strerror(errno) << std::endl;
    }
}

PathObserver::~PathObserver() {
    stop();

    if (inotify_fd_ >= 0) {
        close(inotify_fd_);
    }
    if (pipe_fd_[0] >= 0) {
        close(pipe_fd_[0]);
    }
    if (pipe_fd_[1] >= 0) {
        close(pipe_fd_[1]);
    }
}

void PathObserver::schedule(const WatchTarget& target) {
    subscribe(target);

    std::lock_guard<std::mutex> lock(targets_mutex_);
    targets_.push_back(target);
}

void PathObserver::schedule(const std::vector<WatchTarget>& targets) {
    for (const auto& target : targets) {
        schedule(target);
    }
}

void PathObserver::unschedule_all() {
    {
        std::lock_guard<std::mutex> lock(targets_mutex_);
        targets_.clear();
    }

    std::lock_guard<std::mutex> lock(watch_mutex_);
    for (const auto& [wd, path] : wd_to_path_) {
        inotify_rm_watch(inotify_fd_, wd);
    }
    wd_to_path_.clear();
    watched_paths_.clear();
}

void PathObserver::subscribe(const WatchTarget& target) {
    const std::string path = target.path.string();

    if (target.static_folder) {
        auto targets = snapshot_targets();
        bool covered = std::any_of(targets.begin(), targets.end(), [&target](const WatchTarget& other) {
            return other.static_folder && other.recursive && is_within(target.path, other.path);
        });
        if (covered) {
            verbose_log("PathObserver", "Sharing existing watches for " + path);
            return;
        }
    }

    std::error_code ec;
    if (fs::is_directory(target.path, ec)) {
        if (target.recursive) {
            add_watches_recursive(path);
        } else {
            add_single_watch(path);
        }
    } else {
        add_ancestor_watch(path);
    }

    if (target.on_create || target.on_delete) {
        std::string parent = target.path.parent_path().string();
        if (fs::is_directory(parent, ec)) {
            add_single_watch(parent);
        } else {
            add_ancestor_watch(parent);
        }
    }
}

bool PathObserver::add_single_watch(const std::string& path) {
    if (inotify_fd_ < 0) {
        return false;
    }

    std::lock_guard<std::mutex> lock(watch_mutex_);

    // Check if already watching
    if (watched_paths_.count(path) > 0) {
        return true;
    }

    int wd = inotify_add_watch(inotify_fd_, path.c_str(), WATCH_EVENTS);
    if (wd < 0) {
        if (errno != ENOENT && errno != EACCES) {
            std::cerr << "[PathObserver] Failed to watch " << path << ": "
                      << strerror(errno) << std::endl;
        }
        return false;
    }

    wd_to_path_[wd] = path;
    watched_paths_.insert(path);
    verbose_log("PathObserver", "Watching " + path);
    return true;
}

void PathObserver::add_watches_recursive(const std::string& path) {
    try {
        add_single_watch(path);

        for (const auto& entry : fs::recursive_directory_iterator(
                path, fs::directory_options::skip_permission_denied)) {
            if (entry.is_directory()) {
                add_single_watch(entry.path().string());
            }
        }
    } catch (const fs::filesystem_error& e) {
        verbose_err("PathObserver", e.what());
    }
}

void PathObserver::add_ancestor_watch(const std::string& path) {
    std::error_code ec;
    fs::path ancestor = fs::path(path).parent_path();
    while (!ancestor.empty() && !fs::is_directory(ancestor, ec)) {
        if (ancestor == ancestor.root_path()) {
            return;
        }
        ancestor = ancestor.parent_path();
    }
    if (!ancestor.empty()) {
        add_single_watch(ancestor.string());
    }
}

void PathObserver::remove_watches_below(const std::string& path) {
    std::lock_guard<std::mutex> lock(watch_mutex_);
    for (auto it = wd_to_path_.begin(); it != wd_to_path_.end();) {
        if (is_within(it->second, path)) {
            inotify_rm_watch(inotify_fd_, it->first);
            watched_paths_.erase(it->second);
            verbose_log("PathObserver", "Unwatching " + it->second);
            it = wd_to_path_.erase(it);
        } else {
            ++it;
        }
    }
}

std::vector<WatchTarget> PathObserver::snapshot_targets() const {
    std::lock_guard<std::mutex> lock(targets_mutex_);
    return targets_;
}

size_t PathObserver::target_count() const {
    std::lock_guard<std::mutex> lock(targets_mutex_);
    return targets_.size();
}

size_t PathObserver::watch_count() const {
    std::lock_guard<std::mutex> lock(watch_mutex_);
    return watched_paths_.size();
}

size_t PathObserver::dispatch(const FileEvent& event) {
    verbose_event("PathObserver", to_string(event.type) + " " + event.src_path);

    size_t handled = 0;
    for (const auto& target : snapshot_targets()) {
        try {
            if (deliver_event(target, event)) {
                ++handled;
            }
        } catch (const std::exception& e) {
            std::cerr << "[PathObserver] Callback error: " << e.what() << std::endl;
        }
    }
    return handled;
}

void PathObserver::handle_new_directory(const std::string& path) {
    fs::path dir(path);
    for (const auto& target : snapshot_targets()) {
        if (target.recursive && is_within(dir, target.path)) {
            add_watches_recursive(path);
            return;
        }
    }
    for (const auto& target : snapshot_targets()) {
        if (is_within(target.path, dir)) {
            // An ancestor of a missing target appeared; follow it down.
            if (target.recursive && target.path == dir) {
                add_watches_recursive(path);
            } else {
                add_single_watch(path);
            }
            return;
        }
    }
}

void PathObserver::handle_kernel_event(int wd, uint32_t mask, const std::string& name) {
    std::string dir;
    {
        std::lock_guard<std::mutex> lock(watch_mutex_);
        auto it = wd_to_path_.find(wd);
        if (it == wd_to_path_.end()) {
            return;
        }
        dir = it->second;

        // Handle directory deletion - remove from our tracking
        if ((mask & IN_DELETE_SELF) || (mask & IN_IGNORED)) {
            watched_paths_.erase(it->second);
            wd_to_path_.erase(it);
            return;
        }
    }

    FileEvent event;
    event.src_path = name.empty() ? dir : dir + "/" + name;
    event.is_directory = (mask & IN_ISDIR) != 0;

    if (mask & (IN_CREATE | IN_MOVED_TO)) {
        event.type = FileEventType::Created;
        if (event.is_directory) {
            handle_new_directory(event.src_path);
        }
    } else if (mask & (IN_DELETE | IN_MOVED_FROM)) {
        event.type = FileEventType::Deleted;
        // A directory moved elsewhere keeps its watches under the old path.
        if ((mask & IN_MOVED_FROM) && event.is_directory) {
            remove_watches_below(event.src_path);
        }
    } else if (mask & IN_CLOSE_WRITE) {
        event.type = FileEventType::Modified;
    } else {
        return;
    }

    dispatch(event);
}

void PathObserver::start() {
    if (running_.load() || inotify_fd_ < 0) {
        return;
    }

    stop_requested_.store(false);
    running_.store(true);

    watch_thread_ = std::thread([this]() {
        watch_loop();
    });
    std::cerr << "[PathObserver] Started (" << target_count() << " targets, "
              << watch_count() << " directories)" << std::endl;
}

void PathObserver::stop() {
    if (!running_.load()) {
        return;
    }

    stop_requested_.store(true);

    // Write to pipe to wake up select()
    if (pipe_fd_[1] >= 0) {
        char c = 'x';
        ssize_t written = write(pipe_fd_[1], &c, 1);
        (void)written;  // Wake-up only
    }

    if (watch_thread_.joinable()) {
        watch_thread_.join();
    }

    running_.store(false);
}

void PathObserver::watch_loop() {
    constexpr size_t EVENT_BUF_SIZE = 4096;
    alignas(struct inotify_event) char buffer[EVENT_BUF_SIZE];

    while (!stop_requested_.load()) {
        fd_set read_fds;
        FD_ZERO(&read_fds);
        FD_SET(inotify_fd_, &read_fds);
        FD_SET(pipe_fd_[0], &read_fds);

        int max_fd = std::max(inotify_fd_, pipe_fd_[0]);

        int result = select(max_fd + 1, &read_fds, nullptr, nullptr, nullptr);

        if (stop_requested_.load()) {
            break;
        }

        if (result < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::cerr << "[PathObserver] select() error: " << strerror(errno) << std::endl;
            break;
        }

        // Check for shutdown signal
        if (FD_ISSET(pipe_fd_[0], &read_fds)) {
            char c;
            ssize_t drained = read(pipe_fd_[0], &c, 1);
            (void)drained;
            break;
        }

        if (!FD_ISSET(inotify_fd_, &read_fds)) {
            continue;
        }

        ssize_t len = read(inotify_fd_, buffer, EVENT_BUF_SIZE);
        if (len < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            std::cerr << "[PathObserver] read() error: " << strerror(errno) << std::endl;
            break;
        }

        const char* ptr = buffer;
        while (ptr < buffer + len) {
            const struct inotify_event* event =
                reinterpret_cast<const struct inotify_event*>(ptr);

            std::string name = event->len > 0 ? std::string(event->name) : std::string();
            handle_kernel_event(event->wd, event->mask, name);

            ptr += sizeof(struct inotify_event) + event->len;
        }
    }
}

} // namespace stackwatch
