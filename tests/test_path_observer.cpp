#include <catch2/catch.hpp>
#include "path_observer.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace stackwatch;
using namespace stackwatch::testing;
namespace fs = std::filesystem;

namespace {

// Thread-safe event counter for callbacks run by the observer thread.
struct CountingCallback {
    std::shared_ptr<std::atomic<int>> count = std::make_shared<std::atomic<int>>(0);

    void operator()(const std::optional<FileEvent>&) const { ++*count; }
};

bool wait_for(const std::atomic<int>& value, int expected) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
        if (value.load() >= expected) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
}

// Thread-safe recorder of the paths of delivered events.
struct PathRecorder {
    struct Record {
        std::mutex mutex;
        std::vector<std::string> paths;
    };

    std::shared_ptr<Record> record = std::make_shared<Record>();

    void operator()(const std::optional<FileEvent>& event) const {
        std::lock_guard<std::mutex> lock(record->mutex);
        record->paths.push_back(event ? event->src_path : std::string());
    }

    std::vector<std::string> paths() const {
        std::lock_guard<std::mutex> lock(record->mutex);
        return record->paths;
    }

    bool wait_for_path(const std::string& path) const {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (std::chrono::steady_clock::now() < deadline) {
            auto seen = paths();
            if (std::find(seen.begin(), seen.end(), path) != seen.end()) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return false;
    }
};

} // namespace

TEST_CASE("PathObserver dispatches to every matching target", "[observer]") {
    PathObserver observer;
    RecordingCallback code_callback;
    RecordingCallback template_callback;

    WatchTarget code = dir_target("/project/src");
    code.on_event = code_callback;
    WatchTarget file = single_file_target("/project/src/template.yaml");
    file.on_event = template_callback;

    observer.schedule(std::vector<WatchTarget>{code, file});
    REQUIRE(observer.target_count() == 2);

    REQUIRE(observer.dispatch(make_event(FileEventType::Modified, "/project/src/template.yaml")) == 2);
    REQUIRE(observer.dispatch(make_event(FileEventType::Modified, "/project/src/app.py")) == 1);
    REQUIRE(observer.dispatch(make_event(FileEventType::Modified, "/elsewhere/app.py")) == 0);

    REQUIRE(code_callback.count() == 2);
    REQUIRE(template_callback.count() == 1);

    observer.unschedule_all();
    REQUIRE(observer.target_count() == 0);
    REQUIRE(observer.watch_count() == 0);
}

TEST_CASE("PathObserver logs callback errors and keeps dispatching", "[observer]") {
    PathObserver observer;
    RecordingCallback callback;

    WatchTarget failing = dir_target("/project/src");
    failing.on_event = [](const std::optional<FileEvent>&) {
        throw std::runtime_error("build failed");
    };
    WatchTarget healthy = dir_target("/project/src");
    healthy.on_event = callback;

    observer.schedule(failing);
    observer.schedule(healthy);

    REQUIRE(observer.dispatch(make_event(FileEventType::Modified, "/project/src/app.py")) == 1);
    REQUIRE(callback.count() == 1);
}

TEST_CASE("PathObserver shares watches of nested static folders", "[observer]") {
    TempDir dir;
    fs::create_directories(dir.path() / "src" / "pkg");

    PathObserver observer;
    observer.schedule(dir_target(dir.path().string()));
    size_t watches = observer.watch_count();
    REQUIRE(watches == 3);

    observer.schedule(dir_target((dir.path() / "src").string()));
    REQUIRE(observer.watch_count() == watches);
    REQUIRE(observer.target_count() == 2);
}

TEST_CASE("PathObserver watches the ancestor of a missing path", "[observer]") {
    TempDir dir;
    PathObserver observer;

    WatchTarget target = dir_target((dir.path() / "later" / "src").string());
    target.on_create = RecordingCallback();
    observer.schedule(target);

    REQUIRE(observer.watch_count() == 1);
}

TEST_CASE("PathObserver reports file changes from the kernel", "[observer][inotify]") {
    TempDir dir;
    fs::create_directories(dir.path() / "src");

    CountingCallback changes;
    WatchTarget target = dir_target((dir.path() / "src").string());
    target.on_event = changes;

    PathObserver observer;
    observer.schedule(target);
    observer.start();
    REQUIRE(observer.is_running());

    dir.write("src/app.py", "print('hello')\n");
    REQUIRE(wait_for(*changes.count, 1));

    observer.stop();
    REQUIRE_FALSE(observer.is_running());
}

TEST_CASE("PathObserver reports a code directory created later", "[observer][inotify]") {
    TempDir dir;

    CountingCallback created;
    CountingCallback changes;
    WatchTarget target = dir_target((dir.path() / "src").string());
    target.on_create = created;
    target.on_event = changes;

    PathObserver observer;
    observer.schedule(target);
    observer.start();

    fs::create_directory(dir.path() / "src");
    REQUIRE(wait_for(*created.count, 1));

    // The new directory is watched once it exists.
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (observer.watch_count() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    dir.write("src/app.py", "x = 1\n");
    REQUIRE(wait_for(*changes.count, 1));

    observer.stop();
}

TEST_CASE("PathObserver re-watches a deleted and recreated code directory", "[observer][inotify]") {
    TempDir dir;
    fs::create_directories(dir.path() / "src");
    dir.write("src/app.py", "x = 1\n");

    CountingCallback created;
    CountingCallback deleted;
    PathRecorder changes;
    WatchTarget target = dir_target((dir.path() / "src").string());
    target.on_create = created;
    target.on_delete = deleted;
    target.on_event = changes;

    PathObserver observer;
    observer.schedule(target);
    observer.start();

    fs::remove_all(dir.path() / "src");
    REQUIRE(wait_for(*deleted.count, 1));

    fs::create_directory(dir.path() / "src");
    REQUIRE(wait_for(*created.count, 1));

    std::string edited = dir.write("src/main.py", "x = 2\n").string();
    REQUIRE(changes.wait_for_path(edited));

    observer.stop();
}

TEST_CASE("PathObserver stops reporting a directory moved out of the tree", "[observer][inotify]") {
    TempDir dir;
    fs::create_directories(dir.path() / "src" / "pkg");

    PathRecorder changes;
    WatchTarget target = dir_target((dir.path() / "src").string());
    target.on_event = changes;

    PathObserver observer;
    observer.schedule(target);
    REQUIRE(observer.watch_count() == 2);
    observer.start();

    fs::rename(dir.path() / "src" / "pkg", dir.path() / "outside");
    REQUIRE(changes.wait_for_path((dir.path() / "src" / "pkg").string()));
    REQUIRE(observer.watch_count() == 1);

    dir.write("outside/unrelated.py", "y = 1\n");
    std::string marker = dir.write("src/after.py", "z = 1\n").string();
    REQUIRE(changes.wait_for_path(marker));

    // Events are queued in order, so anything from the moved directory has arrived by now.
    for (const auto& path : changes.paths()) {
        REQUIRE(path.find("unrelated.py") == std::string::npos);
    }

    observer.stop();
}
