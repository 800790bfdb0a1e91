#include <catch2/catch.hpp>
#include "watch_dispatch.hpp"
#include "test_support.hpp"

using namespace stackwatch;
using namespace stackwatch::testing;
namespace fs = std::filesystem;

namespace {

struct Counters {
    RecordingCallback on_event;
    RecordingCallback on_create;
    RecordingCallback on_delete;

    void attach(WatchTarget& target) const {
        target.on_event = on_event;
        target.on_create = on_create;
        target.on_delete = on_delete;
    }
};

} // namespace

TEST_CASE("is_within compares path components", "[dispatch]") {
    REQUIRE(is_within("/project/src/app.py", "/project/src"));
    REQUIRE(is_within("/project/src", "/project/src"));
    REQUIRE(is_within("/project/src/a/b", "/project/src/"));
    REQUIRE_FALSE(is_within("/project/srcs/app.py", "/project/src"));
    REQUIRE_FALSE(is_within("/project", "/project/src"));
}

TEST_CASE("Directory target delivery", "[dispatch]") {
    WatchTarget target = dir_target("/project/src");
    Counters counters;
    counters.attach(target);

    SECTION("events anywhere below the directory") {
        REQUIRE(deliver_event(target, make_event(FileEventType::Modified, "/project/src/app.py")));
        REQUIRE(deliver_event(target, make_event(FileEventType::Created, "/project/src/pkg/mod.py")));
        REQUIRE(deliver_event(target, make_event(FileEventType::Created, "/project/src/pkg", true)));
        REQUIRE(counters.on_event.count() == 3);
        REQUIRE(counters.on_create.count() == 0);
    }

    SECTION("events outside the directory") {
        REQUIRE_FALSE(deliver_event(target, make_event(FileEventType::Modified, "/project/template.yaml")));
        REQUIRE_FALSE(deliver_event(target, make_event(FileEventType::Modified, "/project/srcs/app.py")));
        REQUIRE(counters.on_event.count() == 0);
    }

    SECTION("creation and deletion of the directory itself") {
        REQUIRE(deliver_event(target, make_event(FileEventType::Deleted, "/project/src", true)));
        REQUIRE(counters.on_delete.count() == 1);

        REQUIRE(deliver_event(target, make_event(FileEventType::Created, "/project/src", true)));
        REQUIRE(counters.on_create.count() == 1);

        REQUIRE_FALSE(deliver_event(target, make_event(FileEventType::Modified, "/project/src", true)));
        REQUIRE(counters.on_event.count() == 0);
    }

    SECTION("rename out of the directory") {
        REQUIRE(deliver_event(target, make_event(FileEventType::Deleted, "/project/src/app.py")));
        REQUIRE_FALSE(deliver_event(target, make_event(FileEventType::Created, "/project/app.py")));
        REQUIRE(counters.on_event.count() == 1);
    }
}

TEST_CASE("Single file target delivery", "[dispatch]") {
    WatchTarget target = single_file_target("/project/template.yaml");
    RecordingCallback callback;
    target.on_event = callback;

    REQUIRE(deliver_event(target, make_event(FileEventType::Modified, "/project/template.yaml")));
    REQUIRE(deliver_event(target, make_event(FileEventType::Created, "/project/template.yaml")));

    REQUIRE_FALSE(deliver_event(target, make_event(FileEventType::Modified, "/project/template.yml")));
    REQUIRE_FALSE(deliver_event(target, make_event(FileEventType::Modified, "/project/sub/template.yaml")));
    REQUIRE_FALSE(deliver_event(target, make_event(FileEventType::Created, "/project/template.yaml", true)));

    // No on_create or on_delete for the parent directory itself.
    REQUIRE_FALSE(deliver_event(target, make_event(FileEventType::Deleted, "/project", true)));

    REQUIRE(callback.count() == 2);
}

TEST_CASE("Editor save via rename reaches the file target", "[dispatch]") {
    WatchTarget target = single_file_target("/project/template.yaml");
    RecordingCallback callback;
    target.on_event = callback;

    REQUIRE_FALSE(deliver_event(target, make_event(FileEventType::Deleted, "/project/.template.yaml.swp")));
    REQUIRE(deliver_event(target, make_event(FileEventType::Created, "/project/template.yaml")));
    REQUIRE(callback.count() == 1);
}

TEST_CASE("Targets without callbacks ignore events", "[dispatch]") {
    WatchTarget target = dir_target("/project/src");
    REQUIRE_FALSE(deliver_event(target, make_event(FileEventType::Modified, "/project/src/app.py")));
    REQUIRE_FALSE(deliver_event(target, make_event(FileEventType::Deleted, "/project/src", true)));
}
