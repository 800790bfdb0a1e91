#pragma once

// Shared fixtures for the stackwatch tests.

#include "definition_validator.hpp"
#include "stack.hpp"
#include "watch_target.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace stackwatch::testing {

namespace fs = std::filesystem;

// Temporary directory removed at scope exit.
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        std::random_device rd;
        path_ = fs::temp_directory_path() /
                ("stackwatch_test_" + std::to_string(rd()) + "_" + std::to_string(counter++));
        fs::create_directories(path_);
        path_ = fs::canonical(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }

    // Writes a file relative to the directory, creating parents.
    fs::path write(const std::string& relative, const std::string& content) const {
        fs::path file = path_ / relative;
        fs::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::trunc);
        out << content;
        return file;
    }

private:
    fs::path path_;
};

// Callback that records every invocation. Copies share the record.
struct RecordingCallback {
    struct Record {
        std::vector<std::optional<FileEvent>> events;
        std::vector<const std::optional<FileEvent>*> addresses;
    };

    std::shared_ptr<Record> record = std::make_shared<Record>();

    void operator()(const std::optional<FileEvent>& event) const {
        record->events.push_back(event);
        record->addresses.push_back(&event);
    }

    size_t count() const { return record->events.size(); }
};

// Validator returning a fixed answer.
class StubValidator : public IDefinitionValidator {
public:
    explicit StubValidator(bool result) : result(result) {}

    bool validate() override {
        ++calls;
        return result;
    }

    bool result;
    int calls = 0;
};

// Builds an in-memory stack from a Resources object.
inline Stack make_stack(
    const nlohmann::json& resources,
    const std::string& name = "",
    const std::string& parent_stack_path = "",
    const std::string& location = ""
) {
    Stack stack;
    stack.name = name;
    stack.parent_stack_path = parent_stack_path;
    stack.location = location;
    stack.template_dict = {{"Resources", resources}};
    return stack;
}

inline FileEvent make_event(FileEventType type, const std::string& path, bool is_directory = false) {
    FileEvent event;
    event.type = type;
    event.src_path = path;
    event.is_directory = is_directory;
    return event;
}

} // namespace stackwatch::testing
