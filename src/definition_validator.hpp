#pragma once

/**
 * Structural change detection for template and definition files.
 *
 * A rewrite of a watched file only counts as a change when the file still
 * parses and its parsed content differs from the last valid version. Edits
 * to whitespace, comments or key order are ignored.
 */

#include <nlohmann/json.hpp>
#include <filesystem>
#include <mutex>
#include <optional>

namespace stackwatch {

/**
 * Interface for deciding whether a file change is meaningful.
 */
class IDefinitionValidator {
public:
    virtual ~IDefinitionValidator() = default;

    /**
     * Returns true if the file is valid and, when change detection is on,
     * differs from the previously validated content.
     * May read the file; safe to call from any thread.
     */
    virtual bool validate() = 0;
};

/**
 * Validator backed by a YAML/JSON file on disk.
 */
class DefinitionValidator : public IDefinitionValidator {
public:
    /**
     * @param path File to validate
     * @param detect_change Only report true when the parsed content changed
     * @param initialize_data Record the current content as the baseline
     */
    explicit DefinitionValidator(
        std::filesystem::path path,
        bool detect_change = true,
        bool initialize_data = true
    );

    bool validate() override;

    const std::filesystem::path& path() const { return path_; }

private:
    // Parses the file into data_. Returns false if missing or malformed.
    bool validate_file();

    std::filesystem::path path_;
    bool detect_change_;
    std::optional<nlohmann::json> data_;
    std::mutex mutex_;
};

} // namespace stackwatch
