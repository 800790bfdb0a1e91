#pragma once

/**
 * Settings persistence for the stackwatch CLI.
 *
 * Handles loading and saving of project settings to a local JSON file, so
 * a project can fix its template and watched resources once.
 */

#include <string>
#include <vector>
#include <optional>

namespace stackwatch {

/**
 * Project settings stored in .stackwatch.json.
 */
struct Settings {
    std::string template_file;            // Root template to load.
    std::vector<std::string> resources;   // Resource identifiers to watch, empty for all.
    std::string exec;                     // Shell command run after each change.
    bool verbose = false;
};

// Loads settings from the given file. Returns empty optional if it is missing or malformed.
std::optional<Settings> load_settings(const std::string& path);

// Saves settings to the given file. Returns false if it cannot be written.
bool save_settings(const Settings& settings, const std::string& path);

} // namespace stackwatch
