#include "settings.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <filesystem>

namespace stackwatch {

using json = nlohmann::json;

std::optional<Settings> load_settings(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        return std::nullopt;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    try {
        json j;
        file >> j;

        if (!j.is_object()) {
            return std::nullopt;
        }

        Settings settings;
        settings.template_file = j.value("template_file", "");
        settings.exec = j.value("exec", "");
        settings.verbose = j.value("verbose", false);

        if (j.contains("resources") && j["resources"].is_array()) {
            for (const auto& resource : j["resources"]) {
                if (resource.is_string()) {
                    settings.resources.push_back(resource.get<std::string>());
                }
            }
        }

        return settings;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

bool save_settings(const Settings& settings, const std::string& path) {
    json j;
    j["template_file"] = settings.template_file;
    j["resources"] = settings.resources;
    j["exec"] = settings.exec;
    j["verbose"] = settings.verbose;

    std::ofstream file(path);
    if (!file.is_open()) {
        return false;
    }
    file << j.dump(2) << std::endl;
    return file.good();
}

} // namespace stackwatch
