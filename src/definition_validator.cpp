#include "definition_validator.hpp"
#include "errors.hpp"
#include "template_loader.hpp"
#include "verbose.hpp"

namespace fs = std::filesystem;

namespace stackwatch {

DefinitionValidator::DefinitionValidator(fs::path path, bool detect_change, bool initialize_data)
    : path_(std::move(path))
    , detect_change_(detect_change)
{
    if (initialize_data) {
        validate();
    }
}

bool DefinitionValidator::validate() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::optional<nlohmann::json> old_data = data_;
    if (!validate_file()) {
        return false;
    }
    if (!detect_change_) {
        return true;
    }
    return old_data != data_;
}

bool DefinitionValidator::validate_file() {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        verbose_log("Validator", path_.string() + " does not exist");
        return false;
    }

    try {
        data_ = parse_template_file(path_.string());
    } catch (const TemplateLoadError& e) {
        verbose_err("Validator", e.what());
        return false;
    }
    return true;
}

} // namespace stackwatch
