#include "resource_provider.hpp"
#include "config.hpp"
#include <filesystem>

namespace fs = std::filesystem;

namespace stackwatch {

using json = nlohmann::json;

namespace {

const json& properties_of(const json& resource) {
    static const json EMPTY = json::object();
    auto it = resource.find(PROPERTIES_KEY);
    if (it != resource.end() && it->is_object()) {
        return *it;
    }
    return EMPTY;
}

std::optional<std::string> string_property(const json& properties, const char* key) {
    auto it = properties.find(key);
    if (it != properties.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return std::nullopt;
}

// Code location of a zip function. Inline code has none; an S3 location or
// a missing property falls back to the template directory.
std::optional<std::string> extract_function_codeuri(const std::string& type, const json& properties) {
    if (type == AWS_SERVERLESS_FUNCTION) {
        if (properties.contains(INLINE_CODE_PROPERTY)) {
            return std::nullopt;
        }
        auto it = properties.find(CODE_URI_PROPERTY);
        if (it == properties.end() || it->is_object()) {
            return std::string(DEFAULT_CODE_URI);
        }
        if (it->is_string()) {
            return it->get<std::string>();
        }
        return std::nullopt;
    }

    auto it = properties.find(CODE_PROPERTY);
    if (it == properties.end()) {
        return std::string(DEFAULT_CODE_URI);
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_object() && !it->contains(ZIP_FILE_PROPERTY)) {
        return std::string(DEFAULT_CODE_URI);
    }
    return std::nullopt;
}

} // namespace

bool is_function_type(const std::string& type) {
    return type == AWS_SERVERLESS_FUNCTION || type == AWS_LAMBDA_FUNCTION;
}

bool is_layer_type(const std::string& type) {
    return type == AWS_SERVERLESS_LAYERVERSION || type == AWS_LAMBDA_LAYERVERSION;
}

std::string resource_type(const json& resource) {
    if (resource.is_object()) {
        auto it = resource.find(TYPE_KEY);
        if (it != resource.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return "";
}

std::string normalize_resource_path(const std::string& stack_location, const std::string& path) {
    if (stack_location.empty() || path.empty()) {
        return path;
    }
    fs::path p(path);
    if (p.is_absolute()) {
        return path;
    }
    fs::path base = fs::path(stack_location).parent_path();
    if (base.empty()) {
        return path;
    }
    return (base / p).lexically_normal().string();
}

FunctionProvider::FunctionProvider(const std::vector<Stack>& stacks) {
    for (const auto& stack : stacks) {
        for (const auto& [logical_id, resource] : stack.resources().items()) {
            std::string type = resource_type(resource);
            if (!is_function_type(type)) {
                continue;
            }

            const json& properties = properties_of(resource);

            Function function;
            function.name = logical_id;
            function.function_id = get_resource_id(resource, logical_id);
            function.function_name = string_property(properties, FUNCTION_NAME_PROPERTY).value_or(logical_id);
            function.packagetype = string_property(properties, PACKAGE_TYPE_PROPERTY).value_or(PACKAGE_TYPE_ZIP);
            function.stack_path = stack.stack_path();
            function.full_path = join_stack_path(function.stack_path, function.function_id);

            if (function.packagetype != PACKAGE_TYPE_IMAGE) {
                auto codeuri = extract_function_codeuri(type, properties);
                if (codeuri) {
                    function.codeuri = normalize_resource_path(stack.location, *codeuri);
                }
            }

            auto metadata = resource.find(METADATA_KEY);
            if (metadata != resource.end() && metadata->is_object()) {
                json normalized = *metadata;
                auto context = normalized.find(DOCKER_CONTEXT_METADATA);
                if (context != normalized.end() && context->is_string()) {
                    *context = normalize_resource_path(stack.location, context->get<std::string>());
                }
                function.metadata = normalized;
            }

            functions_.push_back(std::move(function));
        }
    }
}

std::optional<Function> FunctionProvider::get(const std::string& name) const {
    if (name.empty()) {
        return std::nullopt;
    }
    for (const auto& function : functions_) {
        if (function.full_path == name) {
            return function;
        }
    }
    // First match in stack order, root stack first.
    for (const auto& function : functions_) {
        if (function.name == name || function.function_id == name || function.function_name == name) {
            return function;
        }
    }
    return std::nullopt;
}

LayerProvider::LayerProvider(const std::vector<Stack>& stacks) {
    for (const auto& stack : stacks) {
        for (const auto& [logical_id, resource] : stack.resources().items()) {
            std::string type = resource_type(resource);
            if (!is_layer_type(type)) {
                continue;
            }

            const json& properties = properties_of(resource);
            const char* key = type == AWS_SERVERLESS_LAYERVERSION ? CONTENT_URI_PROPERTY : CONTENT_PROPERTY;

            LayerVersion layer;
            layer.name = logical_id;
            layer.layer_id = get_resource_id(resource, logical_id);
            layer.stack_path = stack.stack_path();
            layer.full_path = join_stack_path(layer.stack_path, layer.layer_id);

            auto codeuri = string_property(properties, key);
            if (codeuri) {
                layer.codeuri = normalize_resource_path(stack.location, *codeuri);
            }

            layers_.push_back(std::move(layer));
        }
    }
}

std::optional<LayerVersion> LayerProvider::get(const std::string& name) const {
    if (name.empty()) {
        return std::nullopt;
    }
    for (const auto& layer : layers_) {
        if (layer.full_path == name) {
            return layer;
        }
    }
    for (const auto& layer : layers_) {
        if (layer.name == name || layer.layer_id == name) {
            return layer;
        }
    }
    return std::nullopt;
}

} // namespace stackwatch
