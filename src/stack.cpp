#include "stack.hpp"
#include "config.hpp"

namespace stackwatch {

using json = nlohmann::json;

ResourceIdentifier::ResourceIdentifier(const std::string& identifier) {
    auto pos = identifier.rfind('/');
    if (pos == std::string::npos) {
        resource_iac_id_ = identifier;
    } else {
        stack_path_ = identifier.substr(0, pos);
        resource_iac_id_ = identifier.substr(pos + 1);
    }
}

std::string ResourceIdentifier::to_string() const {
    return join_stack_path(stack_path_, resource_iac_id_);
}

std::string join_stack_path(const std::string& parent, const std::string& child) {
    if (parent.empty()) return child;
    if (child.empty()) return parent;
    return parent + "/" + child;
}

std::string Stack::stack_path() const {
    return join_stack_path(parent_stack_path, name);
}

const json& Stack::resources() const {
    static const json EMPTY = json::object();
    if (template_dict.is_object()) {
        auto it = template_dict.find(RESOURCES_KEY);
        if (it != template_dict.end() && it->is_object()) {
            return *it;
        }
    }
    return EMPTY;
}

std::string get_resource_id(const json& resource, const std::string& logical_id) {
    if (resource.is_object()) {
        auto metadata = resource.find(METADATA_KEY);
        if (metadata != resource.end() && metadata->is_object()) {
            auto id = metadata->find(SAM_RESOURCE_ID_METADATA);
            if (id != metadata->end() && id->is_string()) {
                return id->get<std::string>();
            }
        }
    }
    return logical_id;
}

const json* get_resource_by_id(
    const std::vector<Stack>& stacks,
    const ResourceIdentifier& identifier,
    bool explicit_nested
) {
    bool search_all_stacks = identifier.stack_path().empty() && !explicit_nested;

    for (const auto& stack : stacks) {
        if (!search_all_stacks && stack.stack_path() != identifier.stack_path()) {
            continue;
        }

        for (const auto& [logical_id, resource] : stack.resources().items()) {
            std::string resource_id = get_resource_id(resource, logical_id);
            if (resource_id == identifier.resource_iac_id() ||
                (identifier.stack_path().empty() && logical_id == identifier.resource_iac_id())) {
                return &resource;
            }
        }
    }
    return nullptr;
}

std::vector<ResourceIdentifier> list_resource_ids(const std::vector<Stack>& stacks) {
    std::vector<ResourceIdentifier> ids;
    for (const auto& stack : stacks) {
        for (const auto& [logical_id, resource] : stack.resources().items()) {
            ids.emplace_back(join_stack_path(stack.stack_path(), get_resource_id(resource, logical_id)));
        }
    }
    return ids;
}

} // namespace stackwatch
