#pragma once

/**
 * Stack model and resource lookup.
 *
 * A stack is an immutable snapshot of one (possibly nested) template. Nested
 * stacks are flattened into one list; each knows its path in the nesting tree.
 */

#include <nlohmann/json.hpp>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace stackwatch {

/**
 * Identifies a resource within a (possibly nested) stack.
 *
 * The composite form is "<stack path>/<resource id>", e.g. "ChildStack/Fn1".
 * Root stack resources have no stack path ("Fn1").
 */
class ResourceIdentifier {
public:
    ResourceIdentifier(const std::string& identifier);
    ResourceIdentifier(const char* identifier) : ResourceIdentifier(std::string(identifier)) {}

    const std::string& stack_path() const { return stack_path_; }
    const std::string& resource_iac_id() const { return resource_iac_id_; }

    std::string to_string() const;

    bool operator==(const ResourceIdentifier& other) const { return to_string() == other.to_string(); }
    bool operator!=(const ResourceIdentifier& other) const { return !(*this == other); }

private:
    std::string stack_path_;
    std::string resource_iac_id_;
};

/**
 * One template's worth of resources.
 */
struct Stack {
    std::string parent_stack_path;  // Empty for root and first-level children.
    std::string name;               // Logical id of the nesting resource; empty for root.
    std::string location;           // Template file path, may be empty for in-memory stacks.
    nlohmann::json template_dict = nlohmann::json::object();

    // Path of this stack in the nesting tree, "" for the root stack.
    std::string stack_path() const;

    // The Resources section, or an empty object.
    const nlohmann::json& resources() const;
};

// Joins two stack path segments with "/", skipping empty ones.
std::string join_stack_path(const std::string& parent, const std::string& child);

// Returns Metadata.SamResourceId when present, else the logical id.
std::string get_resource_id(const nlohmann::json& resource, const std::string& logical_id);

/**
 * Finds the resource record for an identifier.
 *
 * An identifier without stack path searches every stack unless explicit_nested
 * is set. Returns nullptr when nothing matches. The pointer refers into the
 * stack's template and stays valid while the stacks are alive.
 */
const nlohmann::json* get_resource_by_id(
    const std::vector<Stack>& stacks,
    const ResourceIdentifier& identifier,
    bool explicit_nested = false
);

// Lists the identifier of every resource, in stack order.
std::vector<ResourceIdentifier> list_resource_ids(const std::vector<Stack>& stacks);

} // namespace stackwatch

namespace std {

template <>
struct hash<stackwatch::ResourceIdentifier> {
    size_t operator()(const stackwatch::ResourceIdentifier& id) const {
        return hash<string>()(id.to_string());
    }
};

} // namespace std
