#pragma once

/**
 * Factory for creating resource triggers by resource type.
 */

#include "resource_trigger.hpp"
#include "stack.hpp"
#include <memory>
#include <string>
#include <vector>

namespace stackwatch {

/**
 * Kinds of watchable resources.
 */
enum class TriggerKind {
    None,
    LambdaZip,
    LambdaImage,
    LambdaLayer,
    ApiDefinition
};

/**
 * Factory for creating triggers from template resources.
 */
class TriggerFactory {
public:
    /**
     * Returns the trigger kind for a resource record, None if it has no
     * files to watch.
     */
    static TriggerKind kind_of(const nlohmann::json& resource);

    /**
     * Creates the trigger for a resource.
     * Returns nullptr for resource types without files to watch.
     * Throws ResourceNotFound if the identifier is not in the stacks, and
     * the trigger's own TriggerError if the resource cannot be watched.
     */
    static std::unique_ptr<IResourceTrigger> create(
        const ResourceIdentifier& resource_identifier,
        const std::vector<Stack>& stacks,
        OnChangeCallback on_code_change
    );

    /**
     * Returns a human-readable name for a trigger kind.
     */
    static std::string get_kind_name(TriggerKind kind);
};

} // namespace stackwatch
