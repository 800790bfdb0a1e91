#pragma once

/**
 * Exceptions raised while resolving resources into watch targets.
 *
 * Every trigger error is thrown from a trigger constructor, never from
 * resolve() or from event delivery.
 */

#include <stdexcept>
#include <string>

namespace stackwatch {

/**
 * Base class for resolution failures of a single resource.
 */
class TriggerError : public std::runtime_error {
public:
    explicit TriggerError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * The identifier does not resolve to a resource in the supplied stacks.
 */
class ResourceNotFound : public TriggerError {
public:
    explicit ResourceNotFound(const std::string& resource_id)
        : TriggerError("Resource not found: " + resource_id) {}
};

/**
 * The identifier resolves to a resource that is not a function.
 */
class FunctionNotFound : public TriggerError {
public:
    explicit FunctionNotFound(const std::string& resource_id)
        : TriggerError("Function not found: " + resource_id) {}
};

/**
 * A code-bearing resource declares no usable code location.
 */
class MissingCodeUri : public TriggerError {
public:
    explicit MissingCodeUri(const std::string& resource_id)
        : TriggerError("Missing code location for resource: " + resource_id) {}
};

/**
 * An API resource declares no definition file.
 */
class MissingDefinitionUri : public TriggerError {
public:
    explicit MissingDefinitionUri(const std::string& resource_id)
        : TriggerError("Missing DefinitionUri for resource: " + resource_id) {}
};

/**
 * A template cannot be read or parsed.
 */
class TemplateLoadError : public std::runtime_error {
public:
    explicit TemplateLoadError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace stackwatch
