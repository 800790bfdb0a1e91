#pragma once

/**
 * Resource triggers.
 *
 * A trigger turns one template resource into the watch targets that cover
 * its files. All lookups happen in the constructor, which throws a
 * TriggerError when the resource cannot be watched. After construction a
 * trigger is immutable and resolve() can be called any number of times.
 */

#include "definition_validator.hpp"
#include "resource_provider.hpp"
#include "stack.hpp"
#include "watch_target.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace stackwatch {

/**
 * Interface for producing watch targets for a resource.
 */
class IResourceTrigger {
public:
    virtual ~IResourceTrigger() = default;

    /**
     * Returns the watch targets for the resource. Never empty.
     */
    virtual std::vector<WatchTarget> resolve() const = 0;
};

/**
 * Forwards an event to a callback only when the validator accepts the
 * current file content.
 */
struct ValidatedForwarder {
    std::shared_ptr<IDefinitionValidator> validator;
    OnChangeCallback callback;

    // Returns true if the event was forwarded.
    bool forward(const std::optional<FileEvent>& event) const;

    void operator()(const std::optional<FileEvent>& event) const { forward(event); }
};

/**
 * Watches a template file. Only structural changes reach the callback.
 */
class TemplateTrigger : public IResourceTrigger {
public:
    TemplateTrigger(const std::string& template_file, OnChangeCallback on_template_change);

    TemplateTrigger(
        const std::string& template_file,
        OnChangeCallback on_template_change,
        std::shared_ptr<IDefinitionValidator> validator
    );

    std::vector<WatchTarget> resolve() const override;

    const std::string& template_file() const { return template_file_; }

private:
    std::string template_file_;
    ValidatedForwarder forwarder_;
};

/**
 * Base for triggers bound to a single template resource.
 *
 * Throws ResourceNotFound if the identifier is not in the stacks.
 */
class CodeResourceTrigger : public IResourceTrigger {
public:
    const nlohmann::json& resource() const { return *resource_; }
    const ResourceIdentifier& resource_identifier() const { return resource_identifier_; }
    const OnChangeCallback& on_code_change() const { return on_code_change_; }

protected:
    CodeResourceTrigger(
        const ResourceIdentifier& resource_identifier,
        const std::vector<Stack>& stacks,
        OnChangeCallback on_code_change
    );

    // Directory target with the unwrapped callback on every event kind.
    WatchTarget code_dir_target(const std::string& code_uri) const;

    ResourceIdentifier resource_identifier_;
    const nlohmann::json* resource_;
    OnChangeCallback on_code_change_;
};

/**
 * Computes the code directory of a function, or nothing if it has none.
 */
using CodeLocationStrategy = std::function<std::optional<std::string>(const Function&)>;

// The function's CodeUri, verbatim.
std::optional<std::string> zip_code_location(const Function& function);

// The DockerContext entry of the function's metadata.
std::optional<std::string> image_code_location(const Function& function);

/**
 * Watches the code directory of a function.
 *
 * Throws FunctionNotFound if the resource is not a function and
 * MissingCodeUri if the strategy yields no location.
 */
class LambdaFunctionCodeTrigger : public CodeResourceTrigger {
public:
    LambdaFunctionCodeTrigger(
        const ResourceIdentifier& function_identifier,
        const std::vector<Stack>& stacks,
        OnChangeCallback on_code_change,
        CodeLocationStrategy code_location
    );

    std::vector<WatchTarget> resolve() const override;

    const Function& function() const { return function_; }
    const std::string& code_uri() const { return code_uri_; }

private:
    Function function_;
    std::string code_uri_;
};

class LambdaZipCodeTrigger : public LambdaFunctionCodeTrigger {
public:
    LambdaZipCodeTrigger(
        const ResourceIdentifier& function_identifier,
        const std::vector<Stack>& stacks,
        OnChangeCallback on_code_change
    )
        : LambdaFunctionCodeTrigger(function_identifier, stacks, std::move(on_code_change), zip_code_location) {}
};

class LambdaImageCodeTrigger : public LambdaFunctionCodeTrigger {
public:
    LambdaImageCodeTrigger(
        const ResourceIdentifier& function_identifier,
        const std::vector<Stack>& stacks,
        OnChangeCallback on_code_change
    )
        : LambdaFunctionCodeTrigger(function_identifier, stacks, std::move(on_code_change), image_code_location) {}
};

/**
 * Watches the content directory of a layer version.
 *
 * Throws ResourceNotFound if the resource is not a layer and MissingCodeUri
 * if it has no content location.
 */
class LambdaLayerCodeTrigger : public CodeResourceTrigger {
public:
    LambdaLayerCodeTrigger(
        const ResourceIdentifier& layer_identifier,
        const std::vector<Stack>& stacks,
        OnChangeCallback on_code_change
    );

    std::vector<WatchTarget> resolve() const override;

    const LayerVersion& layer() const { return layer_; }
    const std::string& code_uri() const { return code_uri_; }

private:
    LayerVersion layer_;
    std::string code_uri_;
};

/**
 * Watches the definition file of an API. Only structural changes reach
 * the callback.
 *
 * Throws MissingDefinitionUri if the API has no DefinitionUri.
 */
class APIGatewayCodeTrigger : public CodeResourceTrigger {
public:
    APIGatewayCodeTrigger(
        const ResourceIdentifier& rest_api_identifier,
        const std::vector<Stack>& stacks,
        OnChangeCallback on_code_change
    );

    APIGatewayCodeTrigger(
        const ResourceIdentifier& rest_api_identifier,
        const std::vector<Stack>& stacks,
        OnChangeCallback on_code_change,
        std::shared_ptr<IDefinitionValidator> validator
    );

    std::vector<WatchTarget> resolve() const override;

    const std::string& definition_file() const { return definition_file_; }

private:
    std::string definition_file_;
    ValidatedForwarder forwarder_;
};

} // namespace stackwatch
