#include "resource_trigger.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "verbose.hpp"

namespace stackwatch {

using json = nlohmann::json;

namespace {

// DefinitionUri of an API resource. The Properties block may be absent.
std::string read_definition_file(const json& resource, const ResourceIdentifier& identifier) {
    auto properties = resource.find(PROPERTIES_KEY);
    if (properties != resource.end() && properties->is_object()) {
        auto definition = properties->find(DEFINITION_URI_PROPERTY);
        if (definition != properties->end() && definition->is_string() &&
            !definition->get<std::string>().empty()) {
            return definition->get<std::string>();
        }
    }
    throw MissingDefinitionUri(identifier.to_string());
}

} // namespace

// ========== ValidatedForwarder ==========

bool ValidatedForwarder::forward(const std::optional<FileEvent>& event) const {
    if (!validator || !validator->validate()) {
        return false;
    }
    if (callback) {
        callback(event);
    }
    return true;
}

// ========== TemplateTrigger ==========

TemplateTrigger::TemplateTrigger(const std::string& template_file, OnChangeCallback on_template_change)
    : TemplateTrigger(
          template_file,
          std::move(on_template_change),
          std::make_shared<DefinitionValidator>(template_file))
{
}

TemplateTrigger::TemplateTrigger(
    const std::string& template_file,
    OnChangeCallback on_template_change,
    std::shared_ptr<IDefinitionValidator> validator
)
    : template_file_(template_file)
    , forwarder_{std::move(validator), std::move(on_template_change)}
{
}

std::vector<WatchTarget> TemplateTrigger::resolve() const {
    WatchTarget target = single_file_target(template_file_);
    target.on_event = forwarder_;
    return {target};
}

// ========== CodeResourceTrigger ==========

CodeResourceTrigger::CodeResourceTrigger(
    const ResourceIdentifier& resource_identifier,
    const std::vector<Stack>& stacks,
    OnChangeCallback on_code_change
)
    : resource_identifier_(resource_identifier)
    , resource_(get_resource_by_id(stacks, resource_identifier))
    , on_code_change_(std::move(on_code_change))
{
    if (!resource_) {
        throw ResourceNotFound(resource_identifier.to_string());
    }
}

WatchTarget CodeResourceTrigger::code_dir_target(const std::string& code_uri) const {
    WatchTarget target = dir_target(code_uri);
    target.on_create = on_code_change_;
    target.on_delete = on_code_change_;
    target.on_event = on_code_change_;
    return target;
}

// ========== Lambda Functions ==========

std::optional<std::string> zip_code_location(const Function& function) {
    return function.codeuri;
}

std::optional<std::string> image_code_location(const Function& function) {
    if (!function.metadata || !function.metadata->is_object()) {
        return std::nullopt;
    }
    auto context = function.metadata->find(DOCKER_CONTEXT_METADATA);
    if (context == function.metadata->end() || !context->is_string()) {
        return std::nullopt;
    }
    return context->get<std::string>();
}

LambdaFunctionCodeTrigger::LambdaFunctionCodeTrigger(
    const ResourceIdentifier& function_identifier,
    const std::vector<Stack>& stacks,
    OnChangeCallback on_code_change,
    CodeLocationStrategy code_location
)
    : CodeResourceTrigger(function_identifier, stacks, std::move(on_code_change))
{
    auto function = FunctionProvider(stacks).get(function_identifier.to_string());
    if (!function) {
        throw FunctionNotFound(function_identifier.to_string());
    }
    function_ = std::move(*function);

    std::optional<std::string> code_uri = code_location ? code_location(function_) : std::nullopt;
    if (!code_uri || code_uri->empty()) {
        throw MissingCodeUri(function_identifier.to_string());
    }
    code_uri_ = *code_uri;

    verbose_log("Trigger", function_identifier.to_string() + " -> " + code_uri_);
}

std::vector<WatchTarget> LambdaFunctionCodeTrigger::resolve() const {
    return {code_dir_target(code_uri_)};
}

// ========== Lambda Layers ==========

LambdaLayerCodeTrigger::LambdaLayerCodeTrigger(
    const ResourceIdentifier& layer_identifier,
    const std::vector<Stack>& stacks,
    OnChangeCallback on_code_change
)
    : CodeResourceTrigger(layer_identifier, stacks, std::move(on_code_change))
{
    auto layer = LayerProvider(stacks).get(layer_identifier.to_string());
    if (!layer) {
        throw ResourceNotFound(layer_identifier.to_string());
    }
    layer_ = std::move(*layer);

    if (!layer_.codeuri || layer_.codeuri->empty()) {
        throw MissingCodeUri(layer_identifier.to_string());
    }
    code_uri_ = *layer_.codeuri;

    verbose_log("Trigger", layer_identifier.to_string() + " -> " + code_uri_);
}

std::vector<WatchTarget> LambdaLayerCodeTrigger::resolve() const {
    return {code_dir_target(code_uri_)};
}

// ========== API Gateway ==========

APIGatewayCodeTrigger::APIGatewayCodeTrigger(
    const ResourceIdentifier& rest_api_identifier,
    const std::vector<Stack>& stacks,
    OnChangeCallback on_code_change
)
    : CodeResourceTrigger(rest_api_identifier, stacks, std::move(on_code_change))
    , definition_file_(read_definition_file(*resource_, resource_identifier_))
    , forwarder_{std::make_shared<DefinitionValidator>(definition_file_), on_code_change_}
{
    verbose_log("Trigger", rest_api_identifier.to_string() + " -> " + definition_file_);
}

APIGatewayCodeTrigger::APIGatewayCodeTrigger(
    const ResourceIdentifier& rest_api_identifier,
    const std::vector<Stack>& stacks,
    OnChangeCallback on_code_change,
    std::shared_ptr<IDefinitionValidator> validator
)
    : CodeResourceTrigger(rest_api_identifier, stacks, std::move(on_code_change))
    , definition_file_(read_definition_file(*resource_, resource_identifier_))
    , forwarder_{std::move(validator), on_code_change_}
{
}

std::vector<WatchTarget> APIGatewayCodeTrigger::resolve() const {
    WatchTarget target = single_file_target(definition_file_);
    target.on_event = forwarder_;
    return {target};
}

} // namespace stackwatch
