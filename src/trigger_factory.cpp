#include "trigger_factory.hpp"
#include "config.hpp"
#include "errors.hpp"

namespace stackwatch {

using json = nlohmann::json;

TriggerKind TriggerFactory::kind_of(const json& resource) {
    std::string type = resource_type(resource);

    if (is_function_type(type)) {
        auto properties = resource.find(PROPERTIES_KEY);
        if (properties != resource.end() && properties->is_object()) {
            auto package_type = properties->find(PACKAGE_TYPE_PROPERTY);
            if (package_type != properties->end() && *package_type == PACKAGE_TYPE_IMAGE) {
                return TriggerKind::LambdaImage;
            }
        }
        return TriggerKind::LambdaZip;
    }
    if (is_layer_type(type)) {
        return TriggerKind::LambdaLayer;
    }
    if (type == AWS_SERVERLESS_API || type == AWS_SERVERLESS_HTTPAPI) {
        return TriggerKind::ApiDefinition;
    }
    return TriggerKind::None;
}

std::unique_ptr<IResourceTrigger> TriggerFactory::create(
    const ResourceIdentifier& resource_identifier,
    const std::vector<Stack>& stacks,
    OnChangeCallback on_code_change
) {
    const json* resource = get_resource_by_id(stacks, resource_identifier);
    if (!resource) {
        throw ResourceNotFound(resource_identifier.to_string());
    }

    switch (kind_of(*resource)) {
        case TriggerKind::LambdaZip:
            return std::make_unique<LambdaZipCodeTrigger>(resource_identifier, stacks, std::move(on_code_change));
        case TriggerKind::LambdaImage:
            return std::make_unique<LambdaImageCodeTrigger>(resource_identifier, stacks, std::move(on_code_change));
        case TriggerKind::LambdaLayer:
            return std::make_unique<LambdaLayerCodeTrigger>(resource_identifier, stacks, std::move(on_code_change));
        case TriggerKind::ApiDefinition:
            return std::make_unique<APIGatewayCodeTrigger>(resource_identifier, stacks, std::move(on_code_change));
        case TriggerKind::None:
        default:
            return nullptr;
    }
}

std::string TriggerFactory::get_kind_name(TriggerKind kind) {
    switch (kind) {
        case TriggerKind::LambdaZip:
            return "Lambda (zip)";
        case TriggerKind::LambdaImage:
            return "Lambda (image)";
        case TriggerKind::LambdaLayer:
            return "Lambda layer";
        case TriggerKind::ApiDefinition:
            return "API definition";
        case TriggerKind::None:
        default:
            return "None";
    }
}

} // namespace stackwatch
