#pragma once

/**
 * Application configuration constants.
 *
 * Defines file names, resource type names and template property keys used
 * when resolving resources into watch targets.
 */

#include <string>
#include <unordered_map>

namespace stackwatch {

// ========== File Paths ==========

constexpr const char* SETTINGS_FILE = ".stackwatch.json";     // Local settings file.
constexpr const char* DEFAULT_TEMPLATE_FILE = "template.yaml";  // Template used when none is given.

// ========== Resource Types ==========

constexpr const char* AWS_SERVERLESS_FUNCTION = "AWS::Serverless::Function";
constexpr const char* AWS_LAMBDA_FUNCTION = "AWS::Lambda::Function";
constexpr const char* AWS_SERVERLESS_LAYERVERSION = "AWS::Serverless::LayerVersion";
constexpr const char* AWS_LAMBDA_LAYERVERSION = "AWS::Lambda::LayerVersion";
constexpr const char* AWS_SERVERLESS_API = "AWS::Serverless::Api";
constexpr const char* AWS_SERVERLESS_HTTPAPI = "AWS::Serverless::HttpApi";
constexpr const char* AWS_SERVERLESS_APPLICATION = "AWS::Serverless::Application";
constexpr const char* AWS_CLOUDFORMATION_STACK = "AWS::CloudFormation::Stack";

// ========== Template Keys ==========

constexpr const char* RESOURCES_KEY = "Resources";
constexpr const char* GLOBALS_KEY = "Globals";
constexpr const char* TYPE_KEY = "Type";
constexpr const char* PROPERTIES_KEY = "Properties";
constexpr const char* METADATA_KEY = "Metadata";

constexpr const char* CODE_URI_PROPERTY = "CodeUri";
constexpr const char* INLINE_CODE_PROPERTY = "InlineCode";
constexpr const char* CODE_PROPERTY = "Code";                 // AWS::Lambda::Function
constexpr const char* ZIP_FILE_PROPERTY = "ZipFile";
constexpr const char* CONTENT_URI_PROPERTY = "ContentUri";    // AWS::Serverless::LayerVersion
constexpr const char* CONTENT_PROPERTY = "Content";           // AWS::Lambda::LayerVersion
constexpr const char* DEFINITION_URI_PROPERTY = "DefinitionUri";
constexpr const char* PACKAGE_TYPE_PROPERTY = "PackageType";
constexpr const char* FUNCTION_NAME_PROPERTY = "FunctionName";
constexpr const char* LOCATION_PROPERTY = "Location";         // AWS::Serverless::Application
constexpr const char* TEMPLATE_URL_PROPERTY = "TemplateURL";  // AWS::CloudFormation::Stack

constexpr const char* DOCKER_CONTEXT_METADATA = "DockerContext";
constexpr const char* SAM_RESOURCE_ID_METADATA = "SamResourceId";

// ========== Package Types ==========

constexpr const char* PACKAGE_TYPE_ZIP = "Zip";
constexpr const char* PACKAGE_TYPE_IMAGE = "Image";

// Code location used when a zip function declares none.
constexpr const char* DEFAULT_CODE_URI = ".";

// Maps resource types to their section under the template's Globals block.
inline const std::unordered_map<std::string, std::string> GLOBALS_SECTIONS = {
    {AWS_SERVERLESS_FUNCTION, "Function"},
    {AWS_SERVERLESS_API, "Api"},
    {AWS_SERVERLESS_HTTPAPI, "HttpApi"},
    {AWS_SERVERLESS_LAYERVERSION, "LayerVersion"}
};

} // namespace stackwatch
