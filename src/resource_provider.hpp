#pragma once

/**
 * Typed views of function and layer resources.
 *
 * Providers scan every stack once at construction and answer lookups by
 * name afterwards.
 */

#include "stack.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace stackwatch {

/**
 * A function resource.
 */
struct Function {
    std::string name;           // Logical id.
    std::string function_id;    // SamResourceId or logical id.
    std::string function_name;  // FunctionName property or logical id.
    std::string packagetype;    // "Zip" or "Image".
    std::optional<std::string> codeuri;
    std::optional<nlohmann::json> metadata;
    std::string stack_path;
    std::string full_path;      // stack_path/function_id
};

/**
 * A layer version resource.
 */
struct LayerVersion {
    std::string name;
    std::string layer_id;
    std::optional<std::string> codeuri;
    std::string stack_path;
    std::string full_path;
};

// Returns true for AWS::Serverless::Function and AWS::Lambda::Function.
bool is_function_type(const std::string& type);

// Returns true for AWS::Serverless::LayerVersion and AWS::Lambda::LayerVersion.
bool is_layer_type(const std::string& type);

// Returns the resource's Type, or an empty string.
std::string resource_type(const nlohmann::json& resource);

// Rebases a relative path onto the directory of the stack's template location.
std::string normalize_resource_path(const std::string& stack_location, const std::string& path);

/**
 * Looks up functions across all stacks.
 */
class FunctionProvider {
public:
    explicit FunctionProvider(const std::vector<Stack>& stacks);

    /**
     * Finds a function by full path, then by logical id, function id or
     * function name in any stack. Returns nullopt when none matches.
     */
    std::optional<Function> get(const std::string& name) const;

private:
    std::vector<Function> functions_;
};

/**
 * Looks up layer versions across all stacks.
 */
class LayerProvider {
public:
    explicit LayerProvider(const std::vector<Stack>& stacks);

    // Finds a layer by full path, then by logical or resource id in any stack.
    std::optional<LayerVersion> get(const std::string& name) const;

private:
    std::vector<LayerVersion> layers_;
};

} // namespace stackwatch
