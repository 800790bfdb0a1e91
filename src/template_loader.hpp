#pragma once

/**
 * Template parsing and stack loading.
 *
 * Templates are YAML or JSON documents. CloudFormation short-form intrinsic
 * tags (!Ref, !GetAtt, !Sub, ...) are expanded into their long form while
 * converting to JSON.
 */

#include "stack.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace YAML {
class Node;
}

namespace stackwatch {

// Converts a parsed YAML node, including intrinsic tags, into JSON.
nlohmann::json yaml_to_json(const YAML::Node& node);

// Parses YAML or JSON text. Throws TemplateLoadError on syntax errors.
nlohmann::json parse_template_string(const std::string& content);

// Reads and parses a template file. Throws TemplateLoadError if it cannot be read or parsed.
nlohmann::json parse_template_file(const std::string& path);

// Copies Globals section properties into resources that do not declare them.
void apply_globals(nlohmann::json& template_dict);

// Returns true if a nested stack location points at the local filesystem.
bool is_local_location(const std::string& location);

/**
 * Loads a template and every locally nested stack beneath it.
 *
 * The root stack comes first, each parent precedes its children. Throws
 * TemplateLoadError when any template cannot be loaded or nesting is cyclic.
 */
std::vector<Stack> load_stacks(const std::string& template_path);

} // namespace stackwatch
