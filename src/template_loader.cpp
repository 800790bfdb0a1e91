#include "template_loader.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "resource_provider.hpp"
#include "verbose.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace fs = std::filesystem;

namespace stackwatch {

using json = nlohmann::json;

namespace {

// Tags whose long form is not prefixed with "Fn::".
const std::unordered_set<std::string> UNPREFIXED_TAGS = {"Ref", "Condition"};

json convert_scalar(const YAML::Node& node) {
    const std::string& value = node.Scalar();

    // Quoted scalars carry the "!" tag and stay strings.
    if (node.Tag() != "?") {
        return value;
    }

    if (value.empty() || value == "~" || value == "null" || value == "Null" || value == "NULL") {
        return nullptr;
    }
    if (value == "true" || value == "True" || value == "TRUE") {
        return true;
    }
    if (value == "false" || value == "False" || value == "FALSE") {
        return false;
    }

    long long integer = 0;
    if (YAML::convert<long long>::decode(node, integer)) {
        return integer;
    }
    double number = 0.0;
    if (YAML::convert<double>::decode(node, number)) {
        return number;
    }
    return value;
}

json convert_untagged(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Scalar:
            return convert_scalar(node);
        case YAML::NodeType::Sequence: {
            json array = json::array();
            for (const auto& item : node) {
                array.push_back(yaml_to_json(item));
            }
            return array;
        }
        case YAML::NodeType::Map: {
            json object = json::object();
            for (const auto& entry : node) {
                object[entry.first.as<std::string>()] = yaml_to_json(entry.second);
            }
            return object;
        }
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
        default:
            return nullptr;
    }
}

// Expands "!GetAtt Res.Attr" style tags into {"Fn::GetAtt": ["Res", "Attr"]}.
json convert_intrinsic(const std::string& tag, const YAML::Node& node) {
    std::string name = tag.substr(1);
    std::string key = UNPREFIXED_TAGS.count(name) > 0 ? name : "Fn::" + name;

    if (node.IsScalar()) {
        std::string value = node.Scalar();
        if (name == "GetAtt") {
            auto dot = value.find('.');
            if (dot != std::string::npos) {
                return json{{key, json::array({value.substr(0, dot), value.substr(dot + 1)})}};
            }
        }
        return json{{key, value}};
    }
    return json{{key, convert_untagged(node)}};
}

void load_stack_recursive(
    const std::string& template_path,
    const std::string& parent_stack_path,
    const std::string& name,
    std::unordered_set<std::string>& chain,
    std::vector<Stack>& stacks
) {
    std::error_code ec;
    std::string key = fs::weakly_canonical(fs::absolute(template_path), ec).string();
    if (ec) {
        key = fs::absolute(template_path).lexically_normal().string();
    }
    if (chain.count(key) > 0) {
        throw TemplateLoadError("Nested stack cycle detected at: " + template_path);
    }
    chain.insert(key);

    Stack stack;
    stack.parent_stack_path = parent_stack_path;
    stack.name = name;
    stack.location = template_path;
    stack.template_dict = parse_template_file(template_path);
    apply_globals(stack.template_dict);

    verbose_log("Template", "Loaded stack '" + stack.stack_path() + "' from " + template_path);

    std::string stack_path = stack.stack_path();
    std::vector<std::pair<std::string, std::string>> children;
    for (const auto& [logical_id, resource] : stack.resources().items()) {
        std::string type = resource_type(resource);
        const char* location_key = nullptr;
        if (type == AWS_SERVERLESS_APPLICATION) {
            location_key = LOCATION_PROPERTY;
        } else if (type == AWS_CLOUDFORMATION_STACK) {
            location_key = TEMPLATE_URL_PROPERTY;
        } else {
            continue;
        }

        auto properties = resource.find(PROPERTIES_KEY);
        if (properties == resource.end() || !properties->is_object()) {
            continue;
        }
        auto location = properties->find(location_key);
        if (location == properties->end() || !location->is_string()) {
            continue;
        }
        std::string child_location = location->get<std::string>();
        if (!is_local_location(child_location)) {
            verbose_log("Template", "Skipping remote nested stack " + logical_id);
            continue;
        }
        children.emplace_back(logical_id, normalize_resource_path(template_path, child_location));
    }

    stacks.push_back(std::move(stack));

    for (const auto& [child_name, child_path] : children) {
        load_stack_recursive(child_path, stack_path, child_name, chain, stacks);
    }

    chain.erase(key);
}

} // namespace

json yaml_to_json(const YAML::Node& node) {
    const std::string& tag = node.Tag();
    if (tag.size() > 1 && tag[0] == '!' && tag[1] != '!') {
        return convert_intrinsic(tag, node);
    }
    return convert_untagged(node);
}

json parse_template_string(const std::string& content) {
    try {
        YAML::Node root = YAML::Load(content);
        return yaml_to_json(root);
    } catch (const YAML::Exception& e) {
        throw TemplateLoadError(std::string("Failed to parse template: ") + e.what());
    }
}

json parse_template_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw TemplateLoadError("Cannot open template: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        return parse_template_string(buffer.str());
    } catch (const TemplateLoadError& e) {
        throw TemplateLoadError(path + ": " + e.what());
    }
}

void apply_globals(json& template_dict) {
    if (!template_dict.is_object()) {
        return;
    }
    auto globals = template_dict.find(GLOBALS_KEY);
    auto resources = template_dict.find(RESOURCES_KEY);
    if (globals == template_dict.end() || !globals->is_object() ||
        resources == template_dict.end() || !resources->is_object()) {
        return;
    }

    for (auto& [logical_id, resource] : resources->items()) {
        auto section_name = GLOBALS_SECTIONS.find(resource_type(resource));
        if (section_name == GLOBALS_SECTIONS.end()) {
            continue;
        }
        auto section = globals->find(section_name->second);
        if (section == globals->end() || !section->is_object()) {
            continue;
        }

        json& properties = resource[PROPERTIES_KEY];
        if (!properties.is_object()) {
            properties = json::object();
        }
        for (const auto& [key, value] : section->items()) {
            if (!properties.contains(key)) {
                properties[key] = value;
            }
        }
    }
}

bool is_local_location(const std::string& location) {
    return location.rfind("http://", 0) != 0 &&
           location.rfind("https://", 0) != 0 &&
           location.rfind("s3://", 0) != 0;
}

std::vector<Stack> load_stacks(const std::string& template_path) {
    std::vector<Stack> stacks;
    std::unordered_set<std::string> chain;
    load_stack_recursive(template_path, "", "", chain, stacks);
    return stacks;
}

} // namespace stackwatch
