#include <catch2/catch.hpp>
#include "errors.hpp"
#include "template_loader.hpp"
#include "test_support.hpp"
#include <algorithm>

using namespace stackwatch;
using namespace stackwatch::testing;
using json = nlohmann::json;

TEST_CASE("Templates parse from YAML and JSON", "[template]") {
    SECTION("YAML scalars keep their types") {
        json parsed = parse_template_string(
            "Name: app\n"
            "Count: 3\n"
            "Ratio: 0.5\n"
            "Enabled: true\n"
            "Empty: ~\n"
            "Quoted: \"42\"\n"
            "List:\n"
            "  - a\n"
            "  - b\n");

        REQUIRE(parsed["Name"] == "app");
        REQUIRE(parsed["Count"] == 3);
        REQUIRE(parsed["Ratio"] == 0.5);
        REQUIRE(parsed["Enabled"] == true);
        REQUIRE(parsed["Empty"].is_null());
        REQUIRE(parsed["Quoted"] == "42");
        REQUIRE(parsed["List"] == json::array({"a", "b"}));
    }

    SECTION("JSON documents") {
        json parsed = parse_template_string(R"({"Resources": {"Fn1": {"Type": "AWS::Serverless::Function"}}})");
        REQUIRE(parsed["Resources"]["Fn1"]["Type"] == "AWS::Serverless::Function");
    }

    SECTION("malformed documents throw") {
        REQUIRE_THROWS_AS(parse_template_string("Resources: [unclosed"), TemplateLoadError);
    }
}

TEST_CASE("Short-form intrinsic tags expand", "[template]") {
    json parsed = parse_template_string(
        "Bucket: !Ref MyBucket\n"
        "Arn: !GetAtt MyFunction.Arn\n"
        "Url: !Sub 'https://${Api}.example.com'\n"
        "Joined: !Join [',', [a, b]]\n"
        "Cond: !Condition IsProd\n");

    REQUIRE(parsed["Bucket"] == json{{"Ref", "MyBucket"}});
    REQUIRE(parsed["Arn"] == json{{"Fn::GetAtt", json::array({"MyFunction", "Arn"})}});
    REQUIRE(parsed["Url"] == json{{"Fn::Sub", "https://${Api}.example.com"}});
    REQUIRE(parsed["Joined"] == json{{"Fn::Join", json::array({",", json::array({"a", "b"})})}});
    REQUIRE(parsed["Cond"] == json{{"Condition", "IsProd"}});
}

TEST_CASE("Globals fill in missing properties", "[template]") {
    json template_dict = parse_template_string(
        "Globals:\n"
        "  Function:\n"
        "    CodeUri: shared/\n"
        "    Runtime: python3.12\n"
        "Resources:\n"
        "  Fn1:\n"
        "    Type: AWS::Serverless::Function\n"
        "  Fn2:\n"
        "    Type: AWS::Serverless::Function\n"
        "    Properties:\n"
        "      CodeUri: own/\n"
        "  Bucket:\n"
        "    Type: AWS::S3::Bucket\n");

    apply_globals(template_dict);

    const json& resources = template_dict["Resources"];
    REQUIRE(resources["Fn1"]["Properties"]["CodeUri"] == "shared/");
    REQUIRE(resources["Fn1"]["Properties"]["Runtime"] == "python3.12");
    REQUIRE(resources["Fn2"]["Properties"]["CodeUri"] == "own/");
    REQUIRE(resources["Fn2"]["Properties"]["Runtime"] == "python3.12");
    REQUIRE_FALSE(resources["Bucket"].contains("Properties"));
}

TEST_CASE("Nested local stacks are loaded", "[template]") {
    TempDir dir;
    dir.write("template.yaml",
        "Resources:\n"
        "  Fn1:\n"
        "    Type: AWS::Serverless::Function\n"
        "    Properties:\n"
        "      CodeUri: src/\n"
        "  ChildApp:\n"
        "    Type: AWS::Serverless::Application\n"
        "    Properties:\n"
        "      Location: child/template.yaml\n"
        "  RemoteApp:\n"
        "    Type: AWS::Serverless::Application\n"
        "    Properties:\n"
        "      Location: https://example.com/template.yaml\n");
    dir.write("child/template.yaml",
        "Resources:\n"
        "  ChildFn:\n"
        "    Type: AWS::Serverless::Function\n"
        "    Properties:\n"
        "      CodeUri: code/\n"
        "  Grand:\n"
        "    Type: AWS::CloudFormation::Stack\n"
        "    Properties:\n"
        "      TemplateURL: ../grand.yaml\n");
    dir.write("grand.yaml",
        "Resources:\n"
        "  GrandLayer:\n"
        "    Type: AWS::Serverless::LayerVersion\n"
        "    Properties:\n"
        "      ContentUri: layer/\n");

    auto stacks = load_stacks((dir.path() / "template.yaml").string());

    REQUIRE(stacks.size() == 3);
    REQUIRE(stacks[0].stack_path().empty());
    REQUIRE(stacks[1].stack_path() == "ChildApp");
    REQUIRE(stacks[2].stack_path() == "ChildApp/Grand");
    REQUIRE(stacks[2].resources().contains("GrandLayer"));

    auto ids = list_resource_ids(stacks);
    std::vector<std::string> names;
    for (const auto& id : ids) {
        names.push_back(id.to_string());
    }
    REQUIRE(std::find(names.begin(), names.end(), "ChildApp/ChildFn") != names.end());
    REQUIRE(std::find(names.begin(), names.end(), "ChildApp/Grand/GrandLayer") != names.end());
}

TEST_CASE("Stack loading failures", "[template]") {
    TempDir dir;

    SECTION("missing template") {
        REQUIRE_THROWS_AS(load_stacks((dir.path() / "missing.yaml").string()), TemplateLoadError);
    }

    SECTION("cyclic nesting") {
        dir.write("a.yaml",
            "Resources:\n"
            "  B:\n"
            "    Type: AWS::CloudFormation::Stack\n"
            "    Properties:\n"
            "      TemplateURL: b.yaml\n");
        dir.write("b.yaml",
            "Resources:\n"
            "  A:\n"
            "    Type: AWS::CloudFormation::Stack\n"
            "    Properties:\n"
            "      TemplateURL: a.yaml\n");

        REQUIRE_THROWS_AS(load_stacks((dir.path() / "a.yaml").string()), TemplateLoadError);
    }
}

TEST_CASE("Remote locations are recognized", "[template]") {
    REQUIRE(is_local_location("child/template.yaml"));
    REQUIRE(is_local_location("/abs/template.yaml"));
    REQUIRE_FALSE(is_local_location("https://bucket.s3.amazonaws.com/t.yaml"));
    REQUIRE_FALSE(is_local_location("http://example.com/t.yaml"));
    REQUIRE_FALSE(is_local_location("s3://bucket/t.yaml"));
}
