#include <catch2/catch_all.hpp>
#include <av/json.h>
#include <av/validate.h>

using namespace av;

namespace {
    ValidationResult check(const std::string& schema, const std::string& data) {
        SchemaDocument doc(parse_json(schema));
        return validate(doc, parse_json(data));
    }
}  // namespace

TEST_CASE("additionalProperties false reports each extra key", "[validate][additional-properties]") {
    const std::string schema = R"({
        "properties": {"name": {"type": "string"}},
        "patternProperties": {"^x-": {}},
        "additionalProperties": false
    })";
    REQUIRE(check(schema, R"({"name": "a", "x-trace": 1})").is_valid());

    auto result = check(schema, R"({"name": "a", "nmae": "b", "port": 1})");
    REQUIRE(result.failure_count() == 2);
    REQUIRE(result.failures[0].kind == FailureKind::AdditionalProperties);
    REQUIRE(instance_pointer(result.failures[0].instance_path) == "/nmae");
    REQUIRE(result.failures[0].message == "property 'nmae' is not allowed");
    REQUIRE(schema_location(result.failures[0].schema_path) == "#/additionalProperties");
    REQUIRE(instance_pointer(result.failures[1].instance_path) == "/port");
}

TEST_CASE("additionalProperties schema applies to undeclared keys only", "[validate][additional-properties]") {
    const std::string schema = R"({
        "properties": {"name": {"type": "string"}},
        "additionalProperties": {"type": "integer"}
    })";
    REQUIRE(check(schema, R"({"name": "a", "a": 1, "b": 2})").is_valid());
    auto result = check(schema, R"({"name": "a", "a": "1"})");
    REQUIRE(result.failure_count() == 1);
    REQUIRE(result.failures[0].kind == FailureKind::TypeMismatch);
    REQUIRE(instance_pointer(result.failures[0].instance_path) == "/a");
}

TEST_CASE("patternProperties match by regex search", "[validate][pattern-properties]") {
    const std::string schema = R"({"patternProperties": {"_id$": {"type": "integer"}, "^s": {"type": "string"}}})";
    REQUIRE(check(schema, R"({"user_id": 1, "sname": "x", "other": null})").is_valid());

    auto result = check(schema, R"({"s_id": 1})");
    REQUIRE(result.failure_count() == 1);
    REQUIRE(schema_location(result.failures[0].schema_path) == "#/patternProperties/^s/type");
}

TEST_CASE("propertyNames validates every key", "[validate][property-names]") {
    auto result = check(R"({"propertyNames": {"maxLength": 3}})", R"({"ab": 1, "abcd": 2})");
    REQUIRE(result.failure_count() == 1);
    const auto& r = result.failures[0];
    REQUIRE(r.kind == FailureKind::PropertyNames);
    REQUIRE(instance_pointer(r.instance_path) == "/abcd");
    REQUIRE(r.causes.size() == 1);
    REQUIRE(r.causes[0].kind == FailureKind::MaxLength);
}

TEST_CASE("property counts", "[validate]") {
    REQUIRE(check(R"({"minProperties": 1, "maxProperties": 2})", R"({"a": 1})").is_valid());
    auto result = check(R"({"minProperties": 1, "maxProperties": 2})", R"({})");
    REQUIRE(result.failure_count() == 1);
    REQUIRE(result.failures[0].kind == FailureKind::MinProperties);
    result = check(R"({"maxProperties": 1})", R"({"a": 1, "b": 2})");
    REQUIRE(result.failures[0].kind == FailureKind::MaxProperties);
    REQUIRE(result.failures[0].details.at("actual").asInt() == 2);
}

TEST_CASE("items applies to every element", "[validate][items]") {
    auto result = check(R"({"items": {"type": "string"}})", R"(["a", 1, "b", null])");
    REQUIRE(result.failure_count() == 2);
    REQUIRE(instance_pointer(result.failures[0].instance_path) == "/1");
    REQUIRE(instance_pointer(result.failures[1].instance_path) == "/3");
    REQUIRE(schema_location(result.failures[0].schema_path) == "#/items/type");
}

TEST_CASE("positional items and additionalItems", "[validate][items]") {
    const std::string closed = R"({"items": [{"type": "string"}, {"type": "integer"}], "additionalItems": false})";
    REQUIRE(check(closed, R"(["a", 1])").is_valid());
    REQUIRE(check(closed, R"(["a"])").is_valid());

    auto result = check(closed, R"(["a", 1, true, null])");
    REQUIRE(result.failure_count() == 1);
    REQUIRE(result.failures[0].kind == FailureKind::AdditionalItems);
    REQUIRE(result.failures[0].details.at("limit").asInt() == 2);
    REQUIRE(result.failures[0].details.at("actual").asInt() == 4);

    const std::string open = R"({"items": [{"type": "string"}], "additionalItems": {"type": "boolean"}})";
    result = check(open, R"(["a", true, 3])");
    REQUIRE(result.failure_count() == 1);
    REQUIRE(instance_pointer(result.failures[0].instance_path) == "/2");
}

TEST_CASE("uniqueItems reports each repeated element", "[validate][unique-items]") {
    REQUIRE(check(R"({"uniqueItems": true})", R"([1, "1", [1], {"a": 1}])").is_valid());

    auto result = check(R"({"uniqueItems": true})", R"([{"a": 1, "b": 2}, 3, {"b": 2, "a": 1}, 3.0, 3])");
    REQUIRE(result.failure_count() == 3);
    REQUIRE(instance_pointer(result.failures[0].instance_path) == "/2");
    REQUIRE(result.failures[0].details.at("first").asInt() == 0);
    REQUIRE(instance_pointer(result.failures[1].instance_path) == "/3");
    REQUIRE(result.failures[1].details.at("first").asInt() == 1);
    REQUIRE(instance_pointer(result.failures[2].instance_path) == "/4");

    REQUIRE(check(R"({"uniqueItems": false})", "[1, 1]").is_valid());
}

TEST_CASE("contains needs one matching element", "[validate][contains]") {
    REQUIRE(check(R"({"contains": {"const": "admin"}})", R"(["user", "admin"])").is_valid());
    auto result = check(R"({"contains": {"const": "admin"}})", R"(["user"])");
    REQUIRE(result.failure_count() == 1);
    REQUIRE(result.failures[0].kind == FailureKind::Contains);
    REQUIRE(result.failures[0].details.at("checked").asInt() == 1);
    REQUIRE_FALSE(check(R"({"contains": {}})", "[]").is_valid());
}

TEST_CASE("item counts", "[validate]") {
    auto result = check(R"({"minItems": 2, "maxItems": 3})", "[1]");
    REQUIRE(result.failure_count() == 1);
    REQUIRE(result.failures[0].kind == FailureKind::MinItems);
    result = check(R"({"minItems": 2, "maxItems": 3})", "[1, 2, 3, 4]");
    REQUIRE(result.failures[0].kind == FailureKind::MaxItems);
    REQUIRE(check(R"({"maxItems": 0})", R"({"not": "an array"})").is_valid());
}

TEST_CASE("counts too large for any container saturate", "[validate]") {
    REQUIRE(check(R"({"maxItems": 1e300, "maxProperties": 1e300})", "[1, 2]").is_valid());
    REQUIRE(check(R"({"maxProperties": 1e300})", R"({"a": 1})").is_valid());

    auto result = check(R"({"minItems": 1e300})", "[1]");
    REQUIRE(result.failure_count() == 1);
    REQUIRE(result.failures[0].kind == FailureKind::MinItems);
    REQUIRE(result.failures[0].details.at("limit").asDouble() == Catch::Approx(1e300));

    result = check(R"({"minProperties": 1e300})", R"({"a": 1})");
    REQUIRE(result.failure_count() == 1);
    REQUIRE(result.failures[0].kind == FailureKind::MinProperties);
}
