#include <catch2/catch_all.hpp>
#include <av/errors.h>
#include <av/json.h>
#include <av/validate.h>

using namespace av;

namespace {
    ValidationResult check(const std::string& schema, const std::string& data, ValidationOptions options = {}) {
        SchemaDocument doc(parse_json(schema));
        return validate(doc, parse_json(data), options);
    }

    InstancePath path_of(std::initializer_list<std::string> keys) {
        InstancePath p;
        for (auto const& k : keys) p.push_back(PathSegment::makeKey(k));
        return p;
    }
}  // namespace

TEST_CASE("every failing constraint is reported with its location", "[validate][multi-error]") {
    const std::string schema = R"({
        "type": "object",
        "required": ["id"],
        "properties": {
            "id": {"type": "integer"},
            "tag": {"enum": ["a", "b"]}
        }
    })";

    auto result = check(schema, R"({"id": 1.5, "tag": "c"})");
    REQUIRE_FALSE(result.is_valid());
    REQUIRE(result.failure_count() == 2);

    const auto& type = result.failures[0];
    REQUIRE(type.kind == FailureKind::TypeMismatch);
    REQUIRE(type.instance_path == path_of({"id"}));
    REQUIRE(schema_location(type.schema_path) == "#/properties/id/type");
    REQUIRE(type.details.at("actual").asString() == "number");
    REQUIRE(type.details.at("expected").at(0).asString() == "integer");
    REQUIRE(type.message == "expected type 'integer' but found 'number' (value: 1.5)");

    const auto& tag = result.failures[1];
    REQUIRE(tag.kind == FailureKind::EnumMismatch);
    REQUIRE(instance_pointer(tag.instance_path) == "/tag");
    REQUIRE(schema_location(tag.schema_path) == "#/properties/tag/enum");
    REQUIRE(tag.details.at("allowed").size() == 2);

    auto missing = check(schema, R"({"tag": "a"})");
    REQUIRE(missing.failure_count() == 1);
    REQUIRE(missing.failures[0].kind == FailureKind::Required);
    REQUIRE(missing.failures[0].instance_path.empty());
    REQUIRE(missing.failures[0].message == "missing required property 'id'");
    REQUIRE(missing.failures[0].details.at("property").asString() == "id");

    REQUIRE(check(schema, R"({"id": 3, "tag": "b", "extra": null})").is_valid());
}

TEST_CASE("every missing required property gets its own record", "[validate][multi-error]") {
    auto result = check(R"({"required": ["name", "port", "host"]})", R"({"port": 8080})");
    REQUIRE(result.failure_count() == 2);
    REQUIRE(result.failures[0].details.at("property").asString() == "name");
    REQUIRE(result.failures[1].details.at("property").asString() == "host");
}

TEST_CASE("type checks cover every instance kind", "[validate][type]") {
    struct Case {
        const char* type;
        const char* data;
        bool valid;
    };
    const Case cases[] = {
        {"null", "null", true},         {"null", "0", false},          {"boolean", "false", true},
        {"boolean", "0", false},        {"integer", "3", true},        {"integer", "3.0", true},
        {"integer", "3.5", false},      {"number", "3", true},         {"number", "\"3\"", false},
        {"string", "\"\"", true},       {"string", "null", false},     {"array", "[]", true},
        {"array", "{}", false},         {"object", "{}", true},        {"object", "[]", false},
    };
    for (auto const& c : cases) {
        INFO(c.type << " vs " << c.data);
        auto result = check(std::string(R"({"type": ")") + c.type + "\"}", c.data);
        REQUIRE(result.is_valid() == c.valid);
    }

    REQUIRE(check(R"({"type": ["string", "null"]})", "null").is_valid());
    auto result = check(R"({"type": ["string", "null"]})", "1");
    REQUIRE(result.failure_count() == 1);
    REQUIRE(result.failures[0].message.find("expected one of types [string, null]") != std::string::npos);
}

TEST_CASE("boolean schemas", "[validate]") {
    REQUIRE(check("true", R"({"anything": [1, 2]})").is_valid());
    auto result = check("false", "1");
    REQUIRE(result.failure_count() == 1);
    REQUIRE(result.failures[0].kind == FailureKind::FalseSchema);

    result = check(R"({"properties": {"secret": false}})", R"({"secret": "x", "other": 1})");
    REQUIRE(result.failure_count() == 1);
    REQUIRE(instance_pointer(result.failures[0].instance_path) == "/secret");
}

TEST_CASE("numeric bounds", "[validate][numeric]") {
    REQUIRE(check(R"({"minimum": 1, "maximum": 3})", "1").is_valid());
    REQUIRE(check(R"({"minimum": 1, "maximum": 3})", "3").is_valid());

    auto result = check(R"({"minimum": 1, "maximum": 3})", "0.5");
    REQUIRE(result.failure_count() == 1);
    REQUIRE(result.failures[0].kind == FailureKind::Minimum);
    REQUIRE(result.failures[0].details.at("limit").asInt() == 1);

    result = check(R"({"exclusiveMinimum": 1, "exclusiveMaximum": 3})", "3");
    REQUIRE(result.failure_count() == 1);
    REQUIRE(result.failures[0].kind == FailureKind::ExclusiveMaximum);

    result = check(R"({"minimum": 1, "exclusiveMinimum": true})", "1");
    REQUIRE(result.failure_count() == 1);
    REQUIRE(result.failures[0].kind == FailureKind::ExclusiveMinimum);
    REQUIRE(schema_location(result.failures[0].schema_path) == "#/minimum");

    REQUIRE(check(R"({"maximum": 9223372036854775807})", "9223372036854775807").is_valid());
    REQUIRE_FALSE(check(R"({"maximum": 9223372036854775806})", "9223372036854775807").is_valid());

    REQUIRE(check(R"({"minimum": 1})", R"("not a number")").is_valid());
}

TEST_CASE("multipleOf tolerates floating point representation", "[validate][numeric]") {
    REQUIRE(check(R"({"multipleOf": 0.1})", "0.3").is_valid());
    REQUIRE(check(R"({"multipleOf": 0.01})", "19.99").is_valid());
    REQUIRE(check(R"({"multipleOf": 3})", "9").is_valid());
    auto result = check(R"({"multipleOf": 3})", "10");
    REQUIRE(result.failure_count() == 1);
    REQUIRE(result.failures[0].kind == FailureKind::MultipleOf);
    REQUIRE_FALSE(check(R"({"multipleOf": 0.1})", "0.35").is_valid());
    REQUIRE(check(R"({"multipleOf": -1})", "-9223372036854775808").is_valid());
}

TEST_CASE("string lengths count code points", "[validate][string]") {
    // three characters, five bytes
    REQUIRE(check(R"({"maxLength": 3})", R"("\u00e9t\u00e9")").is_valid());
    auto result = check(R"({"minLength": 4})", R"("\u00e9t\u00e9")");
    REQUIRE(result.failure_count() == 1);
    REQUIRE(result.failures[0].kind == FailureKind::MinLength);
    REQUIRE(result.failures[0].details.at("actual").asInt() == 3);

    REQUIRE(check(R"({"minLength": 4})", "12").is_valid());
}

TEST_CASE("string length limits beyond any string", "[validate][string]") {
    REQUIRE(check(R"({"maxLength": 1e300})", R"("abc")").is_valid());
    auto result = check(R"({"minLength": 1e300})", R"("abc")");
    REQUIRE(result.failure_count() == 1);
    REQUIRE(result.failures[0].kind == FailureKind::MinLength);
    REQUIRE(check(R"({"minLength": -1, "maxLength": 1.5})", R"("abc")").is_valid());
}

TEST_CASE("pattern searches anywhere unless anchored", "[validate][string]") {
    REQUIRE(check(R"({"pattern": "b+"})", R"("abbbc")").is_valid());
    auto result = check(R"({"pattern": "^[a-z]+$"})", R"("abc1")");
    REQUIRE(result.failure_count() == 1);
    REQUIRE(result.failures[0].kind == FailureKind::Pattern);
    REQUIRE(schema_location(result.failures[0].schema_path) == "#/pattern");
}

TEST_CASE("formats", "[validate][format]") {
    REQUIRE(check(R"({"format": "email"})", R"("a@example.com")").is_valid());
    auto result = check(R"({"format": "date-time"})", R"("yesterday")");
    REQUIRE(result.failure_count() == 1);
    REQUIRE(result.failures[0].kind == FailureKind::Format);
    REQUIRE(result.failures[0].details.at("format").asString() == "date-time");

    // unregistered formats are annotations only
    REQUIRE(check(R"({"format": "color"})", R"("blue-ish")").is_valid());
}

TEST_CASE("enum and const compare structurally", "[validate][enum]") {
    REQUIRE(check(R"({"enum": [{"a": 1, "b": [1, 2]}]})", R"({"b": [1, 2], "a": 1.0})").is_valid());
    REQUIRE_FALSE(check(R"({"enum": [1, "1"]})", "true").is_valid());
    auto result = check(R"({"const": "v1"})", R"("v2")");
    REQUIRE(result.failure_count() == 1);
    REQUIRE(result.failures[0].kind == FailureKind::ConstMismatch);
}

TEST_CASE("failures are ordered depth-first in declaration order", "[validate][multi-error]") {
    auto result = check(R"({
        "properties": {
            "b": {"type": "string", "minLength": 5},
            "a": {"properties": {"x": {"type": "integer"}}}
        },
        "required": ["z"]
    })",
                        R"({"a": {"x": "no"}, "b": 7})");
    REQUIRE(result.failure_count() == 3);
    REQUIRE(instance_pointer(result.failures[0].instance_path) == "/b");
    REQUIRE(instance_pointer(result.failures[1].instance_path) == "/a/x");
    REQUIRE(result.failures[2].kind == FailureKind::Required);
}

TEST_CASE("schema_root selects the schema to validate against", "[validate]") {
    SchemaDocument doc(parse_json(R"({"definitions": {"port": {"type": "integer", "maximum": 65535}}})"));
    ValidationOptions options;
    options.schema_root = "#/definitions/port";
    REQUIRE(validate(doc, Value(8080), options).is_valid());

    auto result = validate(doc, Value(70000), options);
    REQUIRE(result.failure_count() == 1);
    REQUIRE(schema_location(result.failures[0].schema_path) == "#/definitions/port/maximum");

    options.schema_root = "#/definitions/missing";
    REQUIRE_THROWS_AS(Validator(doc, options), Error);
}

TEST_CASE("validating twice gives identical results", "[validate]") {
    SchemaDocument doc(parse_json(R"({"items": {"type": "integer"}, "uniqueItems": true})"));
    Validator validator(doc);
    auto data = parse_json(R"([1, "x", 1, 2.5])");
    auto first = validator.validate(data);
    auto second = validator.validate(data);
    REQUIRE(first.failure_count() == 3);
    REQUIRE(first == second);
}
