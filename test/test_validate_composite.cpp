#include <catch2/catch_all.hpp>
#include <av/json.h>
#include <av/report.h>
#include <av/validate.h>

using namespace av;

namespace {
    ValidationResult check(const std::string& schema, const std::string& data) {
        SchemaDocument doc(parse_json(schema));
        return validate(doc, parse_json(data));
    }
}  // namespace

TEST_CASE("anyOf reports every alternative it tried", "[validate][anyof]") {
    auto result = check(R"({"anyOf": [{"type": "string"}, {"type": "number"}]})", "true");
    REQUIRE(result.failure_count() == 1);

    const auto& r = result.failures[0];
    REQUIRE(r.kind == FailureKind::AnyOf);
    REQUIRE(r.instance_path.empty());
    REQUIRE(schema_location(r.schema_path) == "#/anyOf");
    REQUIRE(r.details.at("tried").asInt() == 2);
    REQUIRE(r.details.at("alternatives").size() == 2);
    REQUIRE(r.details.at("alternatives").at(1).at("index").asInt() == 1);
    REQUIRE(r.details.at("alternatives").at(1).at("failures").asInt() == 1);
    REQUIRE(r.message == "value does not match any of the 2 alternatives in anyOf (closest: alternative 0)");

    REQUIRE(r.causes.size() == 1);
    REQUIRE(r.causes[0].kind == FailureKind::TypeMismatch);
    REQUIRE(schema_location(r.causes[0].schema_path) == "#/anyOf/0/type");
}

TEST_CASE("anyOf points at the closest alternative", "[validate][anyof]") {
    auto result = check(R"({"anyOf": [
        {"type": "object", "required": ["a", "b", "c"]},
        {"type": "object", "required": ["a"], "properties": {"a": {"type": "string"}}}
    ]})",
                        R"({"a": 1})");
    REQUIRE(result.failure_count() == 1);
    const auto& r = result.failures[0];
    REQUIRE(r.details.at("best").asInt() == 1);
    REQUIRE(r.causes.size() == 1);
    REQUIRE(instance_pointer(r.causes[0].instance_path) == "/a");
}

TEST_CASE("anyOf stops at the first matching alternative", "[validate][anyof]") {
    REQUIRE(check(R"({"anyOf": [{"type": "integer"}, {"minimum": 100}]})", "5").is_valid());
    REQUIRE(check(R"({"anyOf": [{"minimum": 100}, {"type": "integer"}]})", "5").is_valid());
}

TEST_CASE("allOf failures add up", "[validate][allof]") {
    auto result = check(R"({"allOf": [
        {"type": "string"},
        {"minLength": 10},
        {"pattern": "^x"}
    ]})",
                        R"("abc")");
    REQUIRE(result.failure_count() == 2);
    REQUIRE(schema_location(result.failures[0].schema_path) == "#/allOf/1/minLength");
    REQUIRE(schema_location(result.failures[1].schema_path) == "#/allOf/2/pattern");

    auto left = check(R"({"minLength": 10})", R"("abc")");
    auto right = check(R"({"pattern": "^x"})", R"("abc")");
    REQUIRE(result.failure_count() == left.failure_count() + right.failure_count());
}

TEST_CASE("oneOf needs exactly one match", "[validate][oneof]") {
    const std::string schema = R"({"oneOf": [{"type": "integer"}, {"minimum": 10}]})";
    REQUIRE(check(schema, "5").is_valid());
    REQUIRE(check(schema, "10.5").is_valid());

    auto both = check(schema, "12");
    REQUIRE(both.failure_count() == 1);
    REQUIRE(both.failures[0].kind == FailureKind::OneOfAmbiguous);
    REQUIRE(both.failures[0].details.at("matched").size() == 2);

    auto none = check(schema, "2.5");
    REQUIRE(none.failure_count() == 1);
    REQUIRE(none.failures[0].kind == FailureKind::OneOfNoMatch);
    REQUIRE(none.failures[0].details.at("tried").asInt() == 2);
    REQUIRE_FALSE(none.failures[0].causes.empty());
}

TEST_CASE("oneOf over identical alternatives never validates", "[validate][oneof]") {
    const std::string schema = R"({"oneOf": [{"type": "string"}, {"type": "string"}]})";
    for (const char* data : {R"("text")", "1", "null", "[]"}) {
        INFO(data);
        REQUIRE_FALSE(check(schema, data).is_valid());
    }
}

TEST_CASE("not inverts its schema", "[validate][not]") {
    REQUIRE(check(R"({"not": {"type": "null"}})", "0").is_valid());
    auto result = check(R"({"not": {"type": "null"}})", "null");
    REQUIRE(result.failure_count() == 1);
    REQUIRE(result.failures[0].kind == FailureKind::Not);
    REQUIRE(schema_location(result.failures[0].schema_path) == "#/not");

    REQUIRE(check(R"({"not": {"not": {"type": "string"}}})", R"("s")").is_valid());
}

TEST_CASE("combinators apply under properties", "[validate][anyof]") {
    auto result = check(R"({"properties": {"v": {"anyOf": [{"type": "string"}, {"type": "null"}]}}})",
                        R"({"v": 3})");
    REQUIRE(result.failure_count() == 1);
    REQUIRE(instance_pointer(result.failures[0].instance_path) == "/v");

    std::string text = render_text(result);
    REQUIRE(text.find("- /v: value does not match any of the 2 alternatives in anyOf") != std::string::npos);
    REQUIRE(text.find("because:") != std::string::npos);
}
