#include <catch2/catch_all.hpp>
#include <av/json.h>
#include <av/parse.h>
#include <av/validate.h>
#include <filesystem>

namespace fs = std::filesystem;
using namespace av;

namespace {
    const char* kPetApi = R"(
openapi: 3.0.3
info:
  title: Pets
  version: 1.0.0
paths:
  /pets/{id}:
    get:
      responses:
        '200':
          description: a pet
          content:
            application/json:
              schema:
                $ref: '#/components/schemas/Pet'
components:
  schemas:
    Id:
      type: integer
      format: int64
      readOnly: true
    Pet:
      type: object
      required: [name]
      properties:
        id:
          $ref: '#/components/schemas/Id'
        name:
          type: string
        tag:
          type: string
          nullable: true
        password:
          type: string
          writeOnly: true
        age:
          type: integer
          format: int32
)";

    SchemaDocument pet_api() { return SchemaDocument::parse(kPetApi, Format::Yaml, SchemaOptions{Dialect::OpenApi}); }

    ValidationOptions at_pet(Direction direction = Direction::Any) {
        ValidationOptions options;
        options.schema_root = "#/components/schemas/Pet";
        options.direction = direction;
        return options;
    }
}  // namespace

TEST_CASE("component schemas can be validation roots", "[validate][openapi]") {
    auto doc = pet_api();
    REQUIRE(validate(doc, parse_json(R"({"id": 1, "name": "Rex"})"), at_pet()).is_valid());

    auto result = validate(doc, parse_json(R"({"id": "one"})"), at_pet());
    REQUIRE(result.failure_count() == 2);
    REQUIRE(result.failures[0].kind == FailureKind::Required);
    REQUIRE(result.failures[1].kind == FailureKind::TypeMismatch);
    REQUIRE(schema_location(result.failures[1].schema_path) ==
            "#/components/schemas/Pet/properties/id/$ref/#/components/schemas/Id/type");

    ValidationOptions response;
    response.schema_root = "#/paths/~1pets~1{id}/get/responses/200/content/application~1json/schema";
    REQUIRE(validate(doc, parse_json(R"({"name": "Rex"})"), response).is_valid());
    REQUIRE_FALSE(validate(doc, parse_json(R"({"name": 5})"), response).is_valid());
}

TEST_CASE("nullable admits null only in the OpenAPI dialect", "[validate][openapi]") {
    auto doc = pet_api();
    REQUIRE(validate(doc, parse_json(R"({"name": "Rex", "tag": null})"), at_pet()).is_valid());
    REQUIRE_FALSE(validate(doc, parse_json(R"({"name": null})"), at_pet()).is_valid());

    SchemaDocument plain(parse_json(R"({"type": "string", "nullable": true})"));
    REQUIRE_FALSE(validate(plain, Value()).is_valid());
}

TEST_CASE("readOnly and writeOnly depend on the message direction", "[validate][openapi]") {
    auto doc = pet_api();
    auto data = parse_json(R"({"id": 7, "name": "Rex", "password": "hunter2"})");

    REQUIRE(validate(doc, data, at_pet()).is_valid());

    auto request = validate(doc, data, at_pet(Direction::Request));
    REQUIRE(request.failure_count() == 1);
    REQUIRE(request.failures[0].kind == FailureKind::ReadOnly);
    REQUIRE(instance_pointer(request.failures[0].instance_path) == "/id");

    auto response = validate(doc, data, at_pet(Direction::Response));
    REQUIRE(response.failure_count() == 1);
    REQUIRE(response.failures[0].kind == FailureKind::WriteOnly);
    REQUIRE(instance_pointer(response.failures[0].instance_path) == "/password");
}

TEST_CASE("siblings of $ref are ignored in the OpenAPI dialect", "[validate][openapi][ref]") {
    const char* schema = R"({
        "definitions": {"s": {"type": "string"}},
        "properties": {"v": {"$ref": "#/definitions/s", "maxLength": 2}}
    })";
    auto data = parse_json(R"({"v": "long text"})");

    SchemaDocument openapi(parse_json(schema), SchemaOptions{Dialect::OpenApi});
    REQUIRE(validate(openapi, data).is_valid());

    SchemaDocument jsonschema(parse_json(schema));
    auto result = validate(jsonschema, data);
    REQUIRE(result.failure_count() == 1);
    REQUIRE(result.failures[0].kind == FailureKind::MaxLength);
}

TEST_CASE("OpenAPI numeric formats", "[validate][openapi][format]") {
    auto doc = pet_api();
    REQUIRE(validate(doc, parse_json(R"({"name": "Rex", "age": 12})"), at_pet()).is_valid());
    auto result = validate(doc, parse_json(R"({"name": "Rex", "age": 3000000000})"), at_pet());
    REQUIRE(result.failure_count() == 1);
    REQUIRE(result.failures[0].kind == FailureKind::Format);
    REQUIRE(instance_pointer(result.failures[0].instance_path) == "/age");
}

TEST_CASE("OpenAPI fixture file", "[validate][openapi]") {
    fs::path p = fs::path(EXAMPLES_DIR) / "petstore.openapi.yaml";
    auto doc = SchemaDocument::parse(read_file(p.string()), Format::Yaml, SchemaOptions{Dialect::OpenApi});
    ValidationOptions options;
    options.schema_root = "#/components/schemas/NewPet";
    options.direction = Direction::Request;
    REQUIRE(validate(doc, parse_json(R"({"name": "Rex", "tag": null})"), options).is_valid());
    REQUIRE_FALSE(validate(doc, parse_json(R"({"tag": "dog"})"), options).is_valid());
}
