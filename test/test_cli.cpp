#include <catch2/catch_all.hpp>
#include <av/json.h>
#include <array>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <sys/wait.h>

// Helper to run a command and capture its output
static std::pair<int, std::string> run_command(const std::string& cmd) {
    std::array<char, 128> buffer;
    std::string result;

    // Redirect stderr to stdout so we capture both
    std::string full_cmd = cmd + " 2>&1";
    FILE* pipe = popen(full_cmd.c_str(), "r");
    if (!pipe) {
        throw std::runtime_error("popen() failed!");
    }

    while (fgets(buffer.data(), buffer.size(), pipe) != nullptr) {
        result += buffer.data();
    }

    int exit_code = pclose(pipe);
    if (WIFEXITED(exit_code)) {
        exit_code = WEXITSTATUS(exit_code);
    }

    return {exit_code, result};
}

static std::string apival(const std::string& args) {
    return std::string("AV_LOG_LEVEL=WARNING ") + APIVAL_EXE + " " + args;
}

static std::string example(const std::string& name) { return std::string(EXAMPLES_DIR) + "/" + name; }

TEST_CASE("CLI responds to --help flag", "[cli][help]") {
    auto [exit_code, output] = run_command(apival("--help"));

    REQUIRE(exit_code == 0);
    REQUIRE(output.find("apival - Validate API request/response data") != std::string::npos);
    REQUIRE(output.find("USAGE:") != std::string::npos);
    REQUIRE(output.find("OPTIONS:") != std::string::npos);
}

TEST_CASE("valid data exits 0", "[cli]") {
    auto [exit_code, output] =
        run_command(apival(example("person.valid.json") + " " + example("person.schema.json")));
    REQUIRE(exit_code == 0);
    REQUIRE(output.find("Validation successful!") != std::string::npos);
}

TEST_CASE("YAML data and schema files", "[cli][yaml]") {
    auto [exit_code, output] =
        run_command(apival(example("person.valid.yaml") + " " + example("person.schema.yaml")));
    REQUIRE(exit_code == 0);
    REQUIRE(output.find("Validation successful!") != std::string::npos);
}

TEST_CASE("invalid data exits 1 and lists every failure", "[cli]") {
    auto [exit_code, output] =
        run_command(apival(example("person.invalid.json") + " " + example("person.schema.json")));
    REQUIRE(exit_code == 1);
    REQUIRE(output.find("Validation Error: 6 failures") != std::string::npos);
    REQUIRE(output.find("- root: missing required property 'name' [required]") != std::string::npos);
    REQUIRE(output.find("- /id: expected type 'integer' but found 'number'") != std::string::npos);
    REQUIRE(output.find("- /email:") != std::string::npos);
    REQUIRE(output.find("- /tags/1: item 1 duplicates item 0 [unique-items]") != std::string::npos);
    REQUIRE(output.find("- /address: missing required property 'city' [required]") != std::string::npos);
    REQUIRE(output.find("- /nickname: property 'nickname' is not allowed [additional-properties]") !=
            std::string::npos);
}

TEST_CASE("JSON report", "[cli][json]") {
    auto [exit_code, output] = run_command(apival(example("person.invalid.json") + " " +
                                                  example("person.schema.json") +
                                                  " --format json --log_level CRITICAL"));
    REQUIRE(exit_code == 1);
    av::Value report = av::parse_json(output);
    REQUIRE_FALSE(report.at("valid").asBool());
    REQUIRE(report.at("failures").size() == 6);
    REQUIRE(report.at("failures").at(1).at("instance_path").asString() == "/id");
    REQUIRE(report.at("failures").at(1).at("schema_path").asString() == "#/properties/id/type");
}

TEST_CASE("OpenAPI component as schema root", "[cli][openapi]") {
    std::string base = example("new_pet.request.json") + " " + example("petstore.openapi.yaml") +
                       " --dialect openapi --schema_root /components/schemas/NewPet";

    auto [any_code, any_output] = run_command(apival(base));
    REQUIRE(any_code == 0);

    auto [request_code, request_output] = run_command(apival(base + " --message request"));
    REQUIRE(request_code == 1);
    REQUIRE(request_output.find("property 'id' is read-only") != std::string::npos);
}

TEST_CASE("malformed input exits 2", "[cli][errors]") {
    auto [exit_code, output] = run_command(apival(example("malformed.json") + " " + example("person.schema.json")));
    REQUIRE(exit_code == 2);
    REQUIRE(output.find("Error: JSON parse error") != std::string::npos);
    REQUIRE(output.find("trailing ','") != std::string::npos);
}

TEST_CASE("missing files exit 2", "[cli][errors]") {
    auto [exit_code, output] = run_command(apival("/no/such/data.json " + example("person.schema.json")));
    REQUIRE(exit_code == 2);
    REQUIRE(output.find("File not found: /no/such/data.json") != std::string::npos);
}

TEST_CASE("a bad schema root exits 2", "[cli][errors]") {
    auto [exit_code, output] = run_command(
        apival(example("person.valid.json") + " " + example("person.schema.json") + " --schema_root /nowhere"));
    REQUIRE(exit_code == 2);
    REQUIRE(output.find("does not point to a schema") != std::string::npos);
}

TEST_CASE("command line errors exit 2 with a hint", "[cli][errors]") {
    auto [exit_code, output] = run_command(apival(example("person.valid.json") + " " +
                                                  example("person.schema.json") + " --dialct openapi"));
    REQUIRE(exit_code == 2);
    REQUIRE(output.find("Did you mean '--dialect'?") != std::string::npos);
    REQUIRE(output.find("Run 'apival --help' for usage.") != std::string::npos);

    auto [missing_code, missing_output] = run_command(apival(""));
    REQUIRE(missing_code == 2);
    REQUIRE(missing_output.find("missing <data_file> and <schema_file>") != std::string::npos);
}

TEST_CASE("step limit exits 2", "[cli][limit]") {
    auto [exit_code, output] = run_command(
        apival(example("person.valid.json") + " " + example("person.schema.json") + " --max_steps 3"));
    REQUIRE(exit_code == 2);
    REQUIRE(output.find("validation step limit of 3 exceeded") != std::string::npos);
}
