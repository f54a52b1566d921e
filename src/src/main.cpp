#include <iostream>
#include <optional>
#include <string>

#include <av/cli_args.h>
#include <av/errors.h>
#include <av/log.h>
#include <av/parse.h>
#include <av/report.h>
#include <av/schema.h>
#include <av/validate.h>

namespace {
    av::Format resolve_format(const std::optional<av::Format>& explicit_type, const std::string& path) {
        if (explicit_type) return *explicit_type;
        av::Format f = av::format_from_path(path);
        if (f == av::Format::Auto)
            av::log::debug("cannot infer the type of '" + path + "' from its extension, trying JSON then YAML");
        return f;
    }
}  // namespace

int main(int argc, char** argv) {
    av::log::init_from_env();

    std::optional<av::CliArgs> args;
    try {
        args.emplace(argc, const_cast<const char**>(argv));
    } catch (const std::invalid_argument& e) {
        std::cerr << "error: " << e.what() << "\n";
        std::cerr << "Run 'apival --help' for usage.\n";
        return 2;
    }

    if (args->helpRequested()) {
        std::cout << av::CliArgs::usage();
        return 0;
    }
    if (auto level = args->getLogLevel()) av::log::set_level(*level);

    av::Value data;
    std::optional<av::SchemaDocument> schema;
    try {
        const std::string& data_path = args->getDataFile();
        av::log::debug("loading data from " + data_path);
        data = av::parse_instance(av::read_file(data_path), resolve_format(args->getDataType(), data_path));

        const std::string& schema_path = args->getSchemaFile();
        av::log::debug("loading schema from " + schema_path);
        av::SchemaOptions schema_options;
        schema_options.dialect = args->getDialect();
        schema.emplace(av::SchemaDocument::parse(av::read_file(schema_path),
                                                 resolve_format(args->getSchemaType(), schema_path), schema_options));
    } catch (const av::ParseError& e) {
        av::log::error(std::string("Error decoding input: ") + e.what());
        std::cout << "Error: " << e.what() << "\n";
        return 2;
    } catch (const av::Error& e) {
        av::log::error(e.what());
        std::cout << "Error: " << e.what() << "\n";
        return 2;
    }

    av::ValidationResult result;
    try {
        av::Validator validator(*schema, args->validationOptions());
        result = validator.validate(data);
    } catch (const av::Error& e) {
        // includes LimitExceeded and a schema root that names no schema
        av::log::error(e.what());
        std::cout << "Error: " << e.what() << "\n";
        return 2;
    }

    if (result.is_valid())
        av::log::info("Data validation successful.");
    else
        av::log::error("Data validation failed: " + std::to_string(result.failure_count()) + " failure(s)");

    if (args->getOutput() == av::CliArgs::Output::Json)
        std::cout << av::render_json(result);
    else
        std::cout << av::render_text(result);
    return result.is_valid() ? 0 : 1;
}
