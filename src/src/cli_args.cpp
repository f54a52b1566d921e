#include <av/cli_args.h>
#include <av/cli_utils.h>

#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>

namespace av {

namespace {
    std::size_t parse_limit(const std::string& option, const std::string& value) {
        bool ok = !value.empty();
        for (char c : value) ok = ok && std::isdigit(static_cast<unsigned char>(c));
        std::size_t n = 0;
        if (ok) {
            try {
                n = static_cast<std::size_t>(std::stoull(value));
            } catch (const std::out_of_range&) {
                ok = false;
            }
        }
        if (!ok || n == 0) throw std::invalid_argument(option + " expects a positive integer, got '" + value + "'");
        return n;
    }
}  // namespace

CliArgs::CliArgs(int argc, const char* argv[]) {
    static const std::vector<std::string> valid_options = {"--help",       "-h",        "--data_type", "--schema_type",
                                                           "--dialect",    "--message", "--schema_root",
                                                           "--format",     "--max_depth", "--max_steps",
                                                           "--log_level"};

    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            help_ = true;
            return;
        }
        if (arg.size() < 2 || arg[0] != '-') {
            positional.push_back(arg);
            continue;
        }

        // --name=value or --name value
        std::string name = arg;
        std::string value;
        bool inline_value = false;
        size_t eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
            name = arg.substr(0, eq);
            value = arg.substr(eq + 1);
            inline_value = true;
        }
        auto take_value = [&]() {
            if (inline_value) return;
            if (i + 1 >= argc) throw std::invalid_argument(name + " requires a value");
            value = argv[++i];
        };

        if (name == "--data_type" || name == "--schema_type") {
            take_value();
            Format f;
            try {
                f = format_from_name(value);
            } catch (const std::invalid_argument&) {
                throw std::invalid_argument(cli_utils::invalid_choice_error(name, value, {"json", "yaml"}));
            }
            (name == "--data_type" ? dataType_ : schemaType_) = f;
        } else if (name == "--dialect") {
            take_value();
            try {
                dialect_ = dialect_from_name(value);
            } catch (const std::invalid_argument&) {
                throw std::invalid_argument(cli_utils::invalid_choice_error(name, value, {"jsonschema", "openapi"}));
            }
        } else if (name == "--message") {
            take_value();
            if (value != "request" && value != "response")
                throw std::invalid_argument(cli_utils::invalid_choice_error(name, value, {"request", "response"}));
            direction_ = direction_from_name(value);
        } else if (name == "--schema_root") {
            take_value();
            if (!value.empty() && value[0] == '/') value = "#" + value;
            schemaRoot_ = value;
        } else if (name == "--format") {
            take_value();
            if (value == "text")
                output_ = Output::Text;
            else if (value == "json")
                output_ = Output::Json;
            else
                throw std::invalid_argument(cli_utils::invalid_choice_error(name, value, {"text", "json"}));
        } else if (name == "--max_depth") {
            take_value();
            maxDepth_ = parse_limit(name, value);
            if (maxDepth_ > kMaxReferenceDepth)
                throw std::invalid_argument(name + " must not exceed " + std::to_string(kMaxReferenceDepth) +
                                            ", got '" + value + "'");
        } else if (name == "--max_steps") {
            take_value();
            maxSteps_ = parse_limit(name, value);
        } else if (name == "--log_level") {
            take_value();
            try {
                logLevel_ = log::level_from_name(value);
            } catch (const std::invalid_argument&) {
                throw std::invalid_argument(cli_utils::invalid_choice_error(
                    name, value, {"DEBUG", "INFO", "WARNING", "ERROR", "CRITICAL"}));
            }
        } else {
            throw std::invalid_argument(cli_utils::unknown_argument_error(name, valid_options));
        }
    }

    if (positional.size() < 2)
        throw std::invalid_argument(positional.empty() ? "missing <data_file> and <schema_file>"
                                                       : "missing <schema_file>");
    if (positional.size() > 2) throw std::invalid_argument("unexpected extra argument '" + positional[2] + "'");
    dataFile_ = positional[0];
    schemaFile_ = positional[1];
}

ValidationOptions CliArgs::validationOptions() const {
    ValidationOptions options;
    options.direction = direction_;
    options.schema_root = schemaRoot_;
    options.max_depth = maxDepth_;
    options.max_steps = maxSteps_;
    return options;
}

std::string CliArgs::usage() {
    return "apival - Validate API request/response data against a JSON Schema or OpenAPI schema\n"
           "\n"
           "USAGE:\n"
           "  apival <data_file> <schema_file> [OPTIONS]\n"
           "\n"
           "ARGUMENTS:\n"
           "  <data_file>      Request/response data to validate (JSON or YAML)\n"
           "  <schema_file>    Schema or OpenAPI document (JSON or YAML)\n"
           "\n"
           "OPTIONS:\n"
           "  --data_type <json|yaml>          Data file syntax (inferred from the extension if omitted)\n"
           "  --schema_type <json|yaml>        Schema file syntax (inferred from the extension if omitted)\n"
           "  --dialect <jsonschema|openapi>   Keyword interpretation (default: jsonschema)\n"
           "  --message <request|response>     Message direction for readOnly/writeOnly (openapi)\n"
           "  --schema_root <pointer>          Validate against a sub-schema, e.g. #/components/schemas/Pet\n"
           "  --format <text|json>             Report format (default: text)\n"
           "  --max_depth <n>                  Maximum chain of $ref followed at once (default: 100, at most 1000)\n"
           "  --max_steps <n>                  Maximum node evaluations (default: 1000000)\n"
           "  --log_level <LEVEL>              DEBUG, INFO, WARNING, ERROR or CRITICAL (default: INFO)\n"
           "  -h, --help                       Show this help message\n"
           "\n"
           "EXIT STATUS:\n"
           "  0  the data is valid\n"
           "  1  the data is invalid\n"
           "  2  unreadable or malformed input, bad command line, or a limit was exceeded\n"
           "\n"
           "ENVIRONMENT:\n"
           "  AV_LOG_LEVEL       Default log level\n"
           "  AV_VALIDATE_DEBUG  Trace every schema node evaluation on stderr\n";
}

}  // namespace av
