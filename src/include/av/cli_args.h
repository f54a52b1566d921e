#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include <av/log.h>
#include <av/options.h>
#include <av/parse.h>
#include <av/schema.h>

namespace av {

// Command line of the apival tool:
//   apival <data_file> <schema_file> [options]
// Throws std::invalid_argument for unknown options, bad values and missing
// operands.
class CliArgs {
  public:
    enum class Output { Text, Json };

    CliArgs(int argc, const char* argv[]);

    bool helpRequested() const { return help_; }
    const std::string& getDataFile() const { return dataFile_; }
    const std::string& getSchemaFile() const { return schemaFile_; }
    // Explicit --data_type / --schema_type, if given.
    std::optional<Format> getDataType() const { return dataType_; }
    std::optional<Format> getSchemaType() const { return schemaType_; }
    Dialect getDialect() const { return dialect_; }
    Direction getDirection() const { return direction_; }
    const std::string& getSchemaRoot() const { return schemaRoot_; }
    Output getOutput() const { return output_; }
    std::size_t getMaxDepth() const { return maxDepth_; }
    std::size_t getMaxSteps() const { return maxSteps_; }
    std::optional<log::Level> getLogLevel() const { return logLevel_; }

    // Options for the engine, from the parsed flags.
    ValidationOptions validationOptions() const;

    static std::string usage();

  private:
    bool help_ = false;
    std::string dataFile_;
    std::string schemaFile_;
    std::optional<Format> dataType_;
    std::optional<Format> schemaType_;
    Dialect dialect_ = Dialect::JsonSchema;
    Direction direction_ = Direction::Any;
    std::string schemaRoot_ = "#";
    Output output_ = Output::Text;
    std::size_t maxDepth_ = 100;
    std::size_t maxSteps_ = 1000000;
    std::optional<log::Level> logLevel_;
};

}  // namespace av
