#pragma once

#include <av/value.h>
#include <string>

namespace av {

enum class Format { Auto, Json, Yaml };

// "json", "yaml" or "yml" (case-insensitive). Throws std::invalid_argument.
Format format_from_name(const std::string& name);

// Infer the format from a file extension; Format::Auto when unknown.
Format format_from_path(const std::string& path);

std::string format_name(Format format);

// Parse text in the given format. Format::Auto tries JSON first, then YAML;
// if both fail the ParseError carries both messages.
Value parse_document(const std::string& text, Format format = Format::Auto);

// The same readers applied to data under validation.
Value parse_instance(const std::string& raw, Format format = Format::Auto);

// Whole file as a string. Throws av::Error when the file cannot be read.
std::string read_file(const std::string& path);

}  // namespace av
