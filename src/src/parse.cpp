#include <av/parse.h>
#include <av/errors.h>
#include <av/json.h>
#include <av/log.h>
#include <av/yaml.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace av {

namespace {
    std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }
}  // namespace

Format format_from_name(const std::string& name) {
    std::string n = lower(name);
    if (n == "json") return Format::Json;
    if (n == "yaml" || n == "yml") return Format::Yaml;
    throw std::invalid_argument("unsupported file type '" + name + "'; must be json or yaml/yml");
}

Format format_from_path(const std::string& path) {
    size_t slash = path.find_last_of("/\\");
    size_t dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) return Format::Auto;
    std::string ext = lower(path.substr(dot + 1));
    if (ext == "json") return Format::Json;
    if (ext == "yaml" || ext == "yml") return Format::Yaml;
    return Format::Auto;
}

std::string format_name(Format format) {
    switch (format) {
        case Format::Json:
            return "json";
        case Format::Yaml:
            return "yaml";
        case Format::Auto:
            return "auto";
    }
    return "auto";
}

Value parse_document(const std::string& text, Format format) {
    if (format == Format::Json) return parse_json(text);
    if (format == Format::Yaml) return parse_yaml(text);

    // JSON first: every JSON document is also YAML, but the JSON reader
    // gives better messages and number handling.
    std::string json_error;
    try {
        return parse_json(text);
    } catch (const ParseError& e) {
        json_error = e.what();
        log::debug("content is not JSON, trying YAML");
    }
    try {
        return parse_yaml(text);
    } catch (const ParseError& e) {
        throw ParseError("could not parse as JSON or YAML:\n" + json_error + "\n" + e.what(), e.line, e.column);
    }
}

Value parse_instance(const std::string& raw, Format format) { return parse_document(raw, format); }

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw Error("File not found: " + path);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) throw Error("could not read file: " + path);
    return content;
}

}  // namespace av
