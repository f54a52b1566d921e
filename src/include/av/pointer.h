// JSON pointer helpers for local references ("#", "#/a/b/0").
#pragma once

#include <string>
#include <vector>

#include <av/value.h>

namespace av {
namespace pointer {

// ~ -> ~0, / -> ~1
std::string escape(const std::string& token);
// ~1 -> /, ~0 -> ~. Throws av::Error on a dangling or unknown escape.
std::string unescape(const std::string& token);
std::string percent_decode(const std::string& s);

// A reference is local when it is a fragment of the current document.
bool is_local(const std::string& ref);

// Split a local reference into unescaped tokens. "#" and "" are the root.
// Throws av::Error for non-local references and plain-name fragments.
std::vector<std::string> split(const std::string& ref);

// Canonical form: "#" for the root, "#/a/b" otherwise.
std::string join(const std::vector<std::string>& tokens);
std::string append(const std::string& pointer, const std::string& token);

// Canonical form of any local reference ("#/a%20b" -> "#/a b").
std::string normalize(const std::string& ref);

// Walk tokens from root. Array positions must be decimal indices.
// Returns nullptr when a segment is missing.
const Value* walk(const Value& root, const std::vector<std::string>& tokens);

}  // namespace pointer
}  // namespace av
