#pragma once

#include <cstddef>
#include <memory>
#include <string>

namespace av {

class FormatRegistry;
class EvaluatorRegistry;

// Message direction, for OpenAPI readOnly/writeOnly.
enum class Direction { Any, Request, Response };

// Largest accepted ValidationOptions::max_depth.
constexpr std::size_t kMaxReferenceDepth = 1000;
// Nested node evaluations allowed at once, references included.
constexpr std::size_t kMaxEvaluationDepth = 2 * kMaxReferenceDepth;

std::string direction_name(Direction direction);
// "request", "response" or "any". Throws std::invalid_argument.
Direction direction_from_name(const std::string& name);

struct ValidationOptions {
    Direction direction = Direction::Any;
    // Pointer of the schema to validate against.
    std::string schema_root = "#";
    // Longest chain of references followed at once, at most kMaxReferenceDepth.
    std::size_t max_depth = 100;
    // Node evaluations per validate() call before LimitExceeded.
    std::size_t max_steps = 1000000;
    // Built-in registries are used when these are null.
    std::shared_ptr<const FormatRegistry> formats;
    std::shared_ptr<const EvaluatorRegistry> evaluators;
};

}  // namespace av
