#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <av/failure.h>
#include <av/formats.h>
#include <av/options.h>
#include <av/resolver.h>
#include <av/schema.h>

namespace av {

class EvaluatorRegistry;

// Everything an evaluator may consult during one validate() call.
struct EvalContext {
    const SchemaDocument& doc;
    const ValidationOptions& options;
    const ReferenceResolver& resolver;
    const EvaluatorRegistry& evaluators;
    const FormatRegistry& formats;
    ResolutionContext& resolution;
    // AV_VALIDATE_DEBUG: trace every node evaluation on stderr
    bool trace = false;
};

using FailureList = std::vector<FailureRecord>;

// Checks the keywords of one facet of `node`. An empty result is a pass.
// Semantic violations are returned as records, never thrown.
using Evaluator = std::function<FailureList(const SchemaNode& node, const Value& instance,
                                            const InstancePath& instance_path, const SchemaPath& schema_path,
                                            EvalContext& ctx)>;

class EvaluatorRegistry {
  public:
    EvaluatorRegistry() = default;

    static EvaluatorRegistry with_builtins();

    // Replaces the evaluator of a facet.
    void set(Facet facet, Evaluator evaluator);
    const Evaluator* find(Facet facet) const;

  private:
    std::map<Facet, Evaluator> table_;
};

// Counts one step, then runs the evaluator of every facet of the node in
// declaration order. Throws LimitExceeded when the step budget runs out.
FailureList evaluate_node(NodeId id, const Value& instance, const InstancePath& instance_path,
                          const SchemaPath& schema_path, EvalContext& ctx);

FailureList evaluate_reference(const SchemaNode& node, const Value& instance, const InstancePath& instance_path,
                               const SchemaPath& schema_path, EvalContext& ctx);
FailureList evaluate_type(const SchemaNode& node, const Value& instance, const InstancePath& instance_path,
                          const SchemaPath& schema_path, EvalContext& ctx);
FailureList evaluate_enum(const SchemaNode& node, const Value& instance, const InstancePath& instance_path,
                          const SchemaPath& schema_path, EvalContext& ctx);
FailureList evaluate_numeric(const SchemaNode& node, const Value& instance, const InstancePath& instance_path,
                             const SchemaPath& schema_path, EvalContext& ctx);
FailureList evaluate_string(const SchemaNode& node, const Value& instance, const InstancePath& instance_path,
                            const SchemaPath& schema_path, EvalContext& ctx);
FailureList evaluate_format(const SchemaNode& node, const Value& instance, const InstancePath& instance_path,
                            const SchemaPath& schema_path, EvalContext& ctx);
FailureList evaluate_composite(const SchemaNode& node, const Value& instance, const InstancePath& instance_path,
                               const SchemaPath& schema_path, EvalContext& ctx);
FailureList evaluate_object(const SchemaNode& node, const Value& instance, const InstancePath& instance_path,
                            const SchemaPath& schema_path, EvalContext& ctx);
FailureList evaluate_array(const SchemaNode& node, const Value& instance, const InstancePath& instance_path,
                           const SchemaPath& schema_path, EvalContext& ctx);
FailureList evaluate_boolean(const SchemaNode& node, const Value& instance, const InstancePath& instance_path,
                             const SchemaPath& schema_path, EvalContext& ctx);

// Helpers shared by the evaluators.
FailureRecord make_failure(FailureKind kind, const InstancePath& instance_path, const SchemaPath& schema_path,
                           std::string message, Value details = Value::object());
InstancePath with_key(const InstancePath& path, const std::string& key);
InstancePath with_index(const InstancePath& path, std::size_t index);
SchemaPath extend(const SchemaPath& path, const std::string& segment);
SchemaPath extend(const SchemaPath& path, const std::string& keyword, const std::string& segment);
void append(FailureList& out, FailureList more);
// Reads a non-negative integral count keyword (minItems, maxLength, ...).
// Counts beyond the range of size_t saturate. False when `v` is not a count.
bool count_limit(const Value& v, std::size_t& out);
// Compact JSON of a value, cut to `maxlen` characters.
std::string preview(const Value& v, std::size_t maxlen = 80);

}  // namespace av
