#include <av/evaluators.h>
#include <av/errors.h>
#include <av/log.h>

#include <iostream>
#include <iterator>
#include <limits>

namespace av {

namespace {
    struct NestingGuard {
        ResolutionContext& ctx;
        explicit NestingGuard(ResolutionContext& c) : ctx(c) { ++ctx.nesting; }
        ~NestingGuard() { --ctx.nesting; }
        NestingGuard(const NestingGuard&) = delete;
        NestingGuard& operator=(const NestingGuard&) = delete;
    };
}  // namespace

EvaluatorRegistry EvaluatorRegistry::with_builtins() {
    EvaluatorRegistry r;
    r.set(Facet::Reference, &evaluate_reference);
    r.set(Facet::Type, &evaluate_type);
    r.set(Facet::Enum, &evaluate_enum);
    r.set(Facet::Numeric, &evaluate_numeric);
    r.set(Facet::String, &evaluate_string);
    r.set(Facet::Format, &evaluate_format);
    r.set(Facet::Composite, &evaluate_composite);
    r.set(Facet::Object, &evaluate_object);
    r.set(Facet::Array, &evaluate_array);
    r.set(Facet::Boolean, &evaluate_boolean);
    return r;
}

void EvaluatorRegistry::set(Facet facet, Evaluator evaluator) { table_[facet] = std::move(evaluator); }

const Evaluator* EvaluatorRegistry::find(Facet facet) const {
    auto it = table_.find(facet);
    return it == table_.end() ? nullptr : &it->second;
}

FailureList evaluate_node(NodeId id, const Value& instance, const InstancePath& instance_path,
                          const SchemaPath& schema_path, EvalContext& ctx) {
    std::size_t steps = ++ctx.resolution.steps;
    if (steps > ctx.options.max_steps)
        throw LimitExceeded("validation step limit of " + std::to_string(ctx.options.max_steps) + " exceeded", steps);

    const SchemaNode& node = ctx.doc.node(id);
    if (ctx.resolution.nesting >= kMaxEvaluationDepth) {
        Value details = Value::object();
        details["max_nesting"] = static_cast<int64_t>(kMaxEvaluationDepth);
        log::debug("evaluation depth limit reached at '" + node.pointer + "'");
        return {make_failure(FailureKind::DepthExceeded, instance_path, schema_path,
                             "maximum evaluation depth of " + std::to_string(kMaxEvaluationDepth) + " exceeded",
                             std::move(details))};
    }
    NestingGuard nesting(ctx.resolution);

    if (ctx.trace) {
        std::cerr << "validate_node enter: node='" << node.pointer << "' kind=" << schema_kind_name(node.kind)
                  << " path='" << display_path(instance_path) << "' data=" << preview(instance) << " facets={";
        bool first = true;
        for (auto f : node.facets) {
            if (!first) std::cerr << ",";
            first = false;
            std::cerr << facet_name(f);
        }
        std::cerr << "}\n";
    }

    FailureList out;
    // OpenAPI 3.0: a $ref replaces the whole schema object
    if (ctx.doc.dialect() == Dialect::OpenApi && node.has(Facet::Reference)) {
        if (const Evaluator* fn = ctx.evaluators.find(Facet::Reference))
            append(out, (*fn)(node, instance, instance_path, schema_path, ctx));
        return out;
    }
    for (auto facet : node.facets) {
        if (const Evaluator* fn = ctx.evaluators.find(facet))
            append(out, (*fn)(node, instance, instance_path, schema_path, ctx));
    }
    return out;
}

FailureRecord make_failure(FailureKind kind, const InstancePath& instance_path, const SchemaPath& schema_path,
                           std::string message, Value details) {
    FailureRecord r;
    r.kind = kind;
    r.instance_path = instance_path;
    r.schema_path = schema_path;
    r.message = std::move(message);
    r.details = std::move(details);
    return r;
}

InstancePath with_key(const InstancePath& path, const std::string& key) {
    InstancePath out = path;
    out.push_back(PathSegment::makeKey(key));
    return out;
}

InstancePath with_index(const InstancePath& path, std::size_t index) {
    InstancePath out = path;
    out.push_back(PathSegment::makeIndex(index));
    return out;
}

SchemaPath extend(const SchemaPath& path, const std::string& segment) {
    SchemaPath out = path;
    out.push_back(segment);
    return out;
}

SchemaPath extend(const SchemaPath& path, const std::string& keyword, const std::string& segment) {
    SchemaPath out = path;
    out.push_back(keyword);
    out.push_back(segment);
    return out;
}

void append(FailureList& out, FailureList more) {
    if (out.empty()) {
        out = std::move(more);
        return;
    }
    out.insert(out.end(), std::make_move_iterator(more.begin()), std::make_move_iterator(more.end()));
}

bool count_limit(const Value& v, std::size_t& out) {
    if (!v.isIntegral() || v.asDouble() < 0) return false;
    if (v.isInt()) {
        out = static_cast<std::size_t>(v.asInt());
        return true;
    }
    double d = v.asDouble();
    constexpr std::size_t kMax = std::numeric_limits<std::size_t>::max();
    out = d >= static_cast<double>(kMax) ? kMax : static_cast<std::size_t>(d);
    return true;
}

std::string preview(const Value& v, std::size_t maxlen) {
    std::string s = v.dump();
    if (s.size() > maxlen) s = s.substr(0, maxlen - 3) + "...";
    return s;
}

}  // namespace av
