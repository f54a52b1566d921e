#include <av/evaluators.h>
#include <av/log.h>

namespace av {

FailureList evaluate_reference(const SchemaNode& node, const Value& instance, const InstancePath& instance_path,
                               const SchemaPath& schema_path, EvalContext& ctx) {
    SchemaPath ref_path = extend(schema_path, "$ref");
    Resolution r = ctx.resolver.resolve(node.ref, ctx.resolution);
    if (!r.resolved()) {
        Value details = Value::object();
        details["ref"] = node.ref;
        details["reason"] = r.error;
        return {make_failure(FailureKind::UnresolvedReference, instance_path, ref_path,
                             "unresolved $ref '" + node.ref + "': " + r.error, std::move(details))};
    }

    if (ctx.resolution.chain.size() >= ctx.options.max_depth) {
        Value details = Value::object();
        details["ref"] = node.ref;
        details["max_depth"] = static_cast<int64_t>(ctx.options.max_depth);
        // the target is already being evaluated: a cycle rather than a long chain
        details["recursive"] = r.recursive;
        log::debug(std::string(r.recursive ? "reference cycle" : "reference chain") + " cut at depth " +
                   std::to_string(ctx.options.max_depth) + " at '" + node.pointer + "' following '" + node.ref + "'");
        return {make_failure(FailureKind::DepthExceeded, instance_path, ref_path,
                             "maximum reference depth of " + std::to_string(ctx.options.max_depth) +
                                 " exceeded following '" + node.ref + "'",
                             std::move(details))};
    }

    const std::string& target = ctx.doc.node(r.node).pointer;
    ChainGuard guard(ctx.resolution, target);
    return evaluate_node(r.node, instance, instance_path, extend(ref_path, target), ctx);
}

FailureList evaluate_boolean(const SchemaNode& node, const Value& instance, const InstancePath& instance_path,
                             const SchemaPath& schema_path, EvalContext&) {
    if (node.raw == nullptr || !node.raw->isBool() || node.raw->asBool()) return {};
    Value details = Value::object();
    details["actual"] = instance.typeName();
    return {make_failure(FailureKind::FalseSchema, instance_path, schema_path, "no value is allowed here (schema is false)",
                         std::move(details))};
}

}  // namespace av
