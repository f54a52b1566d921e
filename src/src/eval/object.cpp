#include <av/evaluators.h>
#include <av/pointer.h>

#include <regex>
#include <set>

namespace av {

namespace {
    bool matches_pattern_property(const SchemaNode& node, const std::string& key) {
        for (auto const& pp : node.pattern_properties)
            if (std::regex_search(key, pp.second)) return true;
        return false;
    }

    // The keyword mapping of a property schema, following one $ref.
    const Value* property_schema(const SchemaNode& node, const std::string& name, EvalContext& ctx) {
        NodeId id = ctx.doc.child(node, "properties/" + pointer::escape(name));
        if (id == kNoNode) return nullptr;
        const SchemaNode& prop = ctx.doc.node(id);
        if (prop.has(Facet::Reference)) {
            Resolution r = ctx.resolver.resolve(prop.ref, ctx.resolution);
            if (r.resolved()) return ctx.doc.node(r.node).raw;
        }
        return prop.raw;
    }

    bool declared_true(const Value* schema, const char* keyword) {
        if (schema == nullptr || !schema->isObject()) return false;
        const Value* v = schema->find(keyword);
        return v != nullptr && v->isBool() && v->asBool();
    }

}  // namespace

FailureList evaluate_object(const SchemaNode& node, const Value& instance, const InstancePath& instance_path,
                            const SchemaPath& schema_path, EvalContext& ctx) {
    if (!instance.isObject()) return {};
    FailureList out;
    const Value* properties = node.keyword("properties");

    for (auto const& m : node.raw->items()) {
        const std::string& k = m.first;

        if (k == "required") {
            if (!m.second.isArray()) continue;
            for (auto const& name : m.second.asArray()) {
                if (!name.isString() || instance.has(name.asString())) continue;
                Value details = Value::object();
                details["property"] = name;
                out.push_back(make_failure(FailureKind::Required, instance_path, extend(schema_path, k),
                                           "missing required property '" + name.asString() + "'",
                                           std::move(details)));
            }

        } else if (k == "minProperties" || k == "maxProperties") {
            std::size_t limit = 0;
            if (!count_limit(m.second, limit)) continue;
            bool is_min = k == "minProperties";
            std::size_t n = instance.size();
            if (is_min ? n >= limit : n <= limit) continue;
            Value details = Value::object();
            details["limit"] = m.second;
            details["actual"] = static_cast<int64_t>(n);
            out.push_back(make_failure(is_min ? FailureKind::MinProperties : FailureKind::MaxProperties,
                                       instance_path, extend(schema_path, k),
                                       "object has " + std::to_string(n) + " properties, " +
                                           (is_min ? "fewer than minProperties " : "more than maxProperties ") +
                                           std::to_string(limit),
                                       std::move(details)));

        } else if (k == "properties") {
            for (auto const& p : m.second.items()) {
                const Value* value = instance.find(p.first);
                if (value == nullptr) continue;
                InstancePath ipath = with_key(instance_path, p.first);

                if (ctx.doc.dialect() == Dialect::OpenApi && ctx.options.direction != Direction::Any) {
                    const Value* schema = property_schema(node, p.first, ctx);
                    if (ctx.options.direction == Direction::Request && declared_true(schema, "readOnly")) {
                        out.push_back(make_failure(FailureKind::ReadOnly, ipath, extend(schema_path, k, p.first),
                                                   "property '" + p.first + "' is read-only and must not be sent in a request"));
                    } else if (ctx.options.direction == Direction::Response && declared_true(schema, "writeOnly")) {
                        out.push_back(make_failure(FailureKind::WriteOnly, ipath, extend(schema_path, k, p.first),
                                                   "property '" + p.first + "' is write-only and must not appear in a response"));
                    }
                }

                NodeId child = ctx.doc.child(node, "properties/" + pointer::escape(p.first));
                append(out, evaluate_node(child, *value, ipath, extend(schema_path, k, p.first), ctx));
            }

        } else if (k == "patternProperties") {
            for (auto const& member : instance.items()) {
                for (auto const& pp : node.pattern_properties) {
                    if (!std::regex_search(member.first, pp.second)) continue;
                    NodeId child = ctx.doc.child(node, "patternProperties/" + pointer::escape(pp.first));
                    append(out, evaluate_node(child, member.second, with_key(instance_path, member.first),
                                              extend(schema_path, k, pp.first), ctx));
                }
            }

        } else if (k == "additionalProperties") {
            if (m.second.isBool() && m.second.asBool()) continue;
            NodeId child = ctx.doc.child(node, k);
            for (auto const& member : instance.items()) {
                if (properties != nullptr && properties->isObject() && properties->has(member.first)) continue;
                if (matches_pattern_property(node, member.first)) continue;
                InstancePath ipath = with_key(instance_path, member.first);
                if (m.second.isBool()) {
                    Value details = Value::object();
                    details["property"] = member.first;
                    out.push_back(make_failure(FailureKind::AdditionalProperties, ipath, extend(schema_path, k),
                                               "property '" + member.first + "' is not allowed",
                                               std::move(details)));
                } else {
                    append(out, evaluate_node(child, member.second, ipath, extend(schema_path, k), ctx));
                }
            }

        } else if (k == "propertyNames") {
            NodeId child = ctx.doc.child(node, k);
            for (auto const& member : instance.items()) {
                InstancePath ipath = with_key(instance_path, member.first);
                FailureList inner = evaluate_node(child, Value(member.first), ipath, extend(schema_path, k), ctx);
                if (inner.empty()) continue;
                Value details = Value::object();
                details["property"] = member.first;
                FailureRecord r = make_failure(FailureKind::PropertyNames, ipath, extend(schema_path, k),
                                               "property name '" + member.first + "' is not valid",
                                               std::move(details));
                r.causes = std::move(inner);
                out.push_back(std::move(r));
            }
        }
    }
    return out;
}

}  // namespace av
