#include <av/evaluators.h>

namespace av {

FailureList evaluate_array(const SchemaNode& node, const Value& instance, const InstancePath& instance_path,
                           const SchemaPath& schema_path, EvalContext& ctx) {
    if (!instance.isArray()) return {};
    const auto& elems = instance.asArray();
    const Value* items = node.keyword("items");
    FailureList out;

    for (auto const& m : node.raw->items()) {
        const std::string& k = m.first;

        if (k == "items") {
            if (m.second.isArray()) {
                // positional: extra elements are governed by additionalItems
                for (std::size_t i = 0; i < elems.size() && i < m.second.size(); ++i) {
                    std::string index = std::to_string(i);
                    NodeId child = ctx.doc.child(node, k + "/" + index);
                    append(out, evaluate_node(child, elems[i], with_index(instance_path, i),
                                              extend(schema_path, k, index), ctx));
                }
            } else {
                NodeId child = ctx.doc.child(node, k);
                for (std::size_t i = 0; i < elems.size(); ++i)
                    append(out, evaluate_node(child, elems[i], with_index(instance_path, i), extend(schema_path, k),
                                              ctx));
            }

        } else if (k == "additionalItems") {
            if (items == nullptr || !items->isArray() || elems.size() <= items->size()) continue;
            if (m.second.isBool()) {
                if (m.second.asBool()) continue;
                Value details = Value::object();
                details["limit"] = static_cast<int64_t>(items->size());
                details["actual"] = static_cast<int64_t>(elems.size());
                out.push_back(make_failure(FailureKind::AdditionalItems, instance_path, extend(schema_path, k),
                                           "array has " + std::to_string(elems.size()) + " items but only " +
                                               std::to_string(items->size()) + " are allowed",
                                           std::move(details)));
            } else {
                NodeId child = ctx.doc.child(node, k);
                for (std::size_t i = items->size(); i < elems.size(); ++i)
                    append(out, evaluate_node(child, elems[i], with_index(instance_path, i), extend(schema_path, k),
                                              ctx));
            }

        } else if (k == "minItems" || k == "maxItems") {
            std::size_t limit = 0;
            if (!count_limit(m.second, limit)) continue;
            bool is_min = k == "minItems";
            if (is_min ? elems.size() >= limit : elems.size() <= limit) continue;
            Value details = Value::object();
            details["limit"] = m.second;
            details["actual"] = static_cast<int64_t>(elems.size());
            out.push_back(make_failure(is_min ? FailureKind::MinItems : FailureKind::MaxItems, instance_path,
                                       extend(schema_path, k),
                                       "array has " + std::to_string(elems.size()) + " items, " +
                                           (is_min ? "fewer than minItems " : "more than maxItems ") +
                                           std::to_string(limit),
                                       std::move(details)));

        } else if (k == "uniqueItems") {
            if (!m.second.isBool() || !m.second.asBool()) continue;
            for (std::size_t j = 1; j < elems.size(); ++j) {
                for (std::size_t i = 0; i < j; ++i) {
                    if (elems[i] != elems[j]) continue;
                    Value details = Value::object();
                    details["first"] = static_cast<int64_t>(i);
                    details["second"] = static_cast<int64_t>(j);
                    out.push_back(make_failure(FailureKind::UniqueItems, with_index(instance_path, j),
                                               extend(schema_path, k),
                                               "item " + std::to_string(j) + " duplicates item " + std::to_string(i),
                                               std::move(details)));
                    break;
                }
            }

        } else if (k == "contains") {
            NodeId child = ctx.doc.child(node, k);
            bool found = false;
            for (std::size_t i = 0; i < elems.size() && !found; ++i)
                found = evaluate_node(child, elems[i], with_index(instance_path, i), extend(schema_path, k), ctx)
                            .empty();
            if (found) continue;
            Value details = Value::object();
            details["checked"] = static_cast<int64_t>(elems.size());
            out.push_back(make_failure(FailureKind::Contains, instance_path, extend(schema_path, k),
                                       "array does not contain any item matching 'contains'", std::move(details)));
        }
    }
    return out;
}

}  // namespace av
