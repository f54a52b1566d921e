#include <av/evaluators.h>

namespace av {

FailureList evaluate_enum(const SchemaNode& node, const Value& instance, const InstancePath& instance_path,
                          const SchemaPath& schema_path, EvalContext&) {
    FailureList out;
    for (auto const& m : node.raw->items()) {
        if (m.first == "enum") {
            bool found = false;
            for (auto const& allowed : m.second.asArray()) {
                if (allowed == instance) {
                    found = true;
                    break;
                }
            }
            if (found) continue;
            Value details = Value::object();
            details["allowed"] = m.second;
            details["actual"] = instance;
            out.push_back(make_failure(FailureKind::EnumMismatch, instance_path, extend(schema_path, "enum"),
                                       "value " + preview(instance) + " is not one of " + preview(m.second),
                                       std::move(details)));
        } else if (m.first == "const") {
            if (m.second == instance) continue;
            Value details = Value::object();
            details["expected"] = m.second;
            details["actual"] = instance;
            out.push_back(make_failure(FailureKind::ConstMismatch, instance_path, extend(schema_path, "const"),
                                       "value " + preview(instance) + " does not equal " + preview(m.second),
                                       std::move(details)));
        }
    }
    return out;
}

}  // namespace av
