#include <av/evaluators.h>

namespace av {

namespace {
    bool matches_type(const std::string& type, const Value& v) {
        if (type == "null") return v.isNull();
        if (type == "boolean") return v.isBool();
        if (type == "integer") return v.isIntegral();
        if (type == "number") return v.isNumber();
        if (type == "string") return v.isString();
        if (type == "array") return v.isArray();
        if (type == "object") return v.isObject();
        return false;
    }
}  // namespace

FailureList evaluate_type(const SchemaNode& node, const Value& instance, const InstancePath& instance_path,
                          const SchemaPath& schema_path, EvalContext& ctx) {
    const Value* type = node.keyword("type");
    if (type == nullptr) return {};

    std::vector<std::string> expected;
    if (type->isString())
        expected.push_back(type->asString());
    else if (type->isArray())
        for (auto const& t : type->asArray())
            if (t.isString()) expected.push_back(t.asString());

    for (auto const& t : expected)
        if (matches_type(t, instance)) return {};

    if (ctx.doc.dialect() == Dialect::OpenApi && instance.isNull()) {
        const Value* nullable = node.keyword("nullable");
        if (nullable != nullptr && nullable->isBool() && nullable->asBool()) return {};
    }

    Value details = Value::object();
    Value list = Value::array();
    std::string names;
    for (auto const& t : expected) {
        list.push_back(t);
        if (!names.empty()) names += ", ";
        names += t;
    }
    details["expected"] = list;
    details["actual"] = instance.typeName();

    std::string message = expected.size() == 1 ? "expected type '" + names + "'" : "expected one of types [" + names + "]";
    message += " but found '" + instance.typeName() + "' (value: " + preview(instance) + ")";
    return {make_failure(FailureKind::TypeMismatch, instance_path, extend(schema_path, "type"), message,
                         std::move(details))};
}

}  // namespace av
