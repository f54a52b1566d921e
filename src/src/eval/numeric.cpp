#include <av/evaluators.h>

#include <algorithm>
#include <cmath>

namespace av {

namespace {
    // -1, 0, 1. Integers compare exactly; anything else as doubles.
    int compare(const Value& a, const Value& b) {
        if (a.isInt() && b.isInt()) return a.asInt() < b.asInt() ? -1 : (a.asInt() > b.asInt() ? 1 : 0);
        double x = a.asDouble(), y = b.asDouble();
        return x < y ? -1 : (x > y ? 1 : 0);
    }

    bool flag(const SchemaNode& node, const char* keyword) {
        const Value* v = node.keyword(keyword);
        return v != nullptr && v->isBool() && v->asBool();
    }

    bool is_multiple(const Value& v, const Value& divisor) {
        if (v.isInt() && divisor.isInt()) {
            int64_t d = divisor.asInt();
            return d == 0 || d == -1 || v.asInt() % d == 0;
        }
        double q = v.asDouble() / divisor.asDouble();
        if (!std::isfinite(q)) return false;
        return std::fabs(q - std::round(q)) <= 1e-9 * std::max(1.0, std::fabs(q));
    }

    FailureRecord bound_failure(FailureKind kind, const InstancePath& ipath, const SchemaPath& spath,
                                const std::string& keyword, const Value& limit, const Value& instance,
                                const std::string& relation) {
        Value details = Value::object();
        details["limit"] = limit;
        details["actual"] = instance;
        return make_failure(kind, ipath, extend(spath, keyword),
                            "value " + preview(instance) + " " + relation + " " + limit.dump(), std::move(details));
    }
}  // namespace

FailureList evaluate_numeric(const SchemaNode& node, const Value& instance, const InstancePath& instance_path,
                             const SchemaPath& schema_path, EvalContext&) {
    if (!instance.isNumber()) return {};
    FailureList out;
    for (auto const& m : node.raw->items()) {
        const std::string& k = m.first;
        const Value& limit = m.second;
        if (!limit.isNumber()) continue;  // boolean exclusive* are read through minimum/maximum

        if (k == "minimum") {
            if (flag(node, "exclusiveMinimum")) {
                if (compare(instance, limit) <= 0)
                    out.push_back(bound_failure(FailureKind::ExclusiveMinimum, instance_path, schema_path, k, limit,
                                                instance, "must be greater than"));
            } else if (compare(instance, limit) < 0) {
                out.push_back(bound_failure(FailureKind::Minimum, instance_path, schema_path, k, limit, instance,
                                            "is below minimum"));
            }
        } else if (k == "maximum") {
            if (flag(node, "exclusiveMaximum")) {
                if (compare(instance, limit) >= 0)
                    out.push_back(bound_failure(FailureKind::ExclusiveMaximum, instance_path, schema_path, k, limit,
                                                instance, "must be less than"));
            } else if (compare(instance, limit) > 0) {
                out.push_back(bound_failure(FailureKind::Maximum, instance_path, schema_path, k, limit, instance,
                                            "is above maximum"));
            }
        } else if (k == "exclusiveMinimum") {
            if (compare(instance, limit) <= 0)
                out.push_back(bound_failure(FailureKind::ExclusiveMinimum, instance_path, schema_path, k, limit,
                                            instance, "must be greater than"));
        } else if (k == "exclusiveMaximum") {
            if (compare(instance, limit) >= 0)
                out.push_back(bound_failure(FailureKind::ExclusiveMaximum, instance_path, schema_path, k, limit,
                                            instance, "must be less than"));
        } else if (k == "multipleOf") {
            if (limit.asDouble() <= 0) continue;
            if (!is_multiple(instance, limit))
                out.push_back(bound_failure(FailureKind::MultipleOf, instance_path, schema_path, k, limit, instance,
                                            "is not a multiple of"));
        }
    }
    return out;
}

}  // namespace av
