#include <av/evaluators.h>

namespace av {

namespace {
    struct Attempt {
        std::size_t index;
        FailureList failures;
    };

    Attempt attempt(const SchemaNode& node, const std::string& keyword, std::size_t i, const Value& instance,
                    const InstancePath& instance_path, const SchemaPath& schema_path, EvalContext& ctx) {
        std::string index = std::to_string(i);
        NodeId child = ctx.doc.child(node, keyword + "/" + index);
        return Attempt{i, evaluate_node(child, instance, instance_path, extend(schema_path, keyword, index), ctx)};
    }

    // Fewest failures wins; ties go to the first declared alternative.
    std::size_t best_of(const std::vector<Attempt>& attempts) {
        std::size_t best = 0;
        for (std::size_t k = 1; k < attempts.size(); ++k)
            if (attempts[k].failures.size() < attempts[best].failures.size()) best = k;
        return best;
    }

    Value alternatives_details(const std::vector<Attempt>& attempts, std::size_t best) {
        Value details = Value::object();
        details["tried"] = static_cast<int64_t>(attempts.size());
        details["best"] = static_cast<int64_t>(attempts[best].index);
        Value alternatives = Value::array();
        for (auto const& a : attempts) {
            Value alt = Value::object();
            alt["index"] = static_cast<int64_t>(a.index);
            alt["failures"] = static_cast<int64_t>(a.failures.size());
            Value messages = Value::array();
            for (auto const& f : a.failures) messages.push_back(f.message);
            alt["messages"] = messages;
            alternatives.push_back(alt);
        }
        details["alternatives"] = alternatives;
        return details;
    }
}  // namespace

FailureList evaluate_composite(const SchemaNode& node, const Value& instance, const InstancePath& instance_path,
                               const SchemaPath& schema_path, EvalContext& ctx) {
    FailureList out;
    for (auto const& m : node.raw->items()) {
        const std::string& k = m.first;

        if (k == "allOf") {
            for (std::size_t i = 0; i < m.second.size(); ++i)
                append(out, attempt(node, k, i, instance, instance_path, schema_path, ctx).failures);

        } else if (k == "anyOf") {
            std::vector<Attempt> attempts;
            bool passed = false;
            for (std::size_t i = 0; i < m.second.size() && !passed; ++i) {
                attempts.push_back(attempt(node, k, i, instance, instance_path, schema_path, ctx));
                passed = attempts.back().failures.empty();
            }
            if (passed) continue;
            std::size_t best = best_of(attempts);
            FailureRecord r = make_failure(FailureKind::AnyOf, instance_path, extend(schema_path, k),
                                           "value does not match any of the " + std::to_string(attempts.size()) +
                                               " alternatives in anyOf (closest: alternative " +
                                               std::to_string(attempts[best].index) + ")",
                                           alternatives_details(attempts, best));
            r.causes = attempts[best].failures;
            out.push_back(std::move(r));

        } else if (k == "oneOf") {
            std::vector<Attempt> attempts;
            Value matched = Value::array();
            for (std::size_t i = 0; i < m.second.size(); ++i) {
                attempts.push_back(attempt(node, k, i, instance, instance_path, schema_path, ctx));
                if (attempts.back().failures.empty()) matched.push_back(static_cast<int64_t>(i));
            }
            if (matched.size() == 1) continue;
            if (matched.empty()) {
                std::size_t best = best_of(attempts);
                FailureRecord r = make_failure(FailureKind::OneOfNoMatch, instance_path, extend(schema_path, k),
                                               "value does not match any of the " + std::to_string(attempts.size()) +
                                                   " alternatives in oneOf (closest: alternative " +
                                                   std::to_string(attempts[best].index) + ")",
                                               alternatives_details(attempts, best));
                r.causes = attempts[best].failures;
                out.push_back(std::move(r));
            } else {
                Value details = Value::object();
                details["matched"] = matched;
                out.push_back(make_failure(FailureKind::OneOfAmbiguous, instance_path, extend(schema_path, k),
                                           "value matches more than one alternative in oneOf (indices " +
                                               matched.dump() + ")",
                                           std::move(details)));
            }

        } else if (k == "not") {
            NodeId child = ctx.doc.child(node, k);
            FailureList inner = evaluate_node(child, instance, instance_path, extend(schema_path, k), ctx);
            if (!inner.empty()) continue;
            out.push_back(make_failure(FailureKind::Not, instance_path, extend(schema_path, k),
                                       "value must not match the schema in 'not'"));
        }
    }
    return out;
}

}  // namespace av
