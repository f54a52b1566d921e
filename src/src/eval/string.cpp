#include <av/evaluators.h>

#include <regex>

namespace av {

namespace {
    // Number of code points in UTF-8 text: every byte that is not a continuation byte.
    std::size_t code_points(const std::string& s) {
        std::size_t n = 0;
        for (char c : s)
            if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) ++n;
        return n;
    }
}  // namespace

FailureList evaluate_string(const SchemaNode& node, const Value& instance, const InstancePath& instance_path,
                            const SchemaPath& schema_path, EvalContext&) {
    if (!instance.isString()) return {};
    const std::string& s = instance.asString();
    FailureList out;
    for (auto const& m : node.raw->items()) {
        std::size_t limit = 0;
        if (m.first == "minLength" && count_limit(m.second, limit)) {
            std::size_t len = code_points(s);
            if (len >= limit) continue;
            Value details = Value::object();
            details["limit"] = m.second;
            details["actual"] = static_cast<int64_t>(len);
            out.push_back(make_failure(FailureKind::MinLength, instance_path, extend(schema_path, m.first),
                                       "string of length " + std::to_string(len) + " is shorter than minLength " +
                                           std::to_string(limit),
                                       std::move(details)));
        } else if (m.first == "maxLength" && count_limit(m.second, limit)) {
            std::size_t len = code_points(s);
            if (len <= limit) continue;
            Value details = Value::object();
            details["limit"] = m.second;
            details["actual"] = static_cast<int64_t>(len);
            out.push_back(make_failure(FailureKind::MaxLength, instance_path, extend(schema_path, m.first),
                                       "string of length " + std::to_string(len) + " is longer than maxLength " +
                                           std::to_string(limit),
                                       std::move(details)));
        } else if (m.first == "pattern" && node.pattern) {
            if (std::regex_search(s, *node.pattern)) continue;
            Value details = Value::object();
            details["pattern"] = m.second;
            out.push_back(make_failure(FailureKind::Pattern, instance_path, extend(schema_path, m.first),
                                       "string " + preview(instance) + " does not match pattern '" +
                                           m.second.asString() + "'",
                                       std::move(details)));
        }
    }
    return out;
}

FailureList evaluate_format(const SchemaNode& node, const Value& instance, const InstancePath& instance_path,
                            const SchemaPath& schema_path, EvalContext& ctx) {
    const Value* format = node.keyword("format");
    if (format == nullptr || !format->isString()) return {};
    const FormatCheck* check = ctx.formats.find(format->asString());
    // unregistered formats pass
    if (check == nullptr || (*check)(instance)) return {};
    Value details = Value::object();
    details["format"] = *format;
    return {make_failure(FailureKind::Format, instance_path, extend(schema_path, "format"),
                         "value " + preview(instance) + " is not a valid '" + format->asString() + "'",
                         std::move(details))};
}

}  // namespace av
