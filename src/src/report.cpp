#include <av/report.h>

#include <sstream>

namespace av {

namespace {
    void render_record(const FailureRecord& r, std::ostringstream& ss, int depth) {
        std::string pad(static_cast<std::size_t>(2 + depth * 4), ' ');
        ss << pad << "- " << display_path(r.instance_path) << ": " << r.message << " [" << kind_name(r.kind) << "]\n";
        ss << pad << "  schema: " << schema_location(r.schema_path) << "\n";
        if (!r.causes.empty()) {
            ss << pad << "  because:\n";
            for (auto const& c : r.causes) render_record(c, ss, depth + 1);
        }
    }
}  // namespace

Value to_value(const FailureRecord& record) {
    Value v = Value::object();
    v["instance_path"] = instance_pointer(record.instance_path);
    v["schema_path"] = schema_location(record.schema_path);
    v["kind"] = kind_name(record.kind);
    v["message"] = record.message;
    v["details"] = record.details;
    Value causes = Value::array();
    for (auto const& c : record.causes) causes.push_back(to_value(c));
    v["causes"] = causes;
    return v;
}

Value to_value(const ValidationResult& result) {
    Value v = Value::object();
    v["valid"] = result.is_valid();
    Value failures = Value::array();
    for (auto const& f : result.failures) failures.push_back(to_value(f));
    v["failures"] = failures;
    return v;
}

std::string render_text(const ValidationResult& result) {
    if (result.is_valid()) return "Validation successful!\n";
    std::ostringstream ss;
    ss << "Validation Error: " << result.failures.size() << (result.failures.size() == 1 ? " failure" : " failures")
       << "\n";
    for (auto const& f : result.failures) render_record(f, ss, 0);
    return ss.str();
}

std::string render_json(const ValidationResult& result, int indent) { return to_value(result).dump(indent) + "\n"; }

}  // namespace av
