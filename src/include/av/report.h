#pragma once

#include <string>

#include <av/failure.h>
#include <av/value.h>

namespace av {

// Structured form of a record: instance_path, schema_path, kind, message,
// details and causes.
Value to_value(const FailureRecord& record);
// {"valid": bool, "failures": [...]}
Value to_value(const ValidationResult& result);

// Human readable report. Causes are indented under the record they explain.
std::string render_text(const ValidationResult& result);

std::string render_json(const ValidationResult& result, int indent = 2);

}  // namespace av
