#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <av/value.h>

namespace av {

enum class FailureKind {
    TypeMismatch,
    EnumMismatch,
    ConstMismatch,
    Minimum,
    Maximum,
    ExclusiveMinimum,
    ExclusiveMaximum,
    MultipleOf,
    MinLength,
    MaxLength,
    Pattern,
    Format,
    AnyOf,
    OneOfNoMatch,
    OneOfAmbiguous,
    Not,
    Required,
    MinProperties,
    MaxProperties,
    AdditionalProperties,
    PropertyNames,
    ReadOnly,
    WriteOnly,
    MinItems,
    MaxItems,
    UniqueItems,
    AdditionalItems,
    Contains,
    FalseSchema,
    UnresolvedReference,
    DepthExceeded,
    LimitExceeded
};

// Stable kebab-case name, e.g. "type-mismatch", "one-of-ambiguous".
std::string kind_name(FailureKind kind);

// One step of an instance path: an object key or an array index.
class PathSegment {
  public:
    enum class Type { Key, Index };

    static PathSegment makeKey(const std::string& key);
    static PathSegment makeIndex(std::size_t index);

    bool isKey() const { return type_ == Type::Key; }
    bool isIndex() const { return type_ == Type::Index; }

    const std::string& asKey() const;
    std::size_t asIndex() const;

    bool operator==(const PathSegment& rhs) const {
        return type_ == rhs.type_ && key_ == rhs.key_ && index_ == rhs.index_;
    }
    bool operator!=(const PathSegment& rhs) const { return !(*this == rhs); }

  private:
    PathSegment(Type type, std::string key, std::size_t index);

    Type type_;
    std::string key_;
    std::size_t index_;
};

using InstancePath = std::vector<PathSegment>;

// Keyword names and member keys from the schema root. Following a reference
// appends "$ref" and then the canonical pointer of the target.
using SchemaPath = std::vector<std::string>;

struct FailureRecord {
    InstancePath instance_path;
    SchemaPath schema_path;
    FailureKind kind = FailureKind::TypeMismatch;
    std::string message;
    Value details = Value::object();
    // Nested records explaining a combinator failure.
    std::vector<FailureRecord> causes;

    bool operator==(const FailureRecord& rhs) const;
    bool operator!=(const FailureRecord& rhs) const { return !(*this == rhs); }
};

struct ValidationResult {
    std::vector<FailureRecord> failures;

    bool is_valid() const { return failures.empty(); }
    std::size_t failure_count() const { return failures.size(); }

    bool operator==(const ValidationResult& rhs) const { return failures == rhs.failures; }
    bool operator!=(const ValidationResult& rhs) const { return !(*this == rhs); }
};

// JSON pointer of an instance location: "" for the root, "/items/0/id".
std::string instance_pointer(const InstancePath& path);

// Folder-style display path: "root" for the root, "/items/0/id" otherwise.
std::string display_path(const InstancePath& path);

// "#/properties/id/type"; a pointer recorded after "$ref" is shown as is.
std::string schema_location(const SchemaPath& path);

}  // namespace av
