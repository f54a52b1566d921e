#include <av/failure.h>
#include <av/pointer.h>

#include <stdexcept>

namespace av {

std::string kind_name(FailureKind kind) {
    switch (kind) {
        case FailureKind::TypeMismatch:
            return "type-mismatch";
        case FailureKind::EnumMismatch:
            return "enum-mismatch";
        case FailureKind::ConstMismatch:
            return "const-mismatch";
        case FailureKind::Minimum:
            return "minimum";
        case FailureKind::Maximum:
            return "maximum";
        case FailureKind::ExclusiveMinimum:
            return "exclusive-minimum";
        case FailureKind::ExclusiveMaximum:
            return "exclusive-maximum";
        case FailureKind::MultipleOf:
            return "multiple-of";
        case FailureKind::MinLength:
            return "min-length";
        case FailureKind::MaxLength:
            return "max-length";
        case FailureKind::Pattern:
            return "pattern";
        case FailureKind::Format:
            return "format";
        case FailureKind::AnyOf:
            return "any-of";
        case FailureKind::OneOfNoMatch:
            return "one-of-no-match";
        case FailureKind::OneOfAmbiguous:
            return "one-of-ambiguous";
        case FailureKind::Not:
            return "not";
        case FailureKind::Required:
            return "required";
        case FailureKind::MinProperties:
            return "min-properties";
        case FailureKind::MaxProperties:
            return "max-properties";
        case FailureKind::AdditionalProperties:
            return "additional-properties";
        case FailureKind::PropertyNames:
            return "property-names";
        case FailureKind::ReadOnly:
            return "read-only";
        case FailureKind::WriteOnly:
            return "write-only";
        case FailureKind::MinItems:
            return "min-items";
        case FailureKind::MaxItems:
            return "max-items";
        case FailureKind::UniqueItems:
            return "unique-items";
        case FailureKind::AdditionalItems:
            return "additional-items";
        case FailureKind::Contains:
            return "contains";
        case FailureKind::FalseSchema:
            return "false-schema";
        case FailureKind::UnresolvedReference:
            return "unresolved-reference";
        case FailureKind::DepthExceeded:
            return "depth-exceeded";
        case FailureKind::LimitExceeded:
            return "limit-exceeded";
    }
    throw std::logic_error("unknown failure kind");
}

PathSegment::PathSegment(Type type, std::string key, std::size_t index)
    : type_(type), key_(std::move(key)), index_(index) {}

PathSegment PathSegment::makeKey(const std::string& key) { return PathSegment(Type::Key, key, 0); }

PathSegment PathSegment::makeIndex(std::size_t index) { return PathSegment(Type::Index, "", index); }

const std::string& PathSegment::asKey() const {
    if (type_ != Type::Key) throw std::logic_error("path segment is not a key");
    return key_;
}

std::size_t PathSegment::asIndex() const {
    if (type_ != Type::Index) throw std::logic_error("path segment is not an index");
    return index_;
}

bool FailureRecord::operator==(const FailureRecord& rhs) const {
    return kind == rhs.kind && instance_path == rhs.instance_path && schema_path == rhs.schema_path &&
           message == rhs.message && details == rhs.details && causes == rhs.causes;
}

std::string instance_pointer(const InstancePath& path) {
    std::string out;
    for (auto const& seg : path) {
        out.push_back('/');
        if (seg.isKey())
            out += pointer::escape(seg.asKey());
        else
            out += std::to_string(seg.asIndex());
    }
    return out;
}

std::string display_path(const InstancePath& path) {
    if (path.empty()) return "root";
    return instance_pointer(path);
}

std::string schema_location(const SchemaPath& path) {
    std::string out = "#";
    for (std::size_t i = 0; i < path.size(); ++i) {
        out.push_back('/');
        if (i > 0 && path[i - 1] == "$ref")
            out += path[i];
        else
            out += pointer::escape(path[i]);
    }
    return out;
}

}  // namespace av
