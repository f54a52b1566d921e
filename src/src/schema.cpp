#include <av/schema.h>
#include <av/errors.h>
#include <av/log.h>
#include <av/pointer.h>

#include <algorithm>
#include <set>
#include <stdexcept>

namespace av {

namespace {
    const std::set<std::string> kTypeNames = {"null", "boolean", "integer", "number", "string", "array", "object"};

    // Keywords whose values are data, never schemas.
    const std::set<std::string> kDataKeywords = {"enum", "const", "default", "example", "examples", "required"};

    bool is_schema_value(const Value& v) { return v.isObject() || v.isBool(); }

    bool declares_type(const Value* type, const std::string& name) {
        if (type == nullptr) return false;
        if (type->isString()) return type->asString() == name;
        return false;
    }

    SchemaKind classify(const SchemaNode& node) {
        if (node.has(Facet::Boolean)) return SchemaKind::BooleanLiteral;
        if (node.has(Facet::Reference)) return SchemaKind::Reference;
        if (node.has(Facet::Composite)) return SchemaKind::Composite;
        if (node.has(Facet::Enum)) return SchemaKind::Enum;
        if (node.has(Facet::Object) || declares_type(node.keyword("type"), "object")) return SchemaKind::ObjectShape;
        if (node.has(Facet::Array) || declares_type(node.keyword("type"), "array")) return SchemaKind::ArrayShape;
        return SchemaKind::TypeConstraint;
    }
}  // namespace

std::string schema_kind_name(SchemaKind kind) {
    switch (kind) {
        case SchemaKind::BooleanLiteral:
            return "boolean-literal";
        case SchemaKind::Reference:
            return "reference";
        case SchemaKind::Composite:
            return "composite-combinator";
        case SchemaKind::Enum:
            return "enum";
        case SchemaKind::ObjectShape:
            return "object-shape";
        case SchemaKind::ArrayShape:
            return "array-shape";
        case SchemaKind::TypeConstraint:
            return "type-constraint";
    }
    throw std::logic_error("unknown schema kind");
}

std::string facet_name(Facet facet) {
    switch (facet) {
        case Facet::Reference:
            return "reference";
        case Facet::Type:
            return "type";
        case Facet::Enum:
            return "enum";
        case Facet::Numeric:
            return "numeric";
        case Facet::String:
            return "string";
        case Facet::Format:
            return "format";
        case Facet::Composite:
            return "composite";
        case Facet::Object:
            return "object";
        case Facet::Array:
            return "array";
        case Facet::Boolean:
            return "boolean";
    }
    throw std::logic_error("unknown facet");
}

std::string dialect_name(Dialect dialect) { return dialect == Dialect::OpenApi ? "openapi" : "jsonschema"; }

Dialect dialect_from_name(const std::string& name) {
    if (name == "jsonschema" || name == "json-schema") return Dialect::JsonSchema;
    if (name == "openapi") return Dialect::OpenApi;
    throw std::invalid_argument("unknown dialect '" + name + "' (expected jsonschema or openapi)");
}

std::optional<Facet> facet_of(const std::string& k) {
    if (k == "$ref") return Facet::Reference;
    if (k == "type") return Facet::Type;
    if (k == "enum" || k == "const") return Facet::Enum;
    if (k == "minimum" || k == "maximum" || k == "exclusiveMinimum" || k == "exclusiveMaximum" || k == "multipleOf")
        return Facet::Numeric;
    if (k == "minLength" || k == "maxLength" || k == "pattern") return Facet::String;
    if (k == "format") return Facet::Format;
    if (k == "allOf" || k == "anyOf" || k == "oneOf" || k == "not") return Facet::Composite;
    if (k == "required" || k == "properties" || k == "patternProperties" || k == "additionalProperties" ||
        k == "minProperties" || k == "maxProperties" || k == "propertyNames")
        return Facet::Object;
    if (k == "items" || k == "additionalItems" || k == "minItems" || k == "maxItems" || k == "uniqueItems" ||
        k == "contains")
        return Facet::Array;
    return std::nullopt;
}

bool SchemaNode::has(Facet facet) const { return std::find(facets.begin(), facets.end(), facet) != facets.end(); }

const Value* SchemaNode::keyword(const std::string& name) const {
    if (raw == nullptr || !raw->isObject()) return nullptr;
    return raw->find(name);
}

SchemaDocument::SchemaDocument(Value root, SchemaOptions options)
    : root_(std::make_shared<const Value>(std::move(root))), options_(options) {
    compile(*root_, "#");
    log::debug("compiled " + std::to_string(nodes_.size()) + " schema node(s)");
}

SchemaDocument SchemaDocument::parse(const std::string& raw, Format format, SchemaOptions options) {
    return SchemaDocument(parse_document(raw, format), options);
}

const SchemaNode& SchemaDocument::node(NodeId id) const {
    if (id >= nodes_.size()) throw std::out_of_range("schema node id " + std::to_string(id) + " out of range");
    return nodes_[id];
}

NodeId SchemaDocument::find(const std::string& pointer) const {
    auto it = index_.find(pointer);
    return it == index_.end() ? kNoNode : it->second;
}

NodeId SchemaDocument::child(const SchemaNode& parent, const std::string& relative) const {
    auto it = parent.children.find(relative);
    return it == parent.children.end() ? kNoNode : it->second;
}

const std::string* SchemaDocument::rejection(const std::string& pointer) const {
    auto it = rejected_.find(pointer);
    return it == rejected_.end() ? nullptr : &it->second;
}

NodeId SchemaDocument::compile(const Value& v, const std::string& ptr) {
    if (!is_schema_value(v))
        throw ParseError("schema at '" + ptr + "' must be an object or a boolean, found " + v.typeName());

    // reserve the slot first: children are appended while this node is built
    NodeId id = nodes_.size();
    nodes_.emplace_back();
    nodes_.back().id = id;
    nodes_.back().pointer = ptr;
    index_[ptr] = id;

    SchemaNode node;
    node.id = id;
    node.pointer = ptr;
    node.raw = &v;
    if (v.isBool()) {
        node.facets.push_back(Facet::Boolean);
    } else {
        for (auto const& m : v.items()) {
            if (auto f = facet_of(m.first)) {
                if (!node.has(*f)) node.facets.push_back(*f);
            }
            compile_keyword(node, m.first, m.second);
        }
    }
    node.kind = classify(node);
    nodes_[id] = std::move(node);
    return id;
}

NodeId SchemaDocument::compile_lenient(const Value& v, const std::string& ptr) {
    size_t mark = nodes_.size();
    try {
        return compile(v, ptr);
    } catch (const ParseError& e) {
        for (size_t k = mark; k < nodes_.size(); ++k) index_.erase(nodes_[k].pointer);
        nodes_.erase(nodes_.begin() + static_cast<std::ptrdiff_t>(mark), nodes_.end());
        rejected_[ptr] = e.what();
        log::debug("'" + ptr + "' is not a schema: " + e.what());
    }
    compile_members(v, ptr);
    return kNoNode;
}

void SchemaDocument::compile_members(const Value& container, const std::string& ptr) {
    if (container.isObject()) {
        for (auto const& m : container.items()) {
            if (m.second.isObject() || m.second.isArray()) {
                std::string child_ptr = pointer::append(ptr, m.first);
                if (m.second.isObject())
                    compile_lenient(m.second, child_ptr);
                else
                    compile_members(m.second, child_ptr);
            }
        }
    } else if (container.isArray()) {
        const auto& elems = container.asArray();
        for (size_t i = 0; i < elems.size(); ++i) {
            std::string child_ptr = ptr + "/" + std::to_string(i);
            if (elems[i].isObject())
                compile_lenient(elems[i], child_ptr);
            else if (elems[i].isArray())
                compile_members(elems[i], child_ptr);
        }
    }
}

NodeId SchemaDocument::compile_child(SchemaNode& node, const std::string& relative, const Value& v) {
    NodeId id = compile(v, node.pointer + "/" + relative);
    node.children[relative] = id;
    return id;
}

void SchemaDocument::compile_keyword(SchemaNode& node, const std::string& key, const Value& v) {
    const std::string ptr = pointer::append(node.pointer, key);

    if (key == "$ref") {
        if (!v.isString()) throw ParseError("$ref at '" + ptr + "' must be a string, found " + v.typeName());
        node.ref = v.asString();
        if (pointer::is_local(node.ref)) {
            try {
                node.ref = pointer::normalize(node.ref);
            } catch (const Error& e) {
                // kept as written; the resolver reports it where it is used
                log::debug("cannot normalize $ref at '" + ptr + "': " + e.what());
            }
        }
        return;
    }

    if (key == "type") {
        if (v.isString()) {
            if (kTypeNames.count(v.asString()) == 0)
                throw ParseError("unknown type '" + v.asString() + "' at '" + ptr + "'");
            return;
        }
        if (v.isArray() && !v.empty()) {
            for (auto const& t : v.asArray()) {
                if (!t.isString()) throw ParseError("type at '" + ptr + "' must only contain strings");
                if (kTypeNames.count(t.asString()) == 0)
                    throw ParseError("unknown type '" + t.asString() + "' at '" + ptr + "'");
            }
            return;
        }
        throw ParseError("type at '" + ptr + "' must be a string or a non-empty array of strings");
    }

    if (kDataKeywords.count(key) != 0) {
        if (key == "enum" && !v.isArray()) throw ParseError("enum at '" + ptr + "' must be an array");
        return;
    }

    if (key == "allOf" || key == "anyOf" || key == "oneOf") {
        if (!v.isArray() || v.empty()) throw ParseError(key + " at '" + ptr + "' must be a non-empty array of schemas");
        for (size_t i = 0; i < v.size(); ++i) compile_child(node, key + "/" + std::to_string(i), v.at(i));
        return;
    }

    if (key == "not" || key == "additionalProperties" || key == "additionalItems" || key == "propertyNames" ||
        key == "contains") {
        if (!is_schema_value(v)) throw ParseError(key + " at '" + ptr + "' must be a schema, found " + v.typeName());
        compile_child(node, key, v);
        return;
    }

    if (key == "items") {
        if (v.isArray()) {
            for (size_t i = 0; i < v.size(); ++i) compile_child(node, key + "/" + std::to_string(i), v.at(i));
        } else if (is_schema_value(v)) {
            compile_child(node, key, v);
        } else {
            throw ParseError("items at '" + ptr + "' must be a schema or an array of schemas");
        }
        return;
    }

    if (key == "properties" || key == "patternProperties") {
        if (!v.isObject()) throw ParseError(key + " at '" + ptr + "' must be an object");
        for (auto const& m : v.items()) {
            compile_child(node, key + "/" + pointer::escape(m.first), m.second);
            if (key == "patternProperties") {
                try {
                    node.pattern_properties.emplace_back(m.first, std::regex(m.first, std::regex::ECMAScript));
                } catch (const std::regex_error& e) {
                    log::warning("ignoring invalid patternProperties regex '" + m.first + "' at '" + ptr +
                                 "': " + e.what());
                }
            }
        }
        return;
    }

    if (key == "definitions" || key == "$defs") {
        if (!v.isObject()) return;
        for (auto const& m : v.items()) compile_child(node, key + "/" + pointer::escape(m.first), m.second);
        return;
    }

    if (key == "pattern") {
        if (!v.isString()) return;
        try {
            node.pattern.emplace(v.asString(), std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            log::warning("ignoring invalid pattern '" + v.asString() + "' at '" + ptr + "': " + e.what());
        }
        return;
    }

    if (facet_of(key)) return;

    // unknown keyword: kept in raw, and nested objects may hold reusable
    // schemas (components/schemas, x-* extensions, ...)
    if (v.isObject()) {
        NodeId id = compile_lenient(v, ptr);
        if (id != kNoNode) node.children[pointer::escape(key)] = id;
    } else if (v.isArray()) {
        compile_members(v, ptr);
    }
}

}  // namespace av
