#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>

#include <av/parse.h>
#include <av/value.h>

namespace av {

using NodeId = std::size_t;
constexpr NodeId kNoNode = static_cast<NodeId>(-1);

// Primary classification of a schema node, by priority.
enum class SchemaKind { BooleanLiteral, Reference, Composite, Enum, ObjectShape, ArrayShape, TypeConstraint };

// A keyword family. A node lists the families it uses in the order their
// first keyword is declared.
enum class Facet { Reference, Type, Enum, Numeric, String, Format, Composite, Object, Array, Boolean };

// Keyword interpretation profile.
//   JsonSchema: siblings of $ref are evaluated, exclusiveMinimum/Maximum are numbers or booleans.
//   OpenApi:    siblings of $ref are ignored, nullable/readOnly/writeOnly are honored.
enum class Dialect { JsonSchema, OpenApi };

std::string schema_kind_name(SchemaKind kind);
std::string facet_name(Facet facet);
std::string dialect_name(Dialect dialect);
Dialect dialect_from_name(const std::string& name);

// The facet a keyword belongs to, if any.
std::optional<Facet> facet_of(const std::string& keyword);

struct SchemaOptions {
    Dialect dialect = Dialect::JsonSchema;
};

struct SchemaNode {
    NodeId id = kNoNode;
    SchemaKind kind = SchemaKind::TypeConstraint;
    std::string pointer;
    // Keyword mapping (or boolean) inside the owning document's root.
    const Value* raw = nullptr;
    std::vector<Facet> facets;
    // Canonical target pointer for local references, the text as written otherwise.
    std::string ref;
    // Sub-schemas keyed by their location relative to this node,
    // e.g. "items", "allOf/1", "properties/id".
    std::map<std::string, NodeId> children;
    std::optional<std::regex> pattern;
    std::vector<std::pair<std::string, std::regex>> pattern_properties;

    bool has(Facet facet) const;
    const Value* keyword(const std::string& name) const;
};

// Compiled schema document: the parsed root plus an arena of SchemaNodes
// indexed by canonical JSON pointer. Read-only after construction.
class SchemaDocument {
  public:
    explicit SchemaDocument(Value root, SchemaOptions options = {});

    static SchemaDocument parse(const std::string& raw, Format format = Format::Auto, SchemaOptions options = {});

    const Value& root() const { return *root_; }
    const SchemaOptions& options() const { return options_; }
    Dialect dialect() const { return options_.dialect; }

    NodeId root_id() const { return 0; }
    std::size_t size() const { return nodes_.size(); }
    const SchemaNode& node(NodeId id) const;

    // Look up a canonical pointer ("#", "#/definitions/a"). kNoNode if absent.
    NodeId find(const std::string& pointer) const;

    // Child of `parent` at a relative location ("items", "properties/id").
    NodeId child(const SchemaNode& parent, const std::string& relative) const;

    // Why a location that looked like it could be a schema was not compiled.
    const std::string* rejection(const std::string& pointer) const;

  private:
    NodeId compile(const Value& v, const std::string& ptr);
    NodeId compile_lenient(const Value& v, const std::string& ptr);
    void compile_members(const Value& container, const std::string& ptr);
    void compile_keyword(SchemaNode& node, const std::string& key, const Value& v);
    NodeId compile_child(SchemaNode& node, const std::string& relative, const Value& v);

    std::shared_ptr<const Value> root_;
    SchemaOptions options_;
    std::vector<SchemaNode> nodes_;
    std::map<std::string, NodeId> index_;
    std::map<std::string, std::string> rejected_;
};

}  // namespace av
