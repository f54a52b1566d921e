#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include <av/schema.h>

namespace av {

struct Resolution {
    NodeId node = kNoNode;
    // The target is already being evaluated further up the chain.
    bool recursive = false;
    // Why the reference could not be resolved; empty on success.
    std::string error;

    bool resolved() const { return node != kNoNode; }
};

// Per-call resolution state. Never shared between validate() calls.
struct ResolutionContext {
    // Canonical pointers of the references currently being followed.
    std::vector<std::string> chain;
    std::map<std::string, Resolution> cache;
    std::size_t steps = 0;
    // Node evaluations currently on the call stack.
    std::size_t nesting = 0;

    bool in_chain(const std::string& pointer) const;
};

// Pushes a pointer onto the chain for the lifetime of the guard.
class ChainGuard {
  public:
    ChainGuard(ResolutionContext& ctx, const std::string& pointer) : ctx_(ctx) { ctx_.chain.push_back(pointer); }
    ~ChainGuard() { ctx_.chain.pop_back(); }
    ChainGuard(const ChainGuard&) = delete;
    ChainGuard& operator=(const ChainGuard&) = delete;

  private:
    ResolutionContext& ctx_;
};

class ReferenceResolver {
  public:
    explicit ReferenceResolver(const SchemaDocument& doc) : doc_(doc) {}

    // Resolve a reference written in the document. Results, including
    // failures, are cached in `ctx`.
    Resolution resolve(const std::string& ref, ResolutionContext& ctx) const;

  private:
    Resolution lookup(const std::string& ref) const;

    const SchemaDocument& doc_;
};

}  // namespace av
