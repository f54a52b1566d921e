#include <av/resolver.h>
#include <av/errors.h>
#include <av/pointer.h>

#include <algorithm>

namespace av {

bool ResolutionContext::in_chain(const std::string& pointer) const {
    return std::find(chain.begin(), chain.end(), pointer) != chain.end();
}

Resolution ReferenceResolver::resolve(const std::string& ref, ResolutionContext& ctx) const {
    Resolution r;
    auto it = ctx.cache.find(ref);
    if (it != ctx.cache.end()) {
        r = it->second;
    } else {
        r = lookup(ref);
        ctx.cache.emplace(ref, r);
    }
    r.recursive = r.resolved() && ctx.in_chain(doc_.node(r.node).pointer);
    return r;
}

Resolution ReferenceResolver::lookup(const std::string& ref) const {
    Resolution r;
    if (!pointer::is_local(ref)) {
        r.error = "only local references are supported";
        return r;
    }

    std::vector<std::string> tokens;
    try {
        tokens = pointer::split(ref);
    } catch (const Error& e) {
        r.error = e.what();
        return r;
    }

    std::string canonical = pointer::join(tokens);
    r.node = doc_.find(canonical);
    if (r.resolved()) return r;

    // work out which segment is missing for the message
    const Value* cur = &doc_.root();
    std::vector<std::string> walked;
    for (auto const& t : tokens) {
        walked.push_back(t);
        cur = pointer::walk(*cur, {t});
        if (cur == nullptr) {
            r.error = "segment '" + t + "' not found (at '" + pointer::join(walked) + "')";
            return r;
        }
    }
    r.error = "'" + canonical + "' does not point to a schema";
    if (const std::string* why = doc_.rejection(canonical)) r.error += ": " + *why;
    return r;
}

}  // namespace av
