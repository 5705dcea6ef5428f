// ═══════════════════════════════════════════════════════════════════
//  aggregator.cpp — Ordered listing and merging of fragments
// ═══════════════════════════════════════════════════════════════════

#include "schemapp/aggregator.h"
#include "schemapp/merge.h"

namespace schemapp {

std::vector<std::string> Aggregator::order(Kind kind) const {
    return engine_.order(registry_.ids(kind));
}

std::vector<Definition> Aggregator::orderAndList() const {
    std::vector<Definition> result;
    for (auto& id : order(Kind::Definitions)) {
        result.push_back(registry_.definition(id));
    }
    return result;
}

FragmentValue Aggregator::orderAndMerge(Kind kind) const {
    if (kind == Kind::Definitions) {
        throw SchemaError("Definitions are listed, not merged; use orderAndList()");
    }

    std::vector<const FragmentValue*> sources;
    for (auto& id : order(kind)) {
        sources.push_back(kind == Kind::Resolvers ? &registry_.resolvers(id)
                                                  : &registry_.directives(id));
    }
    return deepMerge(sources);
}

} // namespace schemapp
