#pragma once
// ═══════════════════════════════════════════════════════════════════
//  schemapp/aggregator.h — Apply the computed order to each collection
// ═══════════════════════════════════════════════════════════════════

#include "constraints.h"
#include "fragment.h"
#include "ordering.h"
#include "registry.h"
#include <string>
#include <vector>

namespace schemapp {

class Aggregator {
public:
    Aggregator(const Registry& registry, const ConstraintStore& constraints)
        : registry_(registry), engine_(constraints) {}

    // Identifiers of one kind, sorted
    std::vector<std::string> order(Kind kind) const;

    // Definitions in sorted order
    std::vector<Definition> orderAndList() const;

    // Resolver or directive sets merged in sorted order; later ones win
    FragmentValue orderAndMerge(Kind kind) const;

private:
    const Registry& registry_;
    OrderingEngine engine_;
};

} // namespace schemapp
