#pragma once
// ═══════════════════════════════════════════════════════════════════
//  schemapp/merge.h — Recursive deep merge of fragment values
// ═══════════════════════════════════════════════════════════════════
//
//  mapping + mapping  → merged key by key, recursively
//  anything else      → the later value replaces the earlier one
//
//  Sequences are leaves: [1, 2] merged with [3] gives [3].
//
// ═══════════════════════════════════════════════════════════════════

#include "fragment.h"
#include <vector>

namespace schemapp {

inline void mergeInto(FragmentValue& target, const FragmentValue& source) {
    if (!target.isMapping() || !source.isMapping()) {
        target = source;
        return;
    }
    auto& into = target.mapping();
    for (auto& [key, value] : source.mapping()) {
        auto it = into.find(key);
        if (it == into.end()) {
            into.emplace(key, value);
        } else {
            mergeInto(it->second, value);
        }
    }
}

// ── Merge left to right into a fresh empty mapping ──
inline FragmentValue deepMerge(const std::vector<const FragmentValue*>& sources) {
    FragmentValue result;
    for (auto* source : sources) {
        mergeInto(result, *source);
    }
    return result;
}

inline FragmentValue deepMerge(const std::vector<FragmentValue>& sources) {
    FragmentValue result;
    for (auto& source : sources) {
        mergeInto(result, source);
    }
    return result;
}

} // namespace schemapp
