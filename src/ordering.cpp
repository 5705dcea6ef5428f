// ═══════════════════════════════════════════════════════════════════
//  ordering.cpp — Pairwise comparator and stable ordering
// ═══════════════════════════════════════════════════════════════════

#include "schemapp/ordering.h"
#include <algorithm>

namespace schemapp {

namespace {

[[noreturn]] void throwConflict(Outcome outcome, SignalWord w, const std::string& a, const std::string& b) {
    switch (outcome) {
        case Outcome::ConflictInFirst:  throw ConflictInFirstError(w, a, b);
        case Outcome::ConflictInSecond: throw ConflictInSecondError(w, a, b);
        case Outcome::ConflictInBoth:   throw ConflictInBothError(w, a, b);
        default:                        throw UnknownCombinationError(w, a, b);
    }
}

} // namespace

SignalWord OrderingEngine::signals(const std::string& a, const std::string& b) const {
    SignalWord w = 0;
    if (constraints_.isStart(a))      w |= Signal::FirstStart;
    if (constraints_.isStart(b))      w |= Signal::SecondStart;
    if (constraints_.isEnd(a))        w |= Signal::FirstEnd;
    if (constraints_.isEnd(b))        w |= Signal::SecondEnd;
    if (constraints_.follows(a, b))   w |= Signal::FirstFollows;
    if (constraints_.follows(b, a))   w |= Signal::SecondFollows;
    return w;
}

int OrderingEngine::compare(const std::string& a, const std::string& b) const {
    if (a == b) return 0;

    const SignalWord w = signals(a, b);
    const Outcome outcome = table_[w];
    switch (outcome) {
        case Outcome::Unordered:    return 0;
        case Outcome::FirstBefore:  return -1;
        case Outcome::SecondBefore: return 1;
        default:                    throwConflict(outcome, w, a, b);
    }
}

void OrderingEngine::validate(const std::vector<std::string>& ids) const {
    for (std::size_t i = 0; i < ids.size(); ++i) {
        for (std::size_t j = i + 1; j < ids.size(); ++j) {
            compare(ids[i], ids[j]);
        }
    }
}

std::vector<std::string> OrderingEngine::order(std::vector<std::string> ids) const {
    validate(ids);

    // Repeatedly take the first remaining id that no other remaining id must
    // precede. Unordered ids keep their input order, and a rule between two
    // ids is honoured even when unrelated ids sit between them.
    std::vector<std::string> sorted;
    sorted.reserve(ids.size());
    while (!ids.empty()) {
        auto pick = std::find_if(ids.begin(), ids.end(), [&](const std::string& candidate) {
            return std::none_of(ids.begin(), ids.end(), [&](const std::string& other) {
                return compare(other, candidate) < 0;
            });
        });
        // Every remaining id has a predecessor: the rules are not transitive
        if (pick == ids.end()) {
            pick = ids.begin();
        }
        sorted.push_back(std::move(*pick));
        ids.erase(pick);
    }
    return sorted;
}

} // namespace schemapp
