#pragma once
// ═══════════════════════════════════════════════════════════════════
//  schemapp/ordering.h — Pairwise signal comparator and ordering engine
// ═══════════════════════════════════════════════════════════════════
//
//  For two distinct identifiers A and B six signals are read from the
//  constraint store and packed into a 6-bit word:
//
//    bit 0  A is start          bit 3  B is end
//    bit 1  B is start          bit 4  A must follow B
//    bit 2  A is end            bit 5  B must follow A
//
//  The word indexes a 64-entry truth table, built once, whose entries
//  say which of the two sorts first or which side's rules contradict.
//
//  Conflicts are found pair by pair only. A rule set whose pairs are
//  each consistent can still be non-transitive; no global cycle check
//  is attempted and the result is then best effort.
//
// ═══════════════════════════════════════════════════════════════════

#include "constraints.h"
#include "errors.h"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace schemapp {

struct Signal {
    static constexpr SignalWord FirstStart    = 1u << 0;
    static constexpr SignalWord SecondStart   = 1u << 1;
    static constexpr SignalWord FirstEnd      = 1u << 2;
    static constexpr SignalWord SecondEnd     = 1u << 3;
    static constexpr SignalWord FirstFollows  = 1u << 4;
    static constexpr SignalWord SecondFollows = 1u << 5;
    static constexpr SignalWord Mask          = 0x3f;
};

// ── Signal word of (B, A) given the word of (A, B) ──
constexpr SignalWord swapSignals(SignalWord w) {
    SignalWord swapped = 0;
    if (w & Signal::FirstStart)    swapped |= Signal::SecondStart;
    if (w & Signal::SecondStart)   swapped |= Signal::FirstStart;
    if (w & Signal::FirstEnd)      swapped |= Signal::SecondEnd;
    if (w & Signal::SecondEnd)     swapped |= Signal::FirstEnd;
    if (w & Signal::FirstFollows)  swapped |= Signal::SecondFollows;
    if (w & Signal::SecondFollows) swapped |= Signal::FirstFollows;
    return swapped;
}

enum class Outcome : std::uint8_t {
    Unknown,
    Unordered,
    FirstBefore,
    SecondBefore,
    ConflictInFirst,
    ConflictInSecond,
    ConflictInBoth,
};

// ── Outcome of (B, A) given the outcome of (A, B) ──
constexpr Outcome mirror(Outcome outcome) {
    switch (outcome) {
        case Outcome::FirstBefore:      return Outcome::SecondBefore;
        case Outcome::SecondBefore:     return Outcome::FirstBefore;
        case Outcome::ConflictInFirst:  return Outcome::ConflictInSecond;
        case Outcome::ConflictInSecond: return Outcome::ConflictInFirst;
        default:                        return outcome;
    }
}

// ═══════════════════════════════════════════
//  class SignalTable
// ═══════════════════════════════════════════
class SignalTable {
public:
    static constexpr std::size_t Size = 64;

    constexpr SignalTable() : outcomes_{} {
        for (std::size_t w = 0; w < Size; ++w) {
            outcomes_[w] = decide(static_cast<SignalWord>(w));
        }
    }

    // Hand-written table; entries left as Unknown raise UnknownCombinationError
    constexpr explicit SignalTable(const std::array<Outcome, Size>& outcomes)
        : outcomes_(outcomes) {}

    constexpr Outcome operator[](SignalWord w) const { return outcomes_[w & Signal::Mask]; }

    // Decision rules, first match wins:
    //  1. a side that is both start and end is in conflict (both sides → both)
    //  2. each side following the other is a conflict in both
    //  3. partition rank (start < plain < end) and the follow edge each give
    //     a preference; a silent one defers to the other, agreeing ones
    //     decide, disagreeing ones are a conflict in both
    static constexpr Outcome decide(SignalWord w) {
        const bool aStart   = w & Signal::FirstStart;
        const bool bStart   = w & Signal::SecondStart;
        const bool aEnd     = w & Signal::FirstEnd;
        const bool bEnd     = w & Signal::SecondEnd;
        const bool aFollows = w & Signal::FirstFollows;
        const bool bFollows = w & Signal::SecondFollows;

        const bool aSplit = aStart && aEnd;
        const bool bSplit = bStart && bEnd;
        if (aSplit && bSplit) return Outcome::ConflictInBoth;
        if (aSplit) return Outcome::ConflictInFirst;
        if (bSplit) return Outcome::ConflictInSecond;
        if (aFollows && bFollows) return Outcome::ConflictInBoth;

        const int aRank = aStart ? 0 : (aEnd ? 2 : 1);
        const int bRank = bStart ? 0 : (bEnd ? 2 : 1);
        const int partition = (aRank > bRank) - (aRank < bRank);
        const int edge = bFollows ? -1 : (aFollows ? 1 : 0);

        if (edge == 0) return fromSign(partition);
        if (partition == 0 || partition == edge) return fromSign(edge);
        return Outcome::ConflictInBoth;
    }

private:
    std::array<Outcome, Size> outcomes_;

    static constexpr Outcome fromSign(int sign) {
        if (sign < 0) return Outcome::FirstBefore;
        if (sign > 0) return Outcome::SecondBefore;
        return Outcome::Unordered;
    }
};

inline constexpr SignalTable signalTable{};

// ═══════════════════════════════════════════
//  class OrderingEngine
//  Borrows the constraint store; the store must outlive the engine.
//  The table is copied.
// ═══════════════════════════════════════════
class OrderingEngine {
public:
    explicit OrderingEngine(const ConstraintStore& constraints,
                            const SignalTable& table = signalTable)
        : constraints_(constraints), table_(table) {}

    SignalWord signals(const std::string& a, const std::string& b) const;

    // -1 if a sorts first, +1 if b sorts first, 0 if unordered.
    // Throws an OrderingConflictError subtype for contradictory rules.
    int compare(const std::string& a, const std::string& b) const;

    // Compare every pair in input order, throwing on the first conflict
    void validate(const std::vector<std::string>& ids) const;

    // Stable order of ids; unordered pairs keep their input order
    std::vector<std::string> order(std::vector<std::string> ids) const;

private:
    const ConstraintStore& constraints_;
    SignalTable table_;
};

} // namespace schemapp
