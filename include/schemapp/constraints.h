#pragma once
// ═══════════════════════════════════════════════════════════════════
//  schemapp/constraints.h — Relative ordering rules between identifiers
// ═══════════════════════════════════════════════════════════════════
//
//  after(id, {x, y})   id sorts after x and y
//  before(id, {x, y})  id sorts before x and y
//  start(id)           id belongs to the sort-first partition
//  end(id)             id belongs to the sort-last partition
//
//  Rules are stored as given. Nothing is checked here; contradictions
//  surface when the ordering engine compares a pair.
//
// ═══════════════════════════════════════════════════════════════════

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace schemapp {

class ConstraintStore {
public:
    using IdSet = std::unordered_set<std::string>;

    // Start partition seeded by default: index, Query, Mutation, Subscription
    static const std::vector<std::string>& defaultStart();

    ConstraintStore();
    ConstraintStore(const std::vector<std::string>& start, const std::vector<std::string>& end);

    // ── Edges: replace any previous set for id; an empty list is ignored ──
    void declareAfter(const std::string& id, const std::vector<std::string>& others);
    void declareBefore(const std::string& id, const std::vector<std::string>& others);

    // ── Partitions: additive and idempotent ──
    void markStart(const std::string& id);
    void markStart(const std::vector<std::string>& ids);
    void markEnd(const std::string& id);
    void markEnd(const std::vector<std::string>& ids);

    // ── Replace a partition wholesale (overrides the default seed) ──
    void setStart(const std::vector<std::string>& ids);
    void setEnd(const std::vector<std::string>& ids);

    bool isStart(const std::string& id) const { return start_.count(id) > 0; }
    bool isEnd(const std::string& id) const { return end_.count(id) > 0; }

    // a must sort after b: b ∈ after(a) or a ∈ before(b)
    bool follows(const std::string& a, const std::string& b) const;

    const IdSet& afterSet(const std::string& id) const;
    const IdSet& beforeSet(const std::string& id) const;
    const IdSet& startSet() const { return start_; }
    const IdSet& endSet() const { return end_; }

private:
    std::unordered_map<std::string, IdSet> after_;
    std::unordered_map<std::string, IdSet> before_;
    IdSet start_;
    IdSet end_;
};

} // namespace schemapp
