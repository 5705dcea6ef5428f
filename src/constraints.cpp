// ═══════════════════════════════════════════════════════════════════
//  constraints.cpp — Ordering rule storage
// ═══════════════════════════════════════════════════════════════════

#include "schemapp/constraints.h"
#include "schemapp/console.h"

namespace schemapp {

namespace {

const ConstraintStore::IdSet& emptySet() {
    static const ConstraintStore::IdSet empty;
    return empty;
}

const ConstraintStore::IdSet& findSet(
    const std::unordered_map<std::string, ConstraintStore::IdSet>& edges,
    const std::string& id) {
    auto it = edges.find(id);
    return it == edges.end() ? emptySet() : it->second;
}

} // namespace

const std::vector<std::string>& ConstraintStore::defaultStart() {
    static const std::vector<std::string> ids = {"index", "Query", "Mutation", "Subscription"};
    return ids;
}

ConstraintStore::ConstraintStore()
    : start_(defaultStart().begin(), defaultStart().end()) {}

ConstraintStore::ConstraintStore(const std::vector<std::string>& start,
                                 const std::vector<std::string>& end)
    : start_(start.begin(), start.end()), end_(end.begin(), end.end()) {}

void ConstraintStore::declareAfter(const std::string& id, const std::vector<std::string>& others) {
    if (others.empty()) return;
    after_[id] = IdSet(others.begin(), others.end());
    console::debug("'" + id + "' sorts after", others);
}

void ConstraintStore::declareBefore(const std::string& id, const std::vector<std::string>& others) {
    if (others.empty()) return;
    before_[id] = IdSet(others.begin(), others.end());
    console::debug("'" + id + "' sorts before", others);
}

void ConstraintStore::markStart(const std::string& id) {
    start_.insert(id);
}

void ConstraintStore::markStart(const std::vector<std::string>& ids) {
    start_.insert(ids.begin(), ids.end());
}

void ConstraintStore::markEnd(const std::string& id) {
    end_.insert(id);
}

void ConstraintStore::markEnd(const std::vector<std::string>& ids) {
    end_.insert(ids.begin(), ids.end());
}

void ConstraintStore::setStart(const std::vector<std::string>& ids) {
    start_ = IdSet(ids.begin(), ids.end());
}

void ConstraintStore::setEnd(const std::vector<std::string>& ids) {
    end_ = IdSet(ids.begin(), ids.end());
}

bool ConstraintStore::follows(const std::string& a, const std::string& b) const {
    return afterSet(a).count(b) > 0 || beforeSet(b).count(a) > 0;
}

const ConstraintStore::IdSet& ConstraintStore::afterSet(const std::string& id) const {
    return findSet(after_, id);
}

const ConstraintStore::IdSet& ConstraintStore::beforeSet(const std::string& id) const {
    return findSet(before_, id);
}

} // namespace schemapp
