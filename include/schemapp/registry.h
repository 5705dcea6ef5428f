#pragma once
// ═══════════════════════════════════════════════════════════════════
//  schemapp/registry.h — Keyed fragment storage, one slot per (kind, id)
// ═══════════════════════════════════════════════════════════════════

#include "errors.h"
#include "fragment.h"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace schemapp {

// ── Insertion-ordered map; registration order is the tie-break order ──
template <typename T>
class Collection {
public:
    bool contains(const std::string& id) const { return items_.count(id) > 0; }
    std::size_t size() const { return order_.size(); }
    const std::vector<std::string>& ids() const { return order_; }

    const T* find(const std::string& id) const {
        auto it = items_.find(id);
        return it == items_.end() ? nullptr : &it->second;
    }

    void insert(const std::string& id, T value) {
        items_.emplace(id, std::move(value));
        order_.push_back(id);
    }

private:
    std::vector<std::string> order_;
    std::unordered_map<std::string, T> items_;
};

// ═══════════════════════════════════════════
//  class Registry
//  Registration is atomic: the duplicate check and the insert happen
//  under one lock.
// ═══════════════════════════════════════════
class Registry {
public:
    Registry() : mutex_(std::make_unique<std::mutex>()) {}

    // Each registry keeps its own mutex; a moved-from registry is empty
    // and still usable.
    Registry(Registry&& other);
    Registry& operator=(Registry&& other);

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // ── Registration; throws DuplicateIdentifierError ──
    void addDefinition(const std::string& id, Definition definition);
    void addResolvers(const std::string& id, FragmentValue resolvers);
    void addDirectives(const std::string& id, FragmentValue directives);

    // ── Lookups ──
    bool has(Kind kind, const std::string& id) const;
    bool hasAny(const std::string& id) const;
    std::vector<std::string> ids(Kind kind) const;
    std::size_t size(Kind kind) const;

    const Definition& definition(const std::string& id) const;
    const FragmentValue& resolvers(const std::string& id) const;
    const FragmentValue& directives(const std::string& id) const;

private:
    std::unique_ptr<std::mutex> mutex_;
    Collection<Definition> definitions_;
    Collection<FragmentValue> resolvers_;
    Collection<FragmentValue> directives_;
    std::unordered_set<std::string> known_;

    template <typename T>
    void insert(Collection<T>& collection, Kind kind, const std::string& id, T value);

    template <typename T>
    const T& lookup(const Collection<T>& collection, Kind kind, const std::string& id) const;

    const std::vector<std::string>& idsOf(Kind kind) const;
};

} // namespace schemapp
