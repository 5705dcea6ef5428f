// ═══════════════════════════════════════════════════════════════════
//  registry.cpp — Keyed fragment storage
// ═══════════════════════════════════════════════════════════════════

#include "schemapp/registry.h"
#include "schemapp/console.h"
#include <utility>

namespace schemapp {

Registry::Registry(Registry&& other) : Registry() {
    std::lock_guard<std::mutex> lock(*other.mutex_);
    definitions_ = std::exchange(other.definitions_, {});
    resolvers_ = std::exchange(other.resolvers_, {});
    directives_ = std::exchange(other.directives_, {});
    known_ = std::exchange(other.known_, {});
}

Registry& Registry::operator=(Registry&& other) {
    if (this == &other) return *this;
    std::scoped_lock lock(*mutex_, *other.mutex_);
    definitions_ = std::exchange(other.definitions_, {});
    resolvers_ = std::exchange(other.resolvers_, {});
    directives_ = std::exchange(other.directives_, {});
    known_ = std::exchange(other.known_, {});
    return *this;
}

template <typename T>
void Registry::insert(Collection<T>& collection, Kind kind, const std::string& id, T value) {
    std::lock_guard<std::mutex> lock(*mutex_);
    if (collection.contains(id)) {
        throw DuplicateIdentifierError(id, kind);
    }
    collection.insert(id, std::move(value));
    known_.insert(id);
    console::debug("registered", kindName(kind), "for", "'" + id + "'");
}

template <typename T>
const T& Registry::lookup(const Collection<T>& collection, Kind kind, const std::string& id) const {
    std::lock_guard<std::mutex> lock(*mutex_);
    auto* found = collection.find(id);
    if (!found) {
        throw SchemaError(std::string("No ") + kindName(kind) + " registered for '" + id + "'");
    }
    return *found;
}

void Registry::addDefinition(const std::string& id, Definition definition) {
    insert(definitions_, Kind::Definitions, id, std::move(definition));
}

void Registry::addResolvers(const std::string& id, FragmentValue resolvers) {
    insert(resolvers_, Kind::Resolvers, id, std::move(resolvers));
}

void Registry::addDirectives(const std::string& id, FragmentValue directives) {
    insert(directives_, Kind::Directives, id, std::move(directives));
}

bool Registry::has(Kind kind, const std::string& id) const {
    std::lock_guard<std::mutex> lock(*mutex_);
    switch (kind) {
        case Kind::Definitions: return definitions_.contains(id);
        case Kind::Resolvers:   return resolvers_.contains(id);
        case Kind::Directives:  return directives_.contains(id);
    }
    return false;
}

bool Registry::hasAny(const std::string& id) const {
    std::lock_guard<std::mutex> lock(*mutex_);
    return known_.count(id) > 0;
}

std::vector<std::string> Registry::ids(Kind kind) const {
    std::lock_guard<std::mutex> lock(*mutex_);
    return idsOf(kind);
}

std::size_t Registry::size(Kind kind) const {
    std::lock_guard<std::mutex> lock(*mutex_);
    return idsOf(kind).size();
}

const Definition& Registry::definition(const std::string& id) const {
    return lookup(definitions_, Kind::Definitions, id);
}

const FragmentValue& Registry::resolvers(const std::string& id) const {
    return lookup(resolvers_, Kind::Resolvers, id);
}

const FragmentValue& Registry::directives(const std::string& id) const {
    return lookup(directives_, Kind::Directives, id);
}

const std::vector<std::string>& Registry::idsOf(Kind kind) const {
    switch (kind) {
        case Kind::Resolvers:  return resolvers_.ids();
        case Kind::Directives: return directives_.ids();
        case Kind::Definitions:
        default:               return definitions_.ids();
    }
}

} // namespace schemapp
