// ═══════════════════════════════════════════════════════════════════
//  builder.cpp — SchemaBuilder and SchemaPayload
// ═══════════════════════════════════════════════════════════════════

#include "schemapp/builder.h"
#include "schemapp/aggregator.h"
#include "schemapp/console.h"
#include "schemapp/errors.h"
#include "schemapp/importer.h"

namespace schemapp {

// ═══════════════════════════════════════════
//  SchemaPayload
// ═══════════════════════════════════════════

std::string SchemaPayload::sdl() const {
    std::string result;
    for (auto& def : typeDefs) {
        if (!def.is_string()) continue;
        if (!result.empty()) result += "\n\n";
        result += def.get<std::string>();
    }
    return result;
}

nlohmann::json SchemaPayload::toJson() const {
    return nlohmann::json{
        {"typeDefs", typeDefs},
        {"resolvers", resolvers.toJson()},
        {"directiveResolvers", directiveResolvers.toJson()}
    };
}

// ═══════════════════════════════════════════
//  SchemaBuilder
// ═══════════════════════════════════════════

SchemaBuilder::SchemaBuilder(BuilderOptions options)
    : options_(std::move(options)),
      constraints_(options_.start, options_.end) {}

SchemaBuilder& SchemaBuilder::addDefinitions(const std::string& id, Definition definitions) {
    registry_.addDefinition(id, std::move(definitions));
    return *this;
}

SchemaBuilder& SchemaBuilder::addResolvers(const std::string& id, FragmentValue resolvers) {
    if (!resolvers.isMapping()) {
        throw SchemaError("Resolvers for '" + id + "' must be a mapping");
    }
    registry_.addResolvers(id, std::move(resolvers));
    return *this;
}

SchemaBuilder& SchemaBuilder::addDirectives(const std::string& id, FragmentValue directives) {
    if (!directives.isMapping()) {
        throw SchemaError("Directives for '" + id + "' must be a mapping");
    }
    registry_.addDirectives(id, std::move(directives));
    return *this;
}

SchemaBuilder& SchemaBuilder::after(const std::string& id, const std::vector<std::string>& others) {
    constraints_.declareAfter(id, others);
    return *this;
}

SchemaBuilder& SchemaBuilder::before(const std::string& id, const std::vector<std::string>& others) {
    constraints_.declareBefore(id, others);
    return *this;
}

SchemaBuilder& SchemaBuilder::start(const std::string& id) {
    constraints_.markStart(id);
    return *this;
}

SchemaBuilder& SchemaBuilder::start(const std::vector<std::string>& ids) {
    constraints_.markStart(ids);
    return *this;
}

SchemaBuilder& SchemaBuilder::end(const std::string& id) {
    constraints_.markEnd(id);
    return *this;
}

SchemaBuilder& SchemaBuilder::end(const std::vector<std::string>& ids) {
    constraints_.markEnd(ids);
    return *this;
}

std::size_t SchemaBuilder::importFrom(const std::string& dir) {
    Importer importer(*this, options_.extensions);
    return importer.importFrom(dir);
}

std::vector<std::string> SchemaBuilder::order(Kind kind) const {
    return Aggregator(registry_, constraints_).order(kind);
}

SchemaPayload SchemaBuilder::build() const {
    Aggregator aggregator(registry_, constraints_);

    SchemaPayload payload;
    payload.typeDefs = aggregator.orderAndList();
    payload.resolvers = aggregator.orderAndMerge(Kind::Resolvers);
    payload.directiveResolvers = aggregator.orderAndMerge(Kind::Directives);

    console::info("schema assembled:",
                  payload.typeDefs.size(), "definitions,",
                  registry_.size(Kind::Resolvers), "resolver sets,",
                  registry_.size(Kind::Directives), "directive sets");
    return payload;
}

} // namespace schemapp
