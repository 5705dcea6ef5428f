#pragma once
// ═══════════════════════════════════════════════════════════════════
//  schemapp/builder.h — Per-run schema assembly context
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    SchemaBuilder builder;
//    builder.addDefinitions("User", "type User { id: ID! }")
//           .addResolvers("User", resolvers)
//           .after("User", {"Query"});
//    builder.importFrom("./schema");
//    SchemaPayload payload = builder.build();
//
//  A builder holds the state of one assembly run. Create a new one for
//  the next run.
//
// ═══════════════════════════════════════════════════════════════════

#include "constraints.h"
#include "fragment.h"
#include "options.h"
#include "registry.h"
#include <string>
#include <vector>

namespace schemapp {

// ── Everything an executable-schema builder needs ──
struct SchemaPayload {
    std::vector<Definition> typeDefs;
    FragmentValue resolvers;
    FragmentValue directiveResolvers;

    // SDL text of all string definitions, in order, blank-line separated
    std::string sdl() const;

    nlohmann::json toJson() const;
};

class SchemaBuilder {
public:
    explicit SchemaBuilder(BuilderOptions options = {});

    // ── Registration ──
    SchemaBuilder& addDefinitions(const std::string& id, Definition definitions);
    SchemaBuilder& addResolvers(const std::string& id, FragmentValue resolvers);
    SchemaBuilder& addDirectives(const std::string& id, FragmentValue directives);

    // ── Ordering rules ──
    SchemaBuilder& after(const std::string& id, const std::vector<std::string>& others);
    SchemaBuilder& before(const std::string& id, const std::vector<std::string>& others);
    SchemaBuilder& start(const std::string& id);
    SchemaBuilder& start(const std::vector<std::string>& ids);
    SchemaBuilder& end(const std::string& id);
    SchemaBuilder& end(const std::vector<std::string>& ids);

    bool has(Kind kind, const std::string& id) const { return registry_.has(kind, id); }
    bool hasAny(const std::string& id) const { return registry_.hasAny(id); }

    // Import every whitelisted file in dir; returns the number of units imported
    std::size_t importFrom(const std::string& dir);

    std::vector<std::string> order(Kind kind) const;

    // Throws OrderingConflictError; never returns a partial payload
    SchemaPayload build() const;

    const Registry& registry() const { return registry_; }
    const ConstraintStore& constraints() const { return constraints_; }
    const BuilderOptions& options() const { return options_; }

private:
    BuilderOptions options_;
    Registry registry_;
    ConstraintStore constraints_;
};

} // namespace schemapp
