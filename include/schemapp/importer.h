#pragma once
// ═══════════════════════════════════════════════════════════════════
//  schemapp/importer.h — Load fragments from a directory
// ═══════════════════════════════════════════════════════════════════
//
//  Each top-level file with a whitelisted extension is one unit, named
//  after its base filename ("user.json" → "user").
//
//    *.graphql, *.gql   SDL text, registered as the unit's definitions
//    anything else      JSON object with optional fields:
//
//      {
//        "definitions": "type User { id: ID! }",
//        "resolvers":   { "Query": { "user": { "id": 1 } } },
//        "directives":  { "upper": true },
//        "after":  ["Query"],
//        "before": ["Post"],
//        "start":  false,
//        "end":    false
//      }
//
// ═══════════════════════════════════════════════════════════════════

#include "builder.h"
#include "fragment.h"
#include <optional>
#include <string>
#include <vector>

namespace schemapp {

struct Unit {
    std::optional<Definition> definitions;
    std::optional<FragmentValue> resolvers;
    std::optional<FragmentValue> directives;
    std::vector<std::string> after;
    std::vector<std::string> before;
    bool start = false;
    bool end = false;

    // Throws ImportError naming source when a field has the wrong type
    static Unit fromJson(const nlohmann::json& j, const std::string& source = "<inline>");
};

class Importer {
public:
    explicit Importer(SchemaBuilder& builder,
                      std::vector<std::string> extensions = {".json", ".graphql", ".gql"})
        : builder_(builder), extensions_(std::move(extensions)) {}

    // Rejects an id already known under any kind before registering anything
    void importUnit(const std::string& id, const Unit& unit);

    // A missing directory imports nothing; returns the number of units imported
    std::size_t importFrom(const std::string& dir);

    // Decode one file into a unit
    static Unit readUnit(const std::string& file);

private:
    SchemaBuilder& builder_;
    std::vector<std::string> extensions_;

    bool accepts(const std::string& extension) const;
};

} // namespace schemapp
