#pragma once
// ═══════════════════════════════════════════════════════════════════
//  schemapp/options.h — Builder configuration
// ═══════════════════════════════════════════════════════════════════
//
//  {
//    "start":      ["index", "Query", "Mutation", "Subscription"],
//    "end":        [],
//    "extensions": [".json", ".graphql", ".gql"],
//    "logLevel":   "info"
//  }
//
//  Every key is optional; missing keys keep the defaults below.
//
// ═══════════════════════════════════════════════════════════════════

#include "console.h"
#include "json_utils.h"
#include <string>
#include <vector>

namespace schemapp {

struct BuilderOptions {
    std::vector<std::string> start = {"index", "Query", "Mutation", "Subscription"};
    std::vector<std::string> end;
    std::vector<std::string> extensions = {".json", ".graphql", ".gql"};
    std::string logLevel = "info";

    // Throws SchemaError for an unrecognized logLevel
    console::Level level() const;

    static BuilderOptions fromJson(const nlohmann::json& j);
    static BuilderOptions fromFile(const std::string& path);

    SCHEMAPP_SERIALIZE(BuilderOptions, start, end, extensions, logLevel)
};

} // namespace schemapp
