// ═══════════════════════════════════════════════════════════════════
//  options.cpp — Loading builder configuration
// ═══════════════════════════════════════════════════════════════════

#include "schemapp/options.h"
#include "schemapp/errors.h"
#include "schemapp/fs.h"

namespace schemapp {

console::Level BuilderOptions::level() const {
    auto parsed = console::parseLevel(logLevel);
    if (!parsed) {
        throw SchemaError("Unknown log level '" + logLevel +
                          "' (expected debug, info, warn, error or silent)");
    }
    return *parsed;
}

BuilderOptions BuilderOptions::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw SchemaError("Builder options must be a JSON object, got " +
                          std::string(j.type_name()));
    }
    try {
        BuilderOptions options = j.get<BuilderOptions>();
        options.level(); // rejects unknown levels
        return options;
    } catch (const nlohmann::json::exception& e) {
        throw SchemaError(std::string("Invalid builder options: ") + e.what());
    }
}

BuilderOptions BuilderOptions::fromFile(const std::string& path) {
    std::string text;
    try {
        text = fs::readFileSync(path);
    } catch (const std::runtime_error& e) {
        throw SchemaError(e.what());
    }

    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        throw SchemaError("Invalid JSON in options file '" + path + "'");
    }
    return fromJson(parsed);
}

} // namespace schemapp
