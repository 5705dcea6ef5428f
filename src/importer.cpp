// ═══════════════════════════════════════════════════════════════════
//  importer.cpp — Directory import of schema units
// ═══════════════════════════════════════════════════════════════════

#include "schemapp/importer.h"
#include "schemapp/console.h"
#include "schemapp/errors.h"
#include "schemapp/fs.h"
#include <algorithm>

namespace schemapp {

namespace {

std::vector<std::string> readIdList(const nlohmann::json& j, const char* field,
                                    const std::string& source) {
    if (!j.is_array()) {
        throw ImportError(source, std::string("'") + field + "' must be an array of identifiers");
    }
    std::vector<std::string> ids;
    for (auto& item : j) {
        if (!item.is_string()) {
            throw ImportError(source, std::string("'") + field + "' must only contain strings");
        }
        ids.push_back(item.get<std::string>());
    }
    return ids;
}

bool readFlag(const nlohmann::json& j, const char* field, const std::string& source) {
    if (!j.is_boolean()) {
        throw ImportError(source, std::string("'") + field + "' must be a boolean");
    }
    return j.get<bool>();
}

bool isSdlExtension(const std::string& extension) {
    return extension == ".graphql" || extension == ".gql";
}

} // namespace

// ═══════════════════════════════════════════
//  Unit
// ═══════════════════════════════════════════

Unit Unit::fromJson(const nlohmann::json& j, const std::string& source) {
    if (!j.is_object()) {
        throw ImportError(source, "expected a JSON object, got " + std::string(j.type_name()));
    }

    Unit unit;
    if (auto it = j.find("definitions"); it != j.end() && !it->is_null()) {
        if (!it->is_string() && !it->is_object() && !it->is_array()) {
            throw ImportError(source, "'definitions' must be SDL text or a parsed document");
        }
        unit.definitions = *it;
    }
    if (auto it = j.find("resolvers"); it != j.end() && !it->is_null()) {
        if (!it->is_object()) {
            throw ImportError(source, "'resolvers' must be an object");
        }
        unit.resolvers = FragmentValue(*it);
    }
    if (auto it = j.find("directives"); it != j.end() && !it->is_null()) {
        if (!it->is_object()) {
            throw ImportError(source, "'directives' must be an object");
        }
        unit.directives = FragmentValue(*it);
    }
    if (auto it = j.find("after"); it != j.end() && !it->is_null()) {
        unit.after = readIdList(*it, "after", source);
    }
    if (auto it = j.find("before"); it != j.end() && !it->is_null()) {
        unit.before = readIdList(*it, "before", source);
    }
    if (auto it = j.find("start"); it != j.end() && !it->is_null()) {
        unit.start = readFlag(*it, "start", source);
    }
    if (auto it = j.find("end"); it != j.end() && !it->is_null()) {
        unit.end = readFlag(*it, "end", source);
    }
    return unit;
}

// ═══════════════════════════════════════════
//  Importer
// ═══════════════════════════════════════════

void Importer::importUnit(const std::string& id, const Unit& unit) {
    if (builder_.hasAny(id)) {
        throw DuplicateIdentifierError(id);
    }

    if (unit.definitions) builder_.addDefinitions(id, *unit.definitions);
    if (unit.resolvers)   builder_.addResolvers(id, *unit.resolvers);
    if (unit.directives)  builder_.addDirectives(id, *unit.directives);

    builder_.after(id, unit.after);
    builder_.before(id, unit.before);
    if (unit.start) builder_.start(id);
    if (unit.end)   builder_.end(id);
}

std::size_t Importer::importFrom(const std::string& dir) {
    const std::string root = path::resolve(dir);
    if (!fs::existsSync(root)) {
        console::warn("import path does not exist:", root);
        return 0;
    }

    std::vector<std::string> entries;
    try {
        entries = fs::readdirSync(root);
    } catch (const std::runtime_error& e) {
        throw ImportError(root, e.what());
    }

    std::size_t imported = 0;
    for (auto& entry : entries) {
        const std::string file = path::join(root, entry);
        const std::string extension = path::extname(entry);
        if (!accepts(extension) || !fs::isFileSync(file)) {
            continue;
        }

        const std::string id = path::stem(entry);
        importUnit(id, readUnit(file));
        console::debug("imported", "'" + id + "'", "from", file);
        ++imported;
    }

    console::info("imported", imported, "units from", root);
    return imported;
}

Unit Importer::readUnit(const std::string& file) {
    std::string text;
    try {
        text = fs::readFileSync(file);
    } catch (const std::runtime_error& e) {
        throw ImportError(file, e.what());
    }

    if (isSdlExtension(path::extname(file))) {
        Unit unit;
        unit.definitions = text;
        return unit;
    }

    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        throw ImportError(file, "invalid JSON");
    }
    return Unit::fromJson(parsed, file);
}

bool Importer::accepts(const std::string& extension) const {
    return std::find(extensions_.begin(), extensions_.end(), extension) != extensions_.end();
}

} // namespace schemapp
