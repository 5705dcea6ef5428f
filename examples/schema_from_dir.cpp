// ═══════════════════════════════════════════════════════════════════
//  schema_from_dir.cpp — Assemble a schema payload from a directory
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    schema_from_dir <schema-dir> [options.json]
//
//  Prints the ordered SDL followed by the merged resolver and directive
//  maps. Exits with 1 on a duplicate identifier or ordering conflict.
//
// ═══════════════════════════════════════════════════════════════════

#include "schemapp/schemapp.h"
#include <cctype>
#include <iostream>

using namespace schemapp;

int main(int argc, char** argv) {
    if (argc < 2) {
        console::error("usage:", argv[0], "<schema-dir> [options.json]");
        return 2;
    }

    try {
        BuilderOptions options;
        if (argc > 2) {
            options = BuilderOptions::fromFile(argv[2]);
        }
        console::setLevel(options.level());

        SchemaBuilder builder(options);
        builder.importFrom(argv[1]);

        // Programmatic fragments mix freely with imported ones
        builder.addDirectives("builtin", FragmentValue().set("upper",
            DirectiveResolver([](NextResolver next, const JsonValue&, const JsonValue&,
                                 const JsonValue&) -> JsonValue {
                JsonValue value = next();
                if (!value.isString()) return value;
                std::string text = value.get<std::string>();
                for (auto& c : text) {
                    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
                }
                return JsonValue(text);
            })));
        builder.end("builtin");

        auto payload = builder.build();

        console::log("definition order:", builder.order(Kind::Definitions));
        std::cout << payload.sdl() << "\n\n";
        std::cout << nlohmann::json{
            {"resolvers", payload.resolvers.toJson()},
            {"directiveResolvers", payload.directiveResolvers.toJson()}
        }.dump(2) << std::endl;

    } catch (const OrderingConflictError& e) {
        console::error(e.what());
        console::error("offending identifiers:", e.offenders());
        return 1;
    } catch (const SchemaError& e) {
        console::error(e.what());
        return 1;
    }
    return 0;
}
