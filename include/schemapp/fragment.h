#pragma once
// ═══════════════════════════════════════════════════════════════════
//  schemapp/fragment.h — Fragment payloads
// ═══════════════════════════════════════════════════════════════════
//
//  Three kinds of fragment are registered under an identifier:
//    • Definition     — SDL text (JSON string) or a pre-parsed document
//    • resolver set   — FragmentValue mapping, e.g. { Query: { user: fn } }
//    • directive set  — FragmentValue mapping, e.g. { upper: fn }
//
//  FragmentValue is a tagged union of
//    mapping | data leaf (scalar or sequence) | resolver | directive resolver
//  Only mappings are merged key by key; everything else is atomic.
//
// ═══════════════════════════════════════════════════════════════════

#include "json_utils.h"
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <variant>

namespace schemapp {

enum class Kind { Definitions, Resolvers, Directives };

inline const char* kindName(Kind kind) {
    switch (kind) {
        case Kind::Definitions: return "definitions";
        case Kind::Resolvers:   return "resolvers";
        case Kind::Directives:  return "directives";
    }
    return "unknown";
}

using Definition = nlohmann::json;

// ── Field resolver: (parent, args, context) -> value ──
using Resolver = std::function<JsonValue(const JsonValue& parent,
                                         const JsonValue& args,
                                         const JsonValue& context)>;

// ── Directive resolver: wraps the field's own resolution ──
using NextResolver = std::function<JsonValue()>;
using DirectiveResolver = std::function<JsonValue(NextResolver next,
                                                  const JsonValue& source,
                                                  const JsonValue& args,
                                                  const JsonValue& context)>;

class FragmentValue {
public:
    using Mapping = std::map<std::string, FragmentValue>;

    FragmentValue() : data_(Mapping{}) {}
    FragmentValue(Mapping mapping) : data_(std::move(mapping)) {}
    FragmentValue(Resolver resolver) : data_(std::move(resolver)) {}
    FragmentValue(DirectiveResolver directive) : data_(std::move(directive)) {}

    // JSON objects become mappings (recursively), anything else a leaf
    FragmentValue(const nlohmann::json& j) : data_(Mapping{}) {
        if (j.is_object()) {
            auto& mapping = std::get<Mapping>(data_);
            for (auto& [key, value] : j.items()) {
                mapping.emplace(key, FragmentValue(value));
            }
        } else {
            data_.emplace<nlohmann::json>(j);
        }
    }

    // ── Fluent construction ──
    FragmentValue& set(const std::string& key, FragmentValue value) {
        if (!isMapping()) {
            throw std::logic_error("FragmentValue::set on a non-mapping value");
        }
        std::get<Mapping>(data_).insert_or_assign(key, std::move(value));
        return *this;
    }

    // ── Inspection ──
    bool isMapping() const { return std::holds_alternative<Mapping>(data_); }
    bool isLeaf() const { return std::holds_alternative<nlohmann::json>(data_); }
    bool isResolver() const { return std::holds_alternative<Resolver>(data_); }
    bool isDirective() const { return std::holds_alternative<DirectiveResolver>(data_); }
    bool isCallable() const { return isResolver() || isDirective(); }

    const Mapping& mapping() const { return std::get<Mapping>(data_); }
    Mapping& mapping() { return std::get<Mapping>(data_); }
    const nlohmann::json& leaf() const { return std::get<nlohmann::json>(data_); }
    const Resolver& resolver() const { return std::get<Resolver>(data_); }
    const DirectiveResolver& directive() const { return std::get<DirectiveResolver>(data_); }

    bool contains(const std::string& key) const {
        return isMapping() && mapping().count(key) > 0;
    }

    const FragmentValue& at(const std::string& key) const {
        if (!isMapping()) {
            throw std::out_of_range("FragmentValue::at('" + key + "') on a non-mapping value");
        }
        auto it = mapping().find(key);
        if (it == mapping().end()) {
            throw std::out_of_range("FragmentValue::at: no key '" + key + "'");
        }
        return it->second;
    }

    // Number of keys for a mapping, 1 for anything else
    std::size_t size() const { return isMapping() ? mapping().size() : 1; }
    bool empty() const { return isMapping() && mapping().empty(); }

    // ── Rendering for logs and inspection; callables print as "[Function]" ──
    nlohmann::json toJson() const {
        if (isMapping()) {
            nlohmann::json obj = nlohmann::json::object();
            for (auto& [key, value] : mapping()) {
                obj[key] = value.toJson();
            }
            return obj;
        }
        if (isLeaf()) return leaf();
        return "[Function]";
    }

private:
    std::variant<Mapping, nlohmann::json, Resolver, DirectiveResolver> data_;
};

} // namespace schemapp
