#pragma once
// ═══════════════════════════════════════════════════════════════════
//  schemapp/json_utils.h — JSON values handed to resolvers
// ═══════════════════════════════════════════════════════════════════
//  Thin wrapper over nlohmann/json. Resolver and directive callables
//  receive parent/args/context as JsonValue and return one.
// ═══════════════════════════════════════════════════════════════════

#include <nlohmann/json.hpp>
#include <string>
#include <initializer_list>

namespace schemapp {

// ─────────────────────────────────────────────
//  Macro: SCHEMAPP_SERIALIZE
//  Makes a config struct readable from JSON; missing keys keep the
//  member's default value.
//
//  Usage:
//    struct Limits {
//        int depth = 4;
//        SCHEMAPP_SERIALIZE(Limits, depth)
//    };
// ─────────────────────────────────────────────
#define SCHEMAPP_SERIALIZE(Type, ...) \
    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(Type, __VA_ARGS__)

// ─────────────────────────────────────────────
//  class JsonValue
//  Null-safe read access to a JSON document.
//  Missing keys and out-of-range indexes yield null instead of throwing.
// ─────────────────────────────────────────────
class JsonValue {
public:
    JsonValue() : data_(nullptr) {}
    JsonValue(const nlohmann::json& j) : data_(j) {}
    JsonValue(nlohmann::json&& j) : data_(std::move(j)) {}

    JsonValue(const std::string& text) : data_(text) {}
    JsonValue(const char* text) : data_(std::string(text)) {}

    JsonValue(std::initializer_list<nlohmann::json::basic_json::value_type> init)
        : data_(nlohmann::json(init)) {}

    JsonValue operator[](const std::string& key) const {
        if (data_.is_object() && data_.contains(key)) {
            return JsonValue(data_[key]);
        }
        return JsonValue();
    }

    JsonValue operator[](const char* key) const {
        return operator[](std::string(key));
    }

    JsonValue operator[](std::size_t index) const {
        if (data_.is_array() && index < data_.size()) {
            return JsonValue(data_[index]);
        }
        return JsonValue();
    }

    JsonValue operator[](int index) const {
        return operator[](static_cast<std::size_t>(index));
    }

    template <typename T>
    T get() const {
        return data_.get<T>();
    }

    template <typename T>
    T get(const std::string& key, const T& defaultValue) const {
        if (!data_.is_object()) return defaultValue;
        auto it = data_.find(key);
        if (it == data_.end() || it->is_null()) return defaultValue;
        return it->get<T>();
    }

    bool isNull() const { return data_.is_null(); }
    bool isObject() const { return data_.is_object(); }
    bool isArray() const { return data_.is_array(); }
    bool isString() const { return data_.is_string(); }
    bool isNumber() const { return data_.is_number(); }
    bool has(const std::string& key) const { return data_.is_object() && data_.contains(key); }
    std::size_t size() const { return data_.size(); }

    std::string dump(int indent = -1) const { return data_.dump(indent); }

    const nlohmann::json& raw() const { return data_; }
    nlohmann::json& raw() { return data_; }

    bool operator==(const JsonValue& other) const { return data_ == other.data_; }
    bool operator!=(const JsonValue& other) const { return data_ != other.data_; }

    friend void to_json(nlohmann::json& j, const JsonValue& v) { j = v.data_; }
    friend void from_json(const nlohmann::json& j, JsonValue& v) { v.data_ = j; }

private:
    nlohmann::json data_;
};

} // namespace schemapp
