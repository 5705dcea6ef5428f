#pragma once
// ═══════════════════════════════════════════════════════════════════
//  schemapp/errors.h — Error hierarchy
// ═══════════════════════════════════════════════════════════════════
//
//  SchemaError
//   ├─ DuplicateIdentifierError
//   ├─ OrderingConflictError
//   │   ├─ ConflictInFirstError
//   │   ├─ ConflictInSecondError
//   │   ├─ ConflictInBothError
//   │   └─ UnknownCombinationError
//   └─ ImportError
//
// ═══════════════════════════════════════════════════════════════════

#include "fragment.h"
#include <bitset>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace schemapp {

// Six packed booleans describing one pair, see ordering.h
using SignalWord = std::uint8_t;

class SchemaError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ═══════════════════════════════════════════
//  DuplicateIdentifierError
//  Raised by the registry for a second (kind, id) registration, and by
//  the importer when an identifier is already known under any kind.
// ═══════════════════════════════════════════
class DuplicateIdentifierError : public SchemaError {
public:
    DuplicateIdentifierError(std::string id, std::optional<Kind> kind = std::nullopt)
        : SchemaError(describe(id, kind)), id_(std::move(id)), kind_(kind) {}

    const std::string& id() const { return id_; }
    std::optional<Kind> kind() const { return kind_; }

private:
    std::string id_;
    std::optional<Kind> kind_;

    static std::string describe(const std::string& id, std::optional<Kind> kind) {
        if (kind) {
            return std::string("Duplicate identifier '") + id + "' for " + kindName(*kind);
        }
        return "Duplicate identifier '" + id + "'";
    }
};

// ═══════════════════════════════════════════
//  OrderingConflictError
// ═══════════════════════════════════════════
enum class ConflictKind { InFirst, InSecond, InBoth, UnknownCombination };

class OrderingConflictError : public SchemaError {
public:
    OrderingConflictError(ConflictKind kind, SignalWord signals,
                          std::string first, std::string second)
        : SchemaError(describe(kind, signals, first, second)),
          kind_(kind), signals_(signals),
          first_(std::move(first)), second_(std::move(second)) {}

    ConflictKind kind() const { return kind_; }
    SignalWord signals() const { return signals_; }
    const std::string& first() const { return first_; }
    const std::string& second() const { return second_; }

    // Identifiers whose rules are at fault
    std::vector<std::string> offenders() const {
        switch (kind_) {
            case ConflictKind::InFirst:  return {first_};
            case ConflictKind::InSecond: return {second_};
            default:                     return {first_, second_};
        }
    }

private:
    ConflictKind kind_;
    SignalWord signals_;
    std::string first_;
    std::string second_;

    static std::string describe(ConflictKind kind, SignalWord signals,
                                const std::string& first, const std::string& second) {
        std::string bits = std::bitset<6>(signals).to_string();
        std::string pair = "'" + first + "' and '" + second + "'";
        switch (kind) {
            case ConflictKind::InFirst:
                return "Ordering conflict in '" + first + "' while comparing " + pair +
                       " (signals 0b" + bits + ")";
            case ConflictKind::InSecond:
                return "Ordering conflict in '" + second + "' while comparing " + pair +
                       " (signals 0b" + bits + ")";
            case ConflictKind::InBoth:
                return "Ordering conflict between " + pair + " (signals 0b" + bits + ")";
            case ConflictKind::UnknownCombination:
                break;
        }
        return "Unknown signal combination 0b" + bits + " for " + pair;
    }
};

class ConflictInFirstError : public OrderingConflictError {
public:
    ConflictInFirstError(SignalWord signals, std::string first, std::string second)
        : OrderingConflictError(ConflictKind::InFirst, signals, std::move(first), std::move(second)) {}
};

class ConflictInSecondError : public OrderingConflictError {
public:
    ConflictInSecondError(SignalWord signals, std::string first, std::string second)
        : OrderingConflictError(ConflictKind::InSecond, signals, std::move(first), std::move(second)) {}
};

class ConflictInBothError : public OrderingConflictError {
public:
    ConflictInBothError(SignalWord signals, std::string first, std::string second)
        : OrderingConflictError(ConflictKind::InBoth, signals, std::move(first), std::move(second)) {}
};

class UnknownCombinationError : public OrderingConflictError {
public:
    UnknownCombinationError(SignalWord signals, std::string first, std::string second)
        : OrderingConflictError(ConflictKind::UnknownCombination, signals,
                                std::move(first), std::move(second)) {}
};

// ═══════════════════════════════════════════
//  ImportError — unreadable or malformed unit on disk
// ═══════════════════════════════════════════
class ImportError : public SchemaError {
public:
    ImportError(std::string source, const std::string& reason)
        : SchemaError("Cannot import '" + source + "': " + reason),
          source_(std::move(source)) {}

    const std::string& source() const { return source_; }

private:
    std::string source_;
};

} // namespace schemapp
