#pragma once

/// @file fwd.hpp
/// @author Aleksandr Loshkarev
/// @brief Forward declarations and type aliases for pulljson.

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pulljson {

// ─── Forward declarations ───────────────────────────────────────────────
class JsonValue;

/// JSON value types
enum class Type : uint8_t {
    Null      = 0,
    Bool      = 1,
    Integer   = 2,
    Float     = 3,
    BigNumber = 4,
    String    = 5,
    Array     = 6,
    Object    = 7
};

/// @brief Returns the string representation of a type.
inline const char* type_name(Type t) noexcept {
    switch (t) {
        case Type::Null:      return "null";
        case Type::Bool:      return "bool";
        case Type::Integer:   return "integer";
        case Type::Float:     return "float";
        case Type::BigNumber: return "bignumber";
        case Type::String:    return "string";
        case Type::Array:     return "array";
        case Type::Object:    return "object";
    }
    return "unknown";
}

// ─── Type aliases ───────────────────────────────────────────────────────

/// JSON array: ordered collection of values.
using Array = std::vector<JsonValue>;

/// @brief JSON object: key-value pairs in insertion order.
///
/// Small objects are searched linearly; once an object reaches
/// kIndexThreshold entries a hash index (key -> position) is built
/// lazily and kept in sync on insertion.
struct Object {
    using storage_type = std::vector<std::pair<std::string, JsonValue>>;
    using size_type = size_t;
    using index_type = std::unordered_map<std::string, size_type>;

    storage_type entries;

    /// Lazily created hash index. Stored as unique_ptr to keep sizeof(Object) compact.
    mutable std::unique_ptr<index_type> index_;

    // ─── Constructors (defined in value.hpp) ─────────────────────────

    Object() = default;
    ~Object();
    Object(const Object&);
    Object(Object&&) noexcept;
    Object& operator=(const Object&);
    Object& operator=(Object&&) noexcept;

    /// Initializer-list constructor: {{"key", value}, ...}
    Object(std::initializer_list<std::pair<std::string, JsonValue>> init);

    // ─── Capacity ────────────────────────────────────────────────────────
    bool empty() const noexcept { return entries.empty(); }
    size_type size() const noexcept { return entries.size(); }

    // ─── Iterators ──────────────────────────────────────────────────────
    auto begin() noexcept { return entries.begin(); }
    auto end()   noexcept { return entries.end(); }
    auto begin()  const noexcept { return entries.begin(); }
    auto end()    const noexcept { return entries.end(); }

    // ─── Methods (defined after JsonValue in value.hpp) ─────────────────

    JsonValue* find(std::string_view key);
    const JsonValue* find(std::string_view key) const;
    bool contains(std::string_view key) const;

    /// Access or create an element by key.
    JsonValue& operator[](std::string_view key);

    /// Const access by key. Throws OutOfRangeError if not found.
    const JsonValue& at(std::string_view key) const;

    /// Insert or replace a key-value pair.
    void insert(std::string key, JsonValue value);

    bool erase(std::string_view key);

    /// Key order does not take part in the comparison.
    bool operator==(const Object& other) const;
    bool operator!=(const Object& other) const { return !(*this == other); }

private:
    static constexpr size_type kIndexThreshold = 16;

    bool use_index() const noexcept { return entries.size() >= kIndexThreshold; }
    void ensure_index() const;
};

} // namespace pulljson
