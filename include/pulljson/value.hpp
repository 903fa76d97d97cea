#pragma once

/// @file value.hpp
/// @author Aleksandr Loshkarev
/// @brief JsonValue: tagged union over every value the tokenizer produces.
///
/// Implementation:
///   - Scalars stored inline (bool, int64_t, double)
///   - String, BigNumber, Array and Object payloads owned through a pointer
///   - Manual resource management (copy/move/destroy)
///   - BigNumber keeps the exact source text of numbers that neither
///     int64_t nor double represents losslessly

#include "config.hpp"
#include "error.hpp"
#include "fwd.hpp"

#include <cstdlib>
#include <cstring>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace pulljson {

class JsonValue {
public:
    JsonValue() noexcept : kind_(Type::Null) { u_.i = 0; }
    JsonValue(std::nullptr_t) noexcept : kind_(Type::Null) { u_.i = 0; }
    JsonValue(bool v) noexcept : kind_(Type::Bool) { u_.i = 0; u_.b = v; }
    JsonValue(double v) noexcept : kind_(Type::Float) { u_.d = v; }

    /// Any integral type except bool. Unsigned values above INT64_MAX
    /// become a BigNumber.
    template <typename T,
              std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
    JsonValue(T v) : kind_(Type::Integer) {
        if constexpr (std::is_unsigned_v<T>) {
            if (static_cast<uint64_t>(v) > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                kind_ = Type::BigNumber;
                u_.str = new std::string(std::to_string(v));
                return;
            }
        }
        u_.i = static_cast<int64_t>(v);
    }

    JsonValue(const char* v) : kind_(Type::Null) {
        u_.i = 0;
        if (PULLJSON_UNLIKELY(!v)) return;
        kind_ = Type::String;
        u_.str = new std::string(v);
    }
    JsonValue(std::string_view v) : kind_(Type::String) { u_.str = new std::string(v); }
    JsonValue(const std::string& v) : kind_(Type::String) { u_.str = new std::string(v); }
    JsonValue(std::string&& v) : kind_(Type::String) { u_.str = new std::string(std::move(v)); }

    JsonValue(const Array& v) : kind_(Type::Array) { u_.arr = new Array(v); }
    JsonValue(Array&& v) : kind_(Type::Array) { u_.arr = new Array(std::move(v)); }
    JsonValue(const Object& v) : kind_(Type::Object) { u_.obj = new Object(v); }
    JsonValue(Object&& v) : kind_(Type::Object) { u_.obj = new Object(std::move(v)); }

    JsonValue(const JsonValue& o) : kind_(o.kind_) { copy_payload(o); }
    JsonValue(JsonValue&& o) noexcept : kind_(o.kind_), u_(o.u_) {
        o.kind_ = Type::Null;  // Only this is needed for destroy() to be a no-op
    }
    JsonValue& operator=(const JsonValue& o) {
        if (this != &o) { JsonValue tmp(o); swap(tmp); }
        return *this;
    }
    JsonValue& operator=(JsonValue&& o) noexcept {
        if (this != &o) {
            destroy();
            kind_ = o.kind_;
            u_ = o.u_;
            o.kind_ = Type::Null;
        }
        return *this;
    }
    ~JsonValue() { destroy(); }

    void swap(JsonValue& o) noexcept {
        std::swap(kind_, o.kind_);
        std::swap(u_, o.u_);
    }

    [[nodiscard]] static JsonValue array() { return JsonValue(Array{}); }
    [[nodiscard]] static JsonValue object() { return JsonValue(Object{}); }

    /// @brief A number kept as its exact decimal text (e.g. "1e400",
    /// "123456789012345678901234567890"). The text is not validated.
    [[nodiscard]] static JsonValue big_number(std::string text) {
        JsonValue v;
        v.kind_ = Type::BigNumber;
        v.u_.str = new std::string(std::move(text));
        return v;
    }

    [[nodiscard]] Type type() const noexcept { return kind_; }
    [[nodiscard]] bool is_null()       const noexcept { return kind_ == Type::Null; }
    [[nodiscard]] bool is_bool()       const noexcept { return kind_ == Type::Bool; }
    [[nodiscard]] bool is_integer()    const noexcept { return kind_ == Type::Integer; }
    [[nodiscard]] bool is_float()      const noexcept { return kind_ == Type::Float; }
    [[nodiscard]] bool is_big_number() const noexcept { return kind_ == Type::BigNumber; }
    [[nodiscard]] bool is_string()     const noexcept { return kind_ == Type::String; }
    [[nodiscard]] bool is_array()      const noexcept { return kind_ == Type::Array; }
    [[nodiscard]] bool is_object()     const noexcept { return kind_ == Type::Object; }
    [[nodiscard]] bool is_number()     const noexcept {
        return is_integer() || is_float() || is_big_number();
    }

    bool as_bool() const {
        if (PULLJSON_UNLIKELY(!is_bool())) type_error("bool");
        return u_.b;
    }
    int64_t as_integer() const {
        if (PULLJSON_UNLIKELY(!is_integer())) type_error("integer");
        return u_.i;
    }
    /// Numeric value as double; approximate for BigNumber.
    double as_float() const {
        if (is_float()) return u_.d;
        if (is_integer()) return static_cast<double>(u_.i);
        if (is_big_number()) return std::strtod(u_.str->c_str(), nullptr);
        type_error("number");
    }
    double as_number() const { return as_float(); }

    /// Exact decimal text of a BigNumber.
    [[nodiscard]] const std::string& as_number_string() const {
        if (PULLJSON_UNLIKELY(!is_big_number())) type_error("bignumber");
        return *u_.str;
    }

    [[nodiscard]] std::string_view as_string_view() const {
        if (PULLJSON_UNLIKELY(!is_string())) type_error("string");
        return *u_.str;
    }
    [[nodiscard]] std::string as_string() const {
        return std::string(as_string_view());
    }

    [[nodiscard]] const Array& as_array() const {
        if (PULLJSON_UNLIKELY(!is_array())) type_error("array");
        return *u_.arr;
    }
    Array& as_array() {
        if (PULLJSON_UNLIKELY(!is_array())) type_error("array");
        return *u_.arr;
    }
    [[nodiscard]] const Object& as_object() const {
        if (PULLJSON_UNLIKELY(!is_object())) type_error("object");
        return *u_.obj;
    }
    Object& as_object() {
        if (PULLJSON_UNLIKELY(!is_object())) type_error("object");
        return *u_.obj;
    }

    JsonValue& operator[](size_t index) {
        auto& a = as_array();
        if (PULLJSON_UNLIKELY(index >= a.size())) index_error(index, a.size());
        return a[index];
    }
    const JsonValue& operator[](size_t index) const {
        const auto& a = as_array();
        if (PULLJSON_UNLIKELY(index >= a.size())) index_error(index, a.size());
        return a[index];
    }
    JsonValue& operator[](int index) { return operator[](static_cast<size_t>(index)); }
    const JsonValue& operator[](int index) const { return operator[](static_cast<size_t>(index)); }

    JsonValue& operator[](std::string_view key) { return as_object()[key]; }
    const JsonValue& operator[](std::string_view key) const { return as_object().at(key); }
    JsonValue& operator[](const char* key) { return operator[](std::string_view(key)); }
    const JsonValue& operator[](const char* key) const { return operator[](std::string_view(key)); }

    [[nodiscard]] bool contains(std::string_view key) const {
        return is_object() && u_.obj->contains(key);
    }
    [[nodiscard]] const JsonValue* find(std::string_view key) const {
        return is_object() ? u_.obj->find(key) : nullptr;
    }

    [[nodiscard]] size_t size() const noexcept {
        if (is_array())  return u_.arr->size();
        if (is_object()) return u_.obj->size();
        return 0;
    }
    [[nodiscard]] bool empty() const noexcept {
        if (is_null()) return true;
        if (is_array())  return u_.arr->empty();
        if (is_object()) return u_.obj->empty();
        return false;
    }

    void push_back(const JsonValue& v) { as_array().push_back(v); }
    void push_back(JsonValue&& v)      { as_array().push_back(std::move(v)); }

    void insert(std::string key, JsonValue v) {
        as_object().insert(std::move(key), std::move(v));
    }

    /// Numbers compare by value across Integer/Float/BigNumber; two
    /// BigNumbers compare by text.
    [[nodiscard]] bool operator==(const JsonValue& other) const {
        if (kind_ != other.kind_) {
            if (is_number() && other.is_number()) return as_float() == other.as_float();
            return false;
        }
        switch (kind_) {
            case Type::Null:      return true;
            case Type::Bool:      return u_.b == other.u_.b;
            case Type::Integer:   return u_.i == other.u_.i;
            case Type::Float:     return u_.d == other.u_.d;
            case Type::BigNumber:
            case Type::String:    return *u_.str == *other.u_.str;
            case Type::Array:     return *u_.arr == *other.u_.arr;
            case Type::Object:    return *u_.obj == *other.u_.obj;
        }
        return false;
    }
    [[nodiscard]] bool operator!=(const JsonValue& other) const { return !(*this == other); }

    [[nodiscard]] std::string dump(int indent = -1) const;

private:
    Type kind_;
    union Payload {
        bool b; int64_t i; double d;
        std::string* str;  ///< String or BigNumber text
        Array* arr;
        Object* obj;
    } u_;

    [[noreturn]] void type_error(const char* expected) const {
        throw TypeError(std::string("expected ") + expected + ", got " + type_name(kind_));
    }

    [[noreturn]] static void index_error(size_t index, size_t size) {
        throw OutOfRangeError("array index " + std::to_string(index) +
                              " out of range (size=" + std::to_string(size) + ")");
    }

    void copy_payload(const JsonValue& o) {
        switch (o.kind_) {
            case Type::String:
            case Type::BigNumber: u_.str = new std::string(*o.u_.str); break;
            case Type::Array:     u_.arr = new Array(*o.u_.arr); break;
            case Type::Object:    u_.obj = new Object(*o.u_.obj); break;
            default:              u_ = o.u_; break;
        }
    }

    void destroy() noexcept {
        switch (kind_) {
            case Type::String:
            case Type::BigNumber: delete u_.str; break;
            case Type::Array:     delete u_.arr; break;
            case Type::Object:    delete u_.obj; break;
            default: break;
        }
    }
};

// ─── Object special member functions ─────────────────────────────────────

inline Object::~Object() = default;
inline Object::Object(const Object& o) : entries(o.entries) {}
inline Object::Object(Object&& o) noexcept
    : entries(std::move(o.entries)), index_(std::move(o.index_)) {}
inline Object& Object::operator=(const Object& o) {
    if (this != &o) { entries = o.entries; index_.reset(); }
    return *this;
}
inline Object& Object::operator=(Object&& o) noexcept {
    if (this != &o) { entries = std::move(o.entries); index_ = std::move(o.index_); }
    return *this;
}
inline Object::Object(std::initializer_list<std::pair<std::string, JsonValue>> init) {
    for (const auto& [k, v] : init) insert(k, v);
}

inline void Object::ensure_index() const {
    if (!use_index() || index_) return;
    index_ = std::make_unique<index_type>(entries.size() * 2);
    for (size_type i = 0; i < entries.size(); ++i) (*index_)[entries[i].first] = i;
}
inline JsonValue* Object::find(std::string_view key) {
    return const_cast<JsonValue*>(static_cast<const Object&>(*this).find(key));
}
inline const JsonValue* Object::find(std::string_view key) const {
    if (use_index()) {
        ensure_index();
        auto it = index_->find(std::string(key));
        return it != index_->end() ? &entries[it->second].second : nullptr;
    }
    for (const auto& [k, v] : entries) if (k == key) return &v;
    return nullptr;
}
inline bool Object::contains(std::string_view key) const { return find(key) != nullptr; }
inline JsonValue& Object::operator[](std::string_view key) {
    if (auto* p = find(key)) return *p;
    insert(std::string(key), JsonValue{});
    return entries.back().second;
}
inline const JsonValue& Object::at(std::string_view key) const {
    const auto* p = find(key);
    if (PULLJSON_UNLIKELY(!p)) throw OutOfRangeError("key not found: \"" + std::string(key) + "\"");
    return *p;
}
inline void Object::insert(std::string key, JsonValue value) {
    if (auto* p = find(key)) {
        *p = std::move(value);
        return;
    }
    entries.emplace_back(std::move(key), std::move(value));
    if (index_) (*index_)[entries.back().first] = entries.size() - 1;
}
inline bool Object::erase(std::string_view key) {
    for (auto it = entries.begin(); it != entries.end(); ++it) {
        if (it->first == key) {
            entries.erase(it);
            index_.reset();  // positions shifted
            return true;
        }
    }
    return false;
}
inline bool Object::operator==(const Object& other) const {
    if (size() != other.size()) return false;
    for (const auto& [key, val] : entries) {
        const auto* p = other.find(key);
        if (!p || *p != val) return false;
    }
    return true;
}

} // namespace pulljson
