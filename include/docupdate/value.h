// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Dynamic document value used for update documents.
///
/// This file defines the Value type that can represent:
/// - Primitive types: signed/unsigned integers, float, double, bool, string
/// - Container types: map and vector (using immer's immutable containers)
/// - Encoded fragments: RawValue (type tag + still-encoded payload)
/// - Null (std::monostate)
///
/// Value is the document model of the library: the two halves of an Update
/// are ValueMaps, and typed inputs are converted into Values before they are
/// placed in them.

#pragma once

#include "api.h"
#include "config.h"

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <cstdint>
#include <iostream>
#include <source_location>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace docupdate {

namespace detail {

inline void log_config_error(
    std::string_view type_name,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if DOCUPDATE_VERBOSE_LOG
    std::cerr << "[describe " << type_name << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)type_name;
    (void)message;
    (void)loc;
#endif
}

inline void log_key_error(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if DOCUPDATE_VERBOSE_LOG
    std::cerr << "[" << func << "] key '" << key << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)key;
    (void)reason;
    (void)loc;
#endif
}

inline void log_index_error(
    std::string_view func,
    std::size_t index,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if DOCUPDATE_VERBOSE_LOG
    std::cerr << "[" << func << "] index " << index << " " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)index;
    (void)reason;
    (void)loc;
#endif
}

} // namespace detail

/// @brief Byte buffer type for binary serialization
using ByteBuffer = std::vector<uint8_t>;

/// Type tags of the binary format (see serialization.h)
enum class TypeTag : uint8_t {
    Null   = 0x00,
    Int32  = 0x01,
    Float  = 0x02,
    Double = 0x03,
    Bool   = 0x04,
    String = 0x05,
    Map    = 0x06,
    Vector = 0x07,
    Int64  = 0x0A,
    Int8   = 0x0B,
    Int16  = 0x0C,
    UInt8  = 0x0D,
    UInt16 = 0x0E,
    UInt32 = 0x0F,
    UInt64 = 0x16,
};

struct Value;

/// An encoded fragment: the type tag of a value and the payload bytes that
/// follow the tag. A RawValue of kind Map is a pre-encoded document.
struct DOCUPDATE_API RawValue {
    uint8_t kind = static_cast<uint8_t>(TypeTag::Null);
    ByteBuffer data;

    RawValue() = default;
    RawValue(uint8_t k, ByteBuffer d) : kind(k), data(std::move(d)) {}
    RawValue(TypeTag k, ByteBuffer d) : kind(static_cast<uint8_t>(k)), data(std::move(d)) {}

    [[nodiscard]] bool is_document() const noexcept {
        return kind == static_cast<uint8_t>(TypeTag::Map);
    }

    /// Decode the fragment into a Value
    /// @throws DecodeError on malformed payload
    [[nodiscard]] Value unmarshal() const;

    bool operator==(const RawValue&) const = default;
};

using ValueBox    = immer::box<Value>;
using ValueMap    = immer::map<std::string, ValueBox>;
using ValueVector = immer::vector<ValueBox>;

struct DOCUPDATE_API Value
{
    std::variant<int8_t,
                 int16_t,
                 int32_t,
                 int64_t,
                 uint8_t,
                 uint16_t,
                 uint32_t,
                 uint64_t,
                 float,
                 double,
                 bool,
                 std::string,
                 ValueMap,
                 ValueVector,
                 RawValue,
                 std::monostate>
        data;

    Value() noexcept : data(std::monostate{}) {}
    Value(int8_t v) noexcept : data(v) {}
    Value(int16_t v) noexcept : data(v) {}
    Value(int32_t v) noexcept : data(v) {}
    Value(int64_t v) noexcept : data(v) {}
    Value(uint8_t v) noexcept : data(v) {}
    Value(uint16_t v) noexcept : data(v) {}
    Value(uint32_t v) noexcept : data(v) {}
    Value(uint64_t v) noexcept : data(v) {}
    Value(float v) noexcept : data(v) {}
    Value(double v) noexcept : data(v) {}
    Value(bool v) noexcept : data(v) {}
    Value(const std::string& v) : data(v) {}
    Value(std::string&& v) noexcept : data(std::move(v)) {}
    Value(const char* v) : data(std::in_place_type<std::string>, v) {}
    Value(ValueMap v) : data(std::move(v)) {}
    Value(ValueVector v) : data(std::move(v)) {}
    Value(RawValue v) : data(std::move(v)) {}

    static Value map(std::initializer_list<std::pair<std::string, Value>> init) {
        auto t = ValueMap{}.transient();
        for (const auto& [key, val] : init) {
            t.set(key, ValueBox{val});
        }
        return Value{t.persistent()};
    }

    static Value vector(std::initializer_list<Value> init) {
        auto t = ValueVector{}.transient();
        for (const auto& val : init) {
            t.push_back(ValueBox{val});
        }
        return Value{t.persistent()};
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] std::size_t type_index() const noexcept { return data.index(); }
    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data); }
    [[nodiscard]] bool is_map() const noexcept { return is<ValueMap>(); }
    [[nodiscard]] bool is_vector() const noexcept { return is<ValueVector>(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }
    [[nodiscard]] bool is_raw() const noexcept { return is<RawValue>(); }

    [[nodiscard]] Value at(const std::string& key) const {
        if (auto* m = get_if<ValueMap>()) {
            if (auto* found = m->find(key)) return found->get();
        }
        detail::log_key_error("Value::at", key, "not found or type mismatch");
        return Value{};
    }

    [[nodiscard]] Value at(std::size_t index) const {
        if (auto* v = get_if<ValueVector>()) {
            if (index < v->size()) return (*v)[index].get();
        }
        detail::log_index_error("Value::at", index, "out of range or type mismatch");
        return Value{};
    }

    template<typename T>
    [[nodiscard]] T get_or(T default_val = T{}) const {
        if (auto* ptr = get_if<T>()) return *ptr;
        return default_val;
    }

    [[nodiscard]] int as_int(int default_val = 0) const {
        if (auto* p = get_if<int>()) return *p;
        return default_val;
    }

    [[nodiscard]] int64_t as_int64(int64_t default_val = 0) const {
        if (auto* p = get_if<int64_t>()) return *p;
        return default_val;
    }

    [[nodiscard]] double as_double(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
        return default_val;
    }

    [[nodiscard]] bool as_bool(bool default_val = false) const {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string_view as_string_view() const noexcept {
        if (auto* p = get_if<std::string>()) return *p;
        return {};
    }

    [[nodiscard]] bool contains(const std::string& key) const { return count(key) > 0; }

    [[nodiscard]] Value set(const std::string& key, Value val) const {
        if (auto* m = get_if<ValueMap>()) return m->set(key, ValueBox{std::move(val)});
        if (is_null()) return ValueMap{}.set(key, ValueBox{std::move(val)});
        detail::log_key_error("Value::set", key, "cannot set on non-map type");
        return *this;
    }

    [[nodiscard]] std::size_t count(const std::string& key) const {
        if (auto* m = get_if<ValueMap>()) return m->count(key);
        return 0;
    }

    [[nodiscard]] std::size_t size() const {
        if (auto* m = get_if<ValueMap>()) return m->size();
        if (auto* v = get_if<ValueVector>()) return v->size();
        return 0;
    }

    using size_type = std::size_t;
};

inline bool operator==(const Value& a, const Value& b)
{
    return a.data == b.data;
}

// ============================================================
// Utility functions
// ============================================================

/// Short name of the alternative held by val: "int32", "string", "map", ...
[[nodiscard]] DOCUPDATE_API std::string_view kind_name(const Value& val) noexcept;

/// Convert Value to human-readable string
[[nodiscard]] DOCUPDATE_API std::string value_to_string(const Value& val);

/// Print Value with indentation
DOCUPDATE_API void print_value(const Value& val, const std::string& prefix = "", std::size_t depth = 0);

} // namespace docupdate
