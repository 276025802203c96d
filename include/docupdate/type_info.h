// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file type_info.h
/// @brief Runtime type model for the values accepted by as_update().
///
/// Every C++ type that reaches the update builder is described by a
/// TypeInfo: its Kind plus a small table of type-erased operations on a
/// `const void*` instance. type_of<T>() builds the table once per type.
///
/// Structs are made visible to the library by specializing RecordTraits:
/// @code
///   struct Account {
///       std::string id;
///       std::string owner;
///       int64_t balance = 0;
///   };
///
///   template <>
///   struct docupdate::RecordTraits<Account> {
///       static constexpr std::string_view name = "Account";
///       static std::vector<FieldInfo> fields() {
///           return {
///               field<&Account::id>("Id", "_id"),
///               field<&Account::owner>("Owner"),
///               field<&Account::balance>("Balance", ",omitempty"),
///           };
///       }
///   };
/// @endcode
///
/// A type may replace itself with another value before it is turned into a
/// document by providing, in its own namespace:
/// @code
///   docupdate::Boxed get_document(const MyType* self);
/// @endcode
/// When reached through a pointer-like value the hook is called even if the
/// pointer is absent, with self == nullptr.

#pragma once

#include "api.h"
#include "value.h"

#include <array>
#include <chrono>
#include <concepts>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <vector>

namespace docupdate {

enum class Kind : uint8_t {
    String,
    Bool,
    Int,
    Uint,
    Float,
    Time,     ///< std::chrono::system_clock::time_point
    Pointer,  ///< T*, shared_ptr, unique_ptr, optional
    Sequence,
    Map,
    Record,
    Dynamic,  ///< Value
    Raw,      ///< RawValue
    Func,
    Opaque,   ///< known only through its get_document() hook
};

[[nodiscard]] DOCUPDATE_API std::string_view to_string(Kind kind) noexcept;

struct TypeInfo;
class Boxed;

/// Non-owning typed view of an instance
struct ValueRef {
    const TypeInfo* type = nullptr;
    const void* ptr = nullptr;
};

using EntryVisitor = std::function<void(ValueRef key, ValueRef value)>;

/// One registered member of a record
struct FieldInfo {
    std::string name;
    std::string tag;
    bool exported = true;   ///< false for fields registered with hidden<>()
    bool anonymous = false; ///< true for embedded base records
    const TypeInfo& (*type)() = nullptr;
    const void* (*get)(const void* owner) = nullptr;

    [[nodiscard]] ValueRef ref(const void* owner) const { return {&type(), get(owner)}; }
};

struct TypeInfo {
    Kind kind;
    std::string_view name;
    std::type_index id;

    // String, Bool, Int, Uint, Float, Time, Dynamic, Raw
    Value (*scalar)(const void*) = nullptr;
    bool (*zero)(const void*) = nullptr;
    // String only
    std::string_view (*text)(const void*) = nullptr;

    // Pointer: element type; deref yields nullptr when absent
    // Sequence/Map: element (mapped) type
    const TypeInfo& (*elem)() = nullptr;
    const void* (*deref)(const void*) = nullptr;

    // Sequence, Map
    const TypeInfo& (*key)() = nullptr;
    std::size_t (*size)(const void*) = nullptr;
    void (*for_each)(const void*, const EntryVisitor&) = nullptr;

    // Record
    const std::vector<FieldInfo>& (*fields)() = nullptr;

    // Custom representation hook (get_document)
    Boxed (*represent)(const void*) = nullptr;

    [[nodiscard]] bool is_record() const noexcept { return kind == Kind::Record; }
};

/// Specialize for each struct that should be usable as a record
template <typename T>
struct RecordTraits;

template <typename T>
const TypeInfo& type_of();

/// Owning, type-erased value. Returned by get_document() hooks.
class Boxed {
public:
    /// A null Value
    Boxed();

    template <typename T>
    static Boxed of(T value) {
        using U = std::decay_t<T>;
        return Boxed{&type_of<U>(), std::make_shared<const U>(std::move(value))};
    }

    [[nodiscard]] ValueRef ref() const noexcept { return {type_, holder_.get()}; }
    [[nodiscard]] const TypeInfo& type() const noexcept { return *type_; }

private:
    Boxed(const TypeInfo* type, std::shared_ptr<const void> holder)
        : type_(type), holder_(std::move(holder)) {}

    const TypeInfo* type_;
    std::shared_ptr<const void> holder_;
};

// ============================================================
// Concepts
// ============================================================

template <typename T>
concept Record = requires {
    { RecordTraits<T>::name } -> std::convertible_to<std::string_view>;
    { RecordTraits<T>::fields() } -> std::convertible_to<std::vector<FieldInfo>>;
};

template <typename T>
concept Representable = requires(const T* self) {
    { get_document(self) } -> std::same_as<Boxed>;
};

namespace detail {

template <typename T>
inline constexpr bool dependent_false = false;

template <typename M>
struct member_traits;

template <typename C, typename M>
struct member_traits<M C::*> {
    using owner = C;
    using type = M;
};

template <typename F>
struct upcast_traits;

template <typename D, typename B>
struct upcast_traits<const B* (*)(const D*)> {
    using derived = D;
    using base = B;
};

template <typename T>
struct pointer_like : std::false_type {};

template <typename T>
struct pointer_like<T*> : std::true_type {
    using element_type = T;
    static const T* get(const T* p) noexcept { return p; }
};

template <typename T>
struct pointer_like<std::shared_ptr<T>> : std::true_type {
    using element_type = T;
    static const T* get(const std::shared_ptr<T>& p) noexcept { return p.get(); }
};

template <typename T, typename D>
struct pointer_like<std::unique_ptr<T, D>> : std::true_type {
    using element_type = T;
    static const T* get(const std::unique_ptr<T, D>& p) noexcept { return p.get(); }
};

template <typename T>
struct pointer_like<std::optional<T>> : std::true_type {
    using element_type = T;
    static const T* get(const std::optional<T>& p) noexcept { return p ? &*p : nullptr; }
};

template <typename T>
struct is_function_object : std::false_type {};

template <typename Sig>
struct is_function_object<std::function<Sig>> : std::true_type {};

template <typename T>
concept StringType = std::same_as<T, std::string> || std::same_as<T, std::string_view> ||
                     std::same_as<T, const char*>;

template <typename T>
concept MapType = requires(const T& t) {
    typename T::key_type;
    typename T::mapped_type;
    { t.size() } -> std::convertible_to<std::size_t>;
    t.begin();
    t.end();
};

template <typename T>
concept SequenceType = !StringType<T> && !MapType<T> && requires(const T& t) {
    typename T::value_type;
    { t.size() } -> std::convertible_to<std::size_t>;
    t.begin();
    t.end();
};

using time_point = std::chrono::system_clock::time_point;

template <typename T>
Value integral_value(T v) {
    if constexpr (std::is_signed_v<T>) {
        if constexpr (sizeof(T) == 1) return Value{static_cast<int8_t>(v)};
        else if constexpr (sizeof(T) == 2) return Value{static_cast<int16_t>(v)};
        else if constexpr (sizeof(T) == 4) return Value{static_cast<int32_t>(v)};
        else return Value{static_cast<int64_t>(v)};
    } else {
        if constexpr (sizeof(T) == 1) return Value{static_cast<uint8_t>(v)};
        else if constexpr (sizeof(T) == 2) return Value{static_cast<uint16_t>(v)};
        else if constexpr (sizeof(T) == 4) return Value{static_cast<uint32_t>(v)};
        else return Value{static_cast<uint64_t>(v)};
    }
}

template <typename T>
const T& as(const void* p) noexcept {
    return *static_cast<const T*>(p);
}

template <typename T>
std::string_view text_of(const void* p) noexcept {
    if constexpr (std::same_as<T, const char*>) {
        const char* s = as<const char*>(p);
        return s ? std::string_view{s} : std::string_view{};
    } else {
        return std::string_view{as<T>(p)};
    }
}

template <typename T>
const std::vector<FieldInfo>& record_fields() {
    static const std::vector<FieldInfo> fields = RecordTraits<T>::fields();
    return fields;
}

template <typename T>
TypeInfo make_type_info() {
    TypeInfo info{.kind = Kind::Func, .name = {}, .id = std::type_index(typeid(T))};

    if constexpr (std::same_as<T, Value>) {
        info.kind = Kind::Dynamic;
        info.scalar = [](const void* p) { return as<Value>(p); };
        info.zero = [](const void* p) { return as<Value>(p).is_null(); };
    } else if constexpr (std::same_as<T, RawValue>) {
        info.kind = Kind::Raw;
        info.scalar = [](const void* p) { return Value{as<RawValue>(p)}; };
        info.zero = [](const void*) { return false; };
    } else if constexpr (Record<T>) {
        info.kind = Kind::Record;
        info.name = RecordTraits<T>::name;
        info.fields = &record_fields<T>;
    } else if constexpr (StringType<T>) {
        info.kind = Kind::String;
        info.text = &text_of<T>;
        info.scalar = [](const void* p) { return Value{std::string{text_of<T>(p)}}; };
        info.zero = [](const void* p) { return text_of<T>(p).empty(); };
    } else if constexpr (std::same_as<T, bool>) {
        info.kind = Kind::Bool;
        info.scalar = [](const void* p) { return Value{as<bool>(p)}; };
        info.zero = [](const void* p) { return !as<bool>(p); };
    } else if constexpr (std::is_enum_v<T>) {
        using U = std::underlying_type_t<T>;
        info.kind = std::is_signed_v<U> ? Kind::Int : Kind::Uint;
        info.scalar = [](const void* p) { return integral_value(static_cast<U>(as<T>(p))); };
        info.zero = [](const void* p) { return static_cast<U>(as<T>(p)) == 0; };
    } else if constexpr (std::is_integral_v<T>) {
        info.kind = std::is_signed_v<T> ? Kind::Int : Kind::Uint;
        info.scalar = [](const void* p) { return integral_value(as<T>(p)); };
        info.zero = [](const void* p) { return as<T>(p) == 0; };
    } else if constexpr (std::is_floating_point_v<T>) {
        info.kind = Kind::Float;
        info.scalar = [](const void* p) {
            if constexpr (std::same_as<T, float>) return Value{as<float>(p)};
            else return Value{static_cast<double>(as<T>(p))};
        };
        info.zero = [](const void* p) { return as<T>(p) == 0; };
    } else if constexpr (std::same_as<T, time_point>) {
        info.kind = Kind::Time;
        info.scalar = [](const void* p) {
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                as<time_point>(p).time_since_epoch());
            return Value{static_cast<int64_t>(ms.count())};
        };
        info.zero = [](const void* p) { return as<time_point>(p) == time_point{}; };
    } else if constexpr (pointer_like<T>::value) {
        using E = std::remove_cv_t<typename pointer_like<T>::element_type>;
        info.kind = Kind::Pointer;
        info.elem = &type_of<E>;
        info.deref = [](const void* p) -> const void* { return pointer_like<T>::get(as<T>(p)); };
        if constexpr (Representable<E>) {
            info.represent = [](const void* p) -> Boxed {
                return get_document(pointer_like<T>::get(as<T>(p)));
            };
        }
    } else if constexpr (is_function_object<T>::value) {
        info.kind = Kind::Func;
    } else if constexpr (MapType<T>) {
        using K = typename T::key_type;
        using V = typename T::mapped_type;
        info.kind = Kind::Map;
        info.key = &type_of<K>;
        info.elem = &type_of<V>;
        info.size = [](const void* p) -> std::size_t { return as<T>(p).size(); };
        info.for_each = [](const void* p, const EntryVisitor& visit) {
            for (const auto& [k, v] : as<T>(p)) {
                visit(ValueRef{&type_of<K>(), &k}, ValueRef{&type_of<V>(), &v});
            }
        };
    } else if constexpr (SequenceType<T>) {
        using V = typename T::value_type;
        static_assert(!std::same_as<T, std::vector<bool>>, "std::vector<bool> is not supported");
        info.kind = Kind::Sequence;
        info.elem = &type_of<V>;
        info.size = [](const void* p) -> std::size_t { return as<T>(p).size(); };
        info.for_each = [](const void* p, const EntryVisitor& visit) {
            for (const auto& v : as<T>(p)) {
                visit(ValueRef{}, ValueRef{&type_of<V>(), &v});
            }
        };
    } else if constexpr (Representable<T>) {
        info.kind = Kind::Opaque;
    } else {
        static_assert(dependent_false<T>, "type cannot be described; specialize docupdate::RecordTraits");
    }

    if (info.name.empty()) {
        info.name = to_string(info.kind);
    }

    if constexpr (Representable<T>) {
        info.represent = [](const void* p) -> Boxed { return get_document(&as<T>(p)); };
    }
    return info;
}

} // namespace detail

/// The TypeInfo of T, built on first use and alive for the whole process
template <typename T>
const TypeInfo& type_of() {
    static const TypeInfo info = detail::make_type_info<T>();
    return info;
}

template <typename T>
ValueRef ref_of(const T& value) noexcept {
    return {&type_of<T>(), &value};
}

inline Boxed::Boxed() : Boxed(&type_of<Value>(), std::make_shared<const Value>()) {}

// ============================================================
// Record field declarations
// ============================================================

/// An externally visible field. The tag reads "key,flag1,flag2"; flags are
/// omitempty, minsize and inline. A tag of "-" leaves the field out.
template <auto Member>
FieldInfo field(std::string_view name, std::string_view tag = {}) {
    using traits = detail::member_traits<decltype(Member)>;
    using Owner = typename traits::owner;
    using M = std::remove_cv_t<typename traits::type>;
    return FieldInfo{
        .name = std::string(name),
        .tag = std::string(tag),
        .exported = true,
        .anonymous = false,
        .type = &type_of<M>,
        .get = [](const void* owner) -> const void* {
            return &(static_cast<const Owner*>(owner)->*Member);
        },
    };
}

/// A field that belongs to the type but is not externally visible
template <auto Member>
FieldInfo hidden(std::string_view name) {
    FieldInfo info = field<Member>(name);
    info.exported = false;
    return info;
}

/// An anonymously embedded public Base of Derived
template <typename Derived, typename Base>
    requires std::derived_from<Derived, Base>
FieldInfo embedded(std::string_view name, std::string_view tag = {}) {
    return FieldInfo{
        .name = std::string(name),
        .tag = std::string(tag),
        .exported = true,
        .anonymous = true,
        .type = &type_of<Base>,
        .get = [](const void* owner) -> const void* {
            return static_cast<const Base*>(static_cast<const Derived*>(owner));
        },
    };
}

/// An anonymously embedded base that outsiders cannot convert to, such as a
/// private base. Upcast is a `const Base* (*)(const Derived*)`, usually a
/// static member of RecordTraits<Derived> declared a friend of Derived:
///
///   struct Guest : private Named {
///       friend struct docupdate::RecordTraits<Guest>;
///   };
///   template <>
///   struct docupdate::RecordTraits<Guest> {
///       static const Named* named(const Guest* g) { return g; }
///       static std::vector<FieldInfo> fields() {
///           return {embedded<&RecordTraits::named>("Named", ",inline")};
///       }
///   };
///
/// The field is not externally visible, but being embedded it is still
/// described and still counts for is_zero().
template <auto Upcast>
FieldInfo embedded(std::string_view name, std::string_view tag = {}) {
    using traits = detail::upcast_traits<decltype(Upcast)>;
    using Derived = typename traits::derived;
    using Base = typename traits::base;
    return FieldInfo{
        .name = std::string(name),
        .tag = std::string(tag),
        .exported = false,
        .anonymous = true,
        .type = &type_of<Base>,
        .get = [](const void* owner) -> const void* {
            return Upcast(static_cast<const Derived*>(owner));
        },
    };
}

} // namespace docupdate
