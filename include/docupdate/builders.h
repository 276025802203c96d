// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Builder classes for O(n) construction of immutable Value containers.
///
/// Usage:
/// @code
///   Value doc = MapBuilder()
///       .set("name", "widget")
///       .set("count", 3)
///       .finish();
/// @endcode

#pragma once

#include "value.h"

#include <utility>

namespace docupdate {

/// Builder for constructing ValueMap efficiently through an immer transient
class MapBuilder {
public:
    using transient_type = ValueMap::transient_type;

    MapBuilder() : transient_(ValueMap{}.transient()) {}
    explicit MapBuilder(const ValueMap& existing) : transient_(existing.transient()) {}

    MapBuilder(MapBuilder&&) noexcept = default;
    MapBuilder& operator=(MapBuilder&&) noexcept = default;

    // Copy operations (disabled - transient sharing is dangerous)
    MapBuilder(const MapBuilder&) = delete;
    MapBuilder& operator=(const MapBuilder&) = delete;

    /// Set a key-value pair
    template <typename T>
    MapBuilder& set(const std::string& key, T&& val) {
        transient_.set(key, ValueBox{Value{std::forward<T>(val)}});
        return *this;
    }

    /// Set a key with an already constructed Value
    MapBuilder& set(const std::string& key, Value val) {
        transient_.set(key, ValueBox{std::move(val)});
        return *this;
    }

    MapBuilder& erase(const std::string& key) {
        transient_.erase(key);
        return *this;
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        return transient_.count(key) > 0;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    /// Get a previously set value by key, or default_val if it is absent
    [[nodiscard]] Value get(const std::string& key, Value default_val = Value{}) const {
        if (auto* found = transient_.find(key)) {
            return found->get();
        }
        return default_val;
    }

    /// Finish building and return the immutable Value
    /// Note: After calling finish(), the builder is in an undefined state
    [[nodiscard]] Value finish() {
        return Value{transient_.persistent()};
    }

    /// Finish and return just the map (not wrapped in Value)
    [[nodiscard]] ValueMap finish_map() {
        return transient_.persistent();
    }

private:
    transient_type transient_;
};

/// Builder for constructing ValueVector efficiently
class VectorBuilder {
public:
    using transient_type = ValueVector::transient_type;

    VectorBuilder() : transient_(ValueVector{}.transient()) {}

    VectorBuilder(VectorBuilder&&) noexcept = default;
    VectorBuilder& operator=(VectorBuilder&&) noexcept = default;
    VectorBuilder(const VectorBuilder&) = delete;
    VectorBuilder& operator=(const VectorBuilder&) = delete;

    template <typename T>
    VectorBuilder& push_back(T&& val) {
        transient_.push_back(ValueBox{Value{std::forward<T>(val)}});
        return *this;
    }

    VectorBuilder& push_back(Value val) {
        transient_.push_back(ValueBox{std::move(val)});
        return *this;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    [[nodiscard]] Value finish() {
        return Value{transient_.persistent()};
    }

    [[nodiscard]] ValueVector finish_vector() {
        return transient_.persistent();
    }

private:
    transient_type transient_;
};

} // namespace docupdate
