// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Builder classes for efficient O(n) construction of immutable Value containers.
///
/// This file provides transient-based builders for constructing Value containers:
/// - MapBuilder: Build ValueMap efficiently
/// - VectorBuilder: Build ValueVector efficiently
/// - ArrayBuilder: Build ValueArray efficiently
/// - SetBuilder: Build ValueSet
///
/// Usage:
/// @code
///   #include <jsondelta/builders.h>
///
///   Value config = MapBuilder()
///       .set("width", 1920)
///       .set("fullscreen", true)
///       .finish();
///
///   Value items = VectorBuilder()
///       .push_back("item1")
///       .push_back("item2")
///       .finish();
/// @endcode

#pragma once

#include "value.h"

#include <immer/array_transient.hpp>
#include <immer/map_transient.hpp>
#include <immer/vector_transient.hpp>

namespace jsondelta {

/// Builder for constructing ValueMap efficiently - O(n) complexity
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

    /// Set a key with an already constructed Value
    MapBuilder& set(const std::string& key, Value val) {
        transient_.set(key, ValueBox{std::move(val)});
        return *this;
    }

    /// Remove a key; returns false if it was not present
    bool erase(const std::string& key) {
        if (!transient_.count(key)) return false;
        transient_.erase(key);
        return true;
    }

    [[nodiscard]] const ValueBox* find(const std::string& key) const {
        return transient_.find(key);
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        return transient_.count(key) > 0;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    /// Finish building and return the immutable Value
    /// Note: After calling finish(), the builder is in an undefined state
    [[nodiscard]] Value finish() {
        return Value{transient_.persistent()};
    }

private:
    transient_type transient_;
};

/// Builder for constructing ValueVector efficiently - O(n) complexity
class VectorBuilder {
public:
    using transient_type = ValueVector::transient_type;

    VectorBuilder() : transient_(ValueVector{}.transient()) {}

    VectorBuilder(VectorBuilder&&) noexcept = default;
    VectorBuilder& operator=(VectorBuilder&&) noexcept = default;
    VectorBuilder(const VectorBuilder&) = delete;
    VectorBuilder& operator=(const VectorBuilder&) = delete;

    VectorBuilder& push_back(Value val) {
        transient_.push_back(ValueBox{std::move(val)});
        return *this;
    }

    VectorBuilder& push_back_box(ValueBox box) {
        transient_.push_back(std::move(box));
        return *this;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    [[nodiscard]] Value finish() {
        return Value{transient_.persistent()};
    }

private:
    transient_type transient_;
};

/// Builder for constructing ValueArray efficiently
class ArrayBuilder {
public:
    using transient_type = ValueArray::transient_type;

    ArrayBuilder() : transient_(ValueArray{}.transient()) {}

    ArrayBuilder(ArrayBuilder&&) noexcept = default;
    ArrayBuilder& operator=(ArrayBuilder&&) noexcept = default;
    ArrayBuilder(const ArrayBuilder&) = delete;
    ArrayBuilder& operator=(const ArrayBuilder&) = delete;

    ArrayBuilder& push_back(Value val) {
        transient_.push_back(ValueBox{std::move(val)});
        return *this;
    }

    ArrayBuilder& push_back_box(ValueBox box) {
        transient_.push_back(std::move(box));
        return *this;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    [[nodiscard]] Value finish() {
        return Value{transient_.persistent()};
    }

private:
    transient_type transient_;
};

/// Builder for ValueSet. immer::set has no transient here, so each insert
/// produces a new persistent set; elements are boxes, so this stays cheap.
class SetBuilder {
public:
    SetBuilder() = default;
    explicit SetBuilder(ValueSet existing) : set_(std::move(existing)) {}

    SetBuilder& insert(Value val) {
        set_ = set_.insert(ValueBox{std::move(val)});
        return *this;
    }

    SetBuilder& erase(const Value& val) {
        set_ = set_.erase(ValueBox{val});
        return *this;
    }

    [[nodiscard]] bool contains(const Value& val) const {
        return set_.count(ValueBox{val}) > 0;
    }

    [[nodiscard]] std::size_t size() const {
        return set_.size();
    }

    [[nodiscard]] Value finish() {
        return Value{std::move(set_)};
    }

private:
    ValueSet set_;
};

} // namespace jsondelta
