// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Transient-based builders for O(n) construction of Value containers.
///
/// @code
///   Value doc = MapBuilder()
///       .set("name", "Alice")
///       .set("tags", SetBuilder().insert(Value::keyword("admin")).finish())
///       .finish();
///
///   Value items = VectorBuilder()
///       .push_back(1)
///       .push_back(2)
///       .finish();
/// @endcode

#pragma once

#include <editscript/value.h>

namespace editscript {

/// Builder for ValueMap
class MapBuilder {
public:
    MapBuilder() : transient_(ValueMap{}.transient()) {}
    explicit MapBuilder(const ValueMap& existing) : transient_(existing.transient()) {}

    MapBuilder(MapBuilder&&) noexcept = default;
    MapBuilder& operator=(MapBuilder&&) noexcept = default;

    // Copy operations (disabled - transient sharing is dangerous)
    MapBuilder(const MapBuilder&) = delete;
    MapBuilder& operator=(const MapBuilder&) = delete;

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

    [[nodiscard]] std::size_t size() const { return transient_.size(); }

    /// Finish building and return the immutable Value.
    /// The builder must not be used afterwards.
    [[nodiscard]] Value finish() { return Value{transient_.persistent()}; }

private:
    ValueMap::transient_type transient_;
};

/// Builder for ordered sequences (ValueVector or ValueList)
template <typename Seq>
class BasicSequenceBuilder {
public:
    BasicSequenceBuilder() : transient_(Seq{}.transient()) {}
    explicit BasicSequenceBuilder(const Seq& existing) : transient_(existing.transient()) {}

    BasicSequenceBuilder(BasicSequenceBuilder&&) noexcept = default;
    BasicSequenceBuilder& operator=(BasicSequenceBuilder&&) noexcept = default;

    BasicSequenceBuilder(const BasicSequenceBuilder&) = delete;
    BasicSequenceBuilder& operator=(const BasicSequenceBuilder&) = delete;

    BasicSequenceBuilder& push_back(Value val) {
        transient_.push_back(ValueBox{std::move(val)});
        return *this;
    }

    [[nodiscard]] std::size_t size() const { return transient_.size(); }

    [[nodiscard]] Value finish() { return Value{transient_.persistent()}; }

private:
    typename Seq::transient_type transient_;
};

using VectorBuilder = BasicSequenceBuilder<ValueVector>;
using ListBuilder   = BasicSequenceBuilder<ValueList>;

/// Builder for ValueSet
class SetBuilder {
public:
    SetBuilder() : transient_(ValueSet{}.transient()) {}
    explicit SetBuilder(const ValueSet& existing) : transient_(existing.transient()) {}

    SetBuilder(SetBuilder&&) noexcept = default;
    SetBuilder& operator=(SetBuilder&&) noexcept = default;

    SetBuilder(const SetBuilder&) = delete;
    SetBuilder& operator=(const SetBuilder&) = delete;

    SetBuilder& insert(Value val) {
        transient_.insert(ValueBox{std::move(val)});
        return *this;
    }

    [[nodiscard]] bool contains(const Value& val) const {
        return transient_.count(ValueBox{val}) > 0;
    }

    [[nodiscard]] std::size_t size() const { return transient_.size(); }

    [[nodiscard]] Value finish() { return Value{transient_.persistent()}; }

private:
    ValueSet::transient_type transient_;
};

} // namespace editscript
