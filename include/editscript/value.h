// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Immutable tree value diffed and patched by editscript.
///
/// A Value is one of:
/// - Null (std::monostate)
/// - Scalars: bool, int64_t, double, std::string, Keyword
/// - Containers built on immer's persistent containers:
///   - ValueMap    : string-keyed associative map (immer::map)
///   - ValueVector : ordered sequence (immer::vector)
///   - ValueList   : ordered list (immer::flex_vector)
///   - ValueSet    : unordered set of distinct values (immer::set)
///
/// Children are held through immer::box, so copying a Value never copies
/// a subtree, and two containers that share a root node are known to be
/// equal without walking them.

#pragma once

#include <editscript/editscript_config.h>
#include <editscript/api.h>

#include <immer/box.hpp>
#include <immer/flex_vector.hpp>
#include <immer/flex_vector_transient.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/set.hpp>
#include <immer/set_transient.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace editscript {

namespace detail {

inline void log_access_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if EDITSCRIPT_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
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
#if EDITSCRIPT_VERBOSE_LOG
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
#if EDITSCRIPT_VERBOSE_LOG
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

struct Value;

/// Structural hash of a boxed Value, used by ValueSet
struct EDITSCRIPT_API value_box_hash {
    std::size_t operator()(const immer::box<Value>& box) const;
};

using ValueBox    = immer::box<Value>;
using ValueMap    = immer::map<std::string, ValueBox>;
using ValueVector = immer::vector<ValueBox>;
using ValueList   = immer::flex_vector<ValueBox>;
using ValueSet    = immer::set<ValueBox, value_box_hash>;

/// Symbolic scalar (keyword / symbol). Never equal to a string with the same text.
struct Keyword {
    std::string name;

    friend bool operator==(const Keyword&, const Keyword&) = default;
};

struct Value
{
    std::variant<bool,
                 int64_t,
                 double,
                 std::string,
                 Keyword,
                 ValueMap,
                 ValueVector,
                 ValueList,
                 ValueSet,
                 std::monostate>
        data;

    Value() noexcept : data(std::monostate{}) {}
    Value(bool v) noexcept : data(v) {}
    Value(int v) noexcept : data(int64_t{v}) {}
    Value(int64_t v) noexcept : data(v) {}
    Value(double v) noexcept : data(v) {}
    Value(const std::string& v) : data(v) {}
    Value(std::string&& v) noexcept : data(std::move(v)) {}
    Value(const char* v) : data(std::in_place_type<std::string>, v) {}
    Value(Keyword v) : data(std::move(v)) {}
    Value(ValueMap v) : data(std::move(v)) {}
    Value(ValueVector v) : data(std::move(v)) {}
    Value(ValueList v) : data(std::move(v)) {}
    Value(ValueSet v) : data(std::move(v)) {}

    // Factory functions for container types
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

    static Value list(std::initializer_list<Value> init) {
        auto t = ValueList{}.transient();
        for (const auto& val : init) {
            t.push_back(ValueBox{val});
        }
        return Value{t.persistent()};
    }

    static Value set(std::initializer_list<Value> init) {
        auto t = ValueSet{}.transient();
        for (const auto& val : init) {
            t.insert(ValueBox{val});
        }
        return Value{t.persistent()};
    }

    static Value keyword(std::string name) {
        return Value{Keyword{std::move(name)}};
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] std::size_t type_index() const noexcept { return data.index(); }
    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data); }

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
        if (auto* l = get_if<ValueList>()) {
            if (index < l->size()) return (*l)[index].get();
        }
        detail::log_index_error("Value::at", index, "out of range or type mismatch");
        return Value{};
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        if (auto* m = get_if<ValueMap>()) return m->count(key) > 0;
        return false;
    }

    [[nodiscard]] bool contains(std::size_t index) const {
        if (auto* v = get_if<ValueVector>()) return index < v->size();
        if (auto* l = get_if<ValueList>()) return index < l->size();
        return false;
    }

    /// Set membership test
    [[nodiscard]] bool has_element(const Value& element) const {
        if (auto* s = get_if<ValueSet>()) return s->count(ValueBox{element}) > 0;
        return false;
    }

    [[nodiscard]] int64_t as_int(int64_t default_val = 0) const {
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

    [[nodiscard]] std::size_t size() const {
        if (auto* m = get_if<ValueMap>()) return m->size();
        if (auto* v = get_if<ValueVector>()) return v->size();
        if (auto* l = get_if<ValueList>()) return l->size();
        if (auto* s = get_if<ValueSet>()) return s->size();
        return 0;
    }
};

/// Equality: same alternative and equal contents. An int64_t is never
/// equal to a bool or a double, whatever their numeric value.
inline bool operator==(const Value& a, const Value& b)
{
    return a.data == b.data;
}

// ============================================================
// Utility functions
// ============================================================

/// Structural hash consistent with operator==. Map and set hashes do not
/// depend on iteration order.
[[nodiscard]] EDITSCRIPT_API std::size_t hash_value(const Value& val);

/// O(1) identity test: both null, equal scalars, or containers sharing
/// the same immer root.
[[nodiscard]] EDITSCRIPT_API bool is_identical(const Value& a, const Value& b);

/// EDN-like rendering: {"k" 1}, [1 2], (1 2), #{1 2}, :kw, nil
[[nodiscard]] EDITSCRIPT_API std::string value_to_string(const Value& val);

/// Print Value with indentation
EDITSCRIPT_API void print_value(const Value& val, const std::string& prefix = "", std::size_t depth = 0);

} // namespace editscript
