// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path.h
/// @brief Path addressing a position inside a nested Value.
///
/// A path is a sequence of steps, each of which is one of:
/// - a map key (std::string)
/// - a sequence index (std::size_t). Indices recorded in an EditScript
///   refer to the value as it looks after the earlier operations of the
///   script were applied, not to the original value.
/// - a set element (SetElement). Sets are addressed by membership.
///
/// Path is a class of its own rather than an alias of a vector so that a
/// path can never be mistaken for a sequence value.
///
/// ```cpp
/// Path path;
/// path.push_back("users");
/// path.push_back(std::size_t{0});
/// path.push_back("name");
/// path_to_string(path);   // ".users[0].name"
/// ```

#pragma once

#include <editscript/api.h>
#include <editscript/value.h>

#include <cstddef>
#include <initializer_list>
#include <string>
#include <variant>
#include <vector>

namespace editscript {

/// Set member used as a path step
struct SetElement {
    ValueBox value;

    friend bool operator==(const SetElement& a, const SetElement& b) { return *a.value == *b.value; }
};

/// A single path step: map key, sequence index, or set element
using PathElement = std::variant<std::string, std::size_t, SetElement>;

class EDITSCRIPT_API Path {
public:
    using value_type = PathElement;
    using const_iterator = std::vector<PathElement>::const_iterator;
    using iterator = const_iterator;
    using size_type = std::size_t;

    Path() = default;
    Path(std::initializer_list<PathElement> init) : elements_(init) {}

    void push_back(PathElement elem) { elements_.push_back(std::move(elem)); }
    void push_back(const char* key) { elements_.emplace_back(std::in_place_type<std::string>, key); }
    void pop_back() { elements_.pop_back(); }
    void reserve(std::size_t n) { elements_.reserve(n); }

    /// Copy of this path extended by one step
    [[nodiscard]] Path child(PathElement elem) const {
        Path result = *this;
        result.push_back(std::move(elem));
        return result;
    }

    [[nodiscard]] const_iterator begin() const noexcept { return elements_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return elements_.end(); }

    [[nodiscard]] std::size_t size() const noexcept { return elements_.size(); }
    [[nodiscard]] bool empty() const noexcept { return elements_.empty(); }

    [[nodiscard]] const PathElement& operator[](std::size_t i) const { return elements_[i]; }
    [[nodiscard]] const PathElement& back() const { return elements_.back(); }

    friend bool operator==(const Path& a, const Path& b) { return a.elements_ == b.elements_; }

private:
    std::vector<PathElement> elements_;
};

/// Key step helper: path_key("name")
[[nodiscard]] inline PathElement path_key(std::string key) { return PathElement{std::move(key)}; }

/// Index step helper: path_index(3)
[[nodiscard]] inline PathElement path_index(std::size_t index) { return PathElement{index}; }

/// Set element step helper: path_element(Value{4})
[[nodiscard]] inline PathElement path_element(const Value& element) { return PathElement{SetElement{ValueBox{element}}}; }

/// Convert Path to a readable string, e.g. ".users[0].tags#{:admin}"
[[nodiscard]] EDITSCRIPT_API std::string path_to_string(const Path& path);

} // namespace editscript
