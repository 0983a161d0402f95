// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file classify.h
/// @brief Structural category of a Value, used to dispatch diffing.

#pragma once

#include <editscript/api.h>
#include <editscript/value.h>

#include <string_view>

namespace editscript {

/// Structural category of a Value.
///
/// Only values of the same composite category are diffed element-wise.
/// Sequence and List are distinct categories: a vector and a list holding
/// the same elements are still replaced wholesale.
enum class ValueKind {
    Absent,    ///< Null
    Map,       ///< ValueMap
    Sequence,  ///< ValueVector
    List,      ///< ValueList
    Set,       ///< ValueSet
    Scalar     ///< bool, int64_t, double, std::string, Keyword
};

[[nodiscard]] EDITSCRIPT_API ValueKind classify(const Value& v) noexcept;

[[nodiscard]] inline bool is_composite(ValueKind kind) noexcept
{
    return kind == ValueKind::Map || kind == ValueKind::Sequence ||
           kind == ValueKind::List || kind == ValueKind::Set;
}

[[nodiscard]] EDITSCRIPT_API std::string_view kind_name(ValueKind kind) noexcept;

} // namespace editscript
