// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file patch.h
/// @brief Replay an EditScript against a Value.
///
/// patch(a, script) applies the operations of `script` to `a` strictly in
/// order and returns the result. `a` itself is never modified.
///
/// | Last step   | Add                    | Delete          | Replace                   |
/// |-------------|------------------------|-----------------|---------------------------|
/// | map key     | set key                | erase key       | overwrite existing key    |
/// | index       | insert before index    | erase at index  | overwrite at index        |
/// | set element | insert value           | erase element   | erase element, insert value |
/// | (empty)     | whole value            | null            | whole value               |
///
/// Every step before the last must exist. The first operation that
/// cannot be applied raises PatchError and no partial result is returned.

#pragma once

#include <editscript/api.h>
#include <editscript/edit_script.h>
#include <editscript/value.h>

#include <cstddef>
#include <optional>

namespace editscript {

/// Apply a single operation. `op_index` is only used in error reports.
/// @throws PatchError
[[nodiscard]] EDITSCRIPT_API Value apply_operation(const Value& root, const Operation& op,
                                                   std::size_t op_index = 0);

/// Apply every operation of `script` to `a`, in order.
/// @throws PatchError on the first operation that cannot be applied
[[nodiscard]] EDITSCRIPT_API Value patch(const Value& a, const EditScript& script);

/// Convenience for the result of diff(): std::nullopt leaves `a` unchanged
[[nodiscard]] EDITSCRIPT_API Value patch(const Value& a, const std::optional<EditScript>& script);

} // namespace editscript
