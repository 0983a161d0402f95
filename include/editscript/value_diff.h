// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value_diff.h
/// @brief Structural diff of two Values into an EditScript.
///
/// diff(a, b) walks both values together and records the operations
/// that turn `a` into `b`:
///
/// - maps are compared key by key
/// - sets are compared by membership (deletions first, then additions)
/// - vectors and lists are aligned with edit_trace(), so an element
///   inserted at the front is one Add instead of a Replace per element
/// - anything else that differs is replaced
///
/// Subtrees shared between `a` and `b` (same immer root) are skipped in
/// O(1), so diffing two versions of a large value costs time in the size
/// of the change rather than the size of the value.
///
/// ```cpp
/// auto a = Value::map({{"name", "Alice"}, {"tags", Value::vector({"x"})}});
/// auto b = Value::map({{"name", "Alice"}, {"tags", Value::vector({"x", "y"})}});
/// if (auto script = diff(a, b)) {
///     print_edits(*script);   // ADD .tags[1]: "y"
///     assert(patch(a, *script) == b);
/// }
/// ```

#pragma once

#include <editscript/api.h>
#include <editscript/edit_script.h>
#include <editscript/editscript_config.h>
#include <editscript/path.h>
#include <editscript/value.h>

#include <cstddef>
#include <functional>
#include <optional>

namespace editscript {

/// One visited position. `a` or `b` is null where that side is absent.
/// The references are only valid during the callback.
struct DiffTraceEvent {
    const Path& path;
    const Value* a;
    const Value* b;
    std::size_t depth;
};

using DiffTraceHook = std::function<void(const DiffTraceEvent&)>;

struct DiffOptions {
    /// Deeper nesting raises DepthLimitError
    std::size_t max_depth = EDITSCRIPT_MAX_DEPTH;
    /// Called for every visited position when set
    DiffTraceHook trace;
};

/// Compute the edit script turning `a` into `b`.
///
/// Returns std::nullopt when `a` and `b` are identical without looking
/// inside them: the same object, both null, equal scalars, or containers
/// sharing the same immer root. Otherwise returns a script, which may be
/// empty when `a` and `b` are equal but not shared.
///
/// A null root counts as absent: diff(nil, b) is a single Add at the
/// empty path and diff(a, nil) a single Delete.
///
/// @throws DepthLimitError if the values nest deeper than options.max_depth
[[nodiscard]] EDITSCRIPT_API std::optional<EditScript> diff(const Value& a,
                                                            const Value& b,
                                                            const DiffOptions& options = {});

} // namespace editscript
