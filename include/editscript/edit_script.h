// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file edit_script.h
/// @brief Ordered log of path-addressed edit operations.
///
/// An EditScript is what diff(a, b) produces and what patch(a, script)
/// consumes. It records, in order, the operations that turn `a` into `b`:
///
/// | Operation | Logical shape         | Effect                           |
/// |-----------|-----------------------|----------------------------------|
/// | Add       | [path, "+", value]    | insert value at path             |
/// | Delete    | [path, "-"]           | remove the value at path         |
/// | Replace   | [path, "r", value]    | overwrite the value at path      |
///
/// Sequence indices in later operations assume the earlier operations
/// were already applied, so the log must be replayed in order.
///
/// Operations are appended only through record_add / record_delete /
/// record_replace. Each append and its counter update happen under one
/// per-instance lock, so several producers may fill one script.

#pragma once

#include <editscript/api.h>
#include <editscript/path.h>
#include <editscript/value.h>

#include <cstddef>
#include <mutex>
#include <string_view>
#include <vector>

namespace editscript {

enum class OpType : uint8_t { Add, Delete, Replace };

/// One entry of an EditScript. `value` is null for Delete.
struct Operation {
    OpType type = OpType::Add;
    Path path;
    ValueBox value;

    [[nodiscard]] const Value& get() const { return *value; }

    friend bool operator==(const Operation& a, const Operation& b) {
        return a.type == b.type && a.path == b.path && *a.value == *b.value;
    }
};

struct EditCounts {
    std::size_t adds = 0;
    std::size_t deletes = 0;
    std::size_t replaces = 0;

    friend bool operator==(const EditCounts&, const EditCounts&) = default;
};

class EDITSCRIPT_API EditScript {
public:
    explicit EditScript(Value original = Value{});

    EditScript(const EditScript& other);
    EditScript(EditScript&& other) noexcept;
    EditScript& operator=(const EditScript& other);
    EditScript& operator=(EditScript&& other) noexcept;

    void record_add(const Path& path, Value value);
    void record_delete(const Path& path);
    void record_replace(const Path& path, Value value);

    /// Snapshot of the log, in emission order
    [[nodiscard]] std::vector<Operation> edits() const;

    /// adds + deletes + replaces
    [[nodiscard]] std::size_t distance() const;
    [[nodiscard]] EditCounts counts() const;
    [[nodiscard]] std::size_t adds_num() const;
    [[nodiscard]] std::size_t deletes_num() const;
    [[nodiscard]] std::size_t replaces_num() const;

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool empty() const;

    /// The value the script was computed from (reference only, never patched in place)
    [[nodiscard]] const Value& original() const noexcept { return original_; }

    /// Logical shape: a vector of [path, "+", value] / [path, "-"] / [path, "r", value].
    /// Path steps are strings (keys), integers (indices) or {"#": element} (set elements).
    [[nodiscard]] Value to_value() const;

    /// Rebuild a script from the shape produced by to_value()
    /// @throws InvalidScriptError if `edits` does not have that shape
    [[nodiscard]] static EditScript from_value(Value original, const Value& edits);

private:
    void append(OpType type, const Path& path, Value value);

    Value original_;
    mutable std::mutex mutex_;
    std::vector<Operation> edits_;
    EditCounts counts_;
};

/// "+", "-" or "r"
[[nodiscard]] EDITSCRIPT_API std::string_view op_type_symbol(OpType type) noexcept;

/// "ADD", "DELETE" or "REPLACE"
[[nodiscard]] EDITSCRIPT_API std::string_view op_type_to_string(OpType type) noexcept;

/// One line per operation: "+ .users[0] {"name" "Bob"}"
[[nodiscard]] EDITSCRIPT_API std::string edit_script_to_string(const EditScript& script);

EDITSCRIPT_API void print_edits(const EditScript& script);

} // namespace editscript
