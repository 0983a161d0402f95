// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file errors.h
/// @brief Exceptions thrown by diff(), patch() and EditScript::from_value().

#pragma once

#include <editscript/api.h>
#include <editscript/path.h>

#include <cstddef>
#include <stdexcept>
#include <string>

namespace editscript {

/// Base class of every editscript exception
class EDITSCRIPT_API EditScriptError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class PatchErrorKind {
    PathNotFound,  ///< a key, index or element on the path does not exist
    TypeMismatch   ///< the addressed value is not the container the step expects
};

/// Raised by patch() on the first operation that cannot be applied.
/// The input value is untouched; no partial result is returned.
class EDITSCRIPT_API PatchError : public EditScriptError {
public:
    PatchError(PatchErrorKind kind, Path path, std::size_t op_index, const std::string& detail);

    [[nodiscard]] PatchErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] const Path& path() const noexcept { return path_; }
    /// Position of the failing operation in EditScript::edits()
    [[nodiscard]] std::size_t op_index() const noexcept { return op_index_; }

private:
    PatchErrorKind kind_;
    Path path_;
    std::size_t op_index_;
};

/// Raised by diff() when the inputs nest deeper than DiffOptions::max_depth
class EDITSCRIPT_API DepthLimitError : public EditScriptError {
public:
    DepthLimitError(Path path, std::size_t max_depth);

    [[nodiscard]] const Path& path() const noexcept { return path_; }
    [[nodiscard]] std::size_t max_depth() const noexcept { return max_depth_; }

private:
    Path path_;
    std::size_t max_depth_;
};

/// Raised by EditScript::from_value() on input that is not an edit list
class EDITSCRIPT_API InvalidScriptError : public EditScriptError {
public:
    using EditScriptError::EditScriptError;
};

[[nodiscard]] EDITSCRIPT_API const char* patch_error_kind_name(PatchErrorKind kind) noexcept;

} // namespace editscript
