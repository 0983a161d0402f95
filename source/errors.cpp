// errors.cpp - Exception messages

#include <editscript/errors.h>

namespace editscript {

PatchError::PatchError(PatchErrorKind kind, Path path, std::size_t op_index, const std::string& detail)
    : EditScriptError("patch: " + std::string{patch_error_kind_name(kind)} + " at " +
                      path_to_string(path) + " (operation " + std::to_string(op_index) +
                      "): " + detail)
    , kind_(kind)
    , path_(std::move(path))
    , op_index_(op_index)
{}

DepthLimitError::DepthLimitError(Path path, std::size_t max_depth)
    : EditScriptError("diff: nesting deeper than " + std::to_string(max_depth) +
                      " levels at " + path_to_string(path))
    , path_(std::move(path))
    , max_depth_(max_depth)
{}

const char* patch_error_kind_name(PatchErrorKind kind) noexcept
{
    switch (kind) {
        case PatchErrorKind::PathNotFound: return "path not found";
        case PatchErrorKind::TypeMismatch: return "type mismatch";
    }
    return "unknown";
}

} // namespace editscript
