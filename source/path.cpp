// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path.cpp
/// @brief Path formatting.

#include <editscript/path.h>

namespace editscript {

std::string path_to_string(const Path& path)
{
    std::string result;
    for (const auto& elem : path) {
        std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                result += "." + v;
            } else if constexpr (std::is_same_v<T, std::size_t>) {
                result += "[" + std::to_string(v) + "]";
            } else {
                result += "#{" + value_to_string(*v.value) + "}";
            }
        }, elem);
    }
    return result.empty() ? "/" : result;
}

} // namespace editscript
