// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file api.h
/// @brief Symbol visibility macros for the editscript library.
///
/// The CMake option EDITSCRIPT_BUILD_SHARED builds libeditscript as a
/// shared library. In that case EDITSCRIPT_SHARED is propagated to every
/// consumer and EDITSCRIPT_EXPORTS is defined only while the library
/// itself is compiled. Static builds define neither and EDITSCRIPT_API
/// expands to nothing.
///
/// @code
/// class EDITSCRIPT_API EditScript { ... };
/// EDITSCRIPT_API Value patch(const Value& a, const EditScript& script);
/// @endcode

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #ifdef EDITSCRIPT_SHARED
        #ifdef EDITSCRIPT_EXPORTS
            #define EDITSCRIPT_API __declspec(dllexport)
        #else
            #define EDITSCRIPT_API __declspec(dllimport)
        #endif
    #else
        #define EDITSCRIPT_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    // Library sources are compiled with -fvisibility=hidden (see CMakeLists.txt)
    #if defined(EDITSCRIPT_SHARED) && defined(EDITSCRIPT_EXPORTS)
        #define EDITSCRIPT_API __attribute__((visibility("default")))
    #else
        #define EDITSCRIPT_API
    #endif
#else
    #define EDITSCRIPT_API
#endif
