// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file editscript_config.h
/// @brief Compile-time configuration for editscript and immer.
///
/// Every public editscript header includes this file before any immer
/// header so that immer sees the same settings in every translation unit.
///
/// Settings:
///   - IMMER_*               : immer container tuning
///   - EDITSCRIPT_MAX_DEPTH  : default nesting bound for diff()
///   - EDITSCRIPT_VERBOSE_LOG: stderr diagnostics for failed lookups and patches
///
/// @warning Do NOT include immer headers before this file.

#pragma once

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(EDITSCRIPT_CONFIGURED)
#error "immer headers were included before editscript/editscript_config.h. " \
       "Please include editscript headers before any direct immer includes."
#endif

#define EDITSCRIPT_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

/// @brief Keep atomic reference counting
///
/// An EditScript may be filled from several threads and the values it
/// records are shared with the inputs of diff(), so boxes and container
/// nodes must use the thread-safe refcount policy.
#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 0
#endif

/// @brief Disable tagged node assertions (smaller nodes, no tag checks)
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

// ============================================================
// Diff Settings
// ============================================================

/// @brief Default maximum nesting depth accepted by diff()
///
/// diff() recurses once per container level. Inputs nested deeper than
/// this raise DepthLimitError instead of exhausting the stack. The value
/// can be overridden per call through DiffOptions::max_depth.
#ifndef EDITSCRIPT_MAX_DEPTH
#define EDITSCRIPT_MAX_DEPTH 512
#endif

// ============================================================
// Verbose Logging
//
// When enabled, failed Value lookups and failed patch operations are
// reported on stderr together with the caller location. Enabled by
// default in debug builds only.
// ============================================================

#ifndef EDITSCRIPT_VERBOSE_LOG
#  if defined(NDEBUG)
#    define EDITSCRIPT_VERBOSE_LOG 0
#  else
#    define EDITSCRIPT_VERBOSE_LOG 1
#  endif
#endif

#ifdef EDITSCRIPT_CONFIG_VERBOSE
#if IMMER_NO_THREAD_SAFETY
#pragma message("editscript: immer thread safety DISABLED, EditScript must not be shared")
#else
#pragma message("editscript: immer thread safety ENABLED")
#endif
#if EDITSCRIPT_VERBOSE_LOG
#pragma message("editscript: verbose logging ENABLED")
#endif
#endif // EDITSCRIPT_CONFIG_VERBOSE
