// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file config.h
/// @brief Centralized configuration for docupdate and immer.
///
/// It MUST be included before any immer header so every translation unit
/// sees the same immer settings. All docupdate public headers include it.

#pragma once

#include <cstddef>
#include <string_view>

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(DOCUPDATE_CONFIGURED)
#error "immer headers were included before docupdate/config.h. " \
       "Please include docupdate headers before any direct immer includes."
#endif

#define DOCUPDATE_CONFIGURED 1

// ============================================================
// Immer Settings
//
// Thread safety stays ENABLED: update documents are built on whatever
// thread calls as_update() and are routinely handed to another one.
// ============================================================

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

/// @brief Don't throw on invalid state (use assertions instead)
#ifndef IMMER_THROW_ON_INVALID_STATE
#define IMMER_THROW_ON_INVALID_STATE 0
#endif

// ============================================================
// Verbose Logging
//
// When DOCUPDATE_VERBOSE_LOG is 1:
//   - failed Value lookups log to stderr
//   - descriptor configuration errors are logged where they are raised
//
// Disabled in release builds and enabled in debug builds by default.
// ============================================================

#ifndef DOCUPDATE_VERBOSE_LOG
#  if defined(NDEBUG)
#    define DOCUPDATE_VERBOSE_LOG 0
#  else
#    define DOCUPDATE_VERBOSE_LOG 1
#  endif
#endif

namespace docupdate {

/// Document key holding a document's persistent identity. It can never be
/// changed by an update, so it is excluded from both halves of an Update.
inline constexpr std::string_view identity_key = "_id";

/// Deepest map/vector nesting the decoder accepts. Deeper input is rejected
/// with "Nesting too deep" instead of exhausting the stack.
inline constexpr std::size_t max_nesting_depth = 512;

} // namespace docupdate

#ifdef DOCUPDATE_CONFIG_VERBOSE
#if DOCUPDATE_VERBOSE_LOG
#pragma message("docupdate: verbose logging ENABLED")
#else
#pragma message("docupdate: verbose logging DISABLED")
#endif
#endif
