// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file lager_optics_config.h
/// @brief Centralized configuration for lager_optics and its dependencies
///
/// This file defines the compile-time configuration for the third-party
/// libraries used by lager_optics:
///   - immer: persistent vectors and maps holding record collections
///   - zug: composition of lenses (zug::comp)
///   - lager: the lens protocol and lager::lens type erasure
///
/// It MUST be included before any library headers to ensure consistent settings.
/// All lager_optics public headers include it first.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(LAGER_OPTICS_CONFIGURED)
#error "immer headers were included before lager_optics/lager_optics_config.h. " \
       "Please include lager_optics headers before any direct immer includes."
#endif

#define LAGER_OPTICS_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

/// @brief Optics run single-threaded over values that are never shared
/// across threads, so reference counting does not need to be atomic.
#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 1
#endif

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
// Lager Library Configuration
// ============================================================

/// @brief lager_optics never builds a store; skip the dependency SFINAE.
#ifndef LAGER_DISABLE_STORE_DEPENDENCY_CHECKS
#define LAGER_DISABLE_STORE_DEPENDENCY_CHECKS 1
#endif

// ============================================================
// Zug Library Configuration
// ============================================================

/// @brief Force zug to use std::variant instead of boost::variant
#ifndef ZUG_VARIANT_STD
#define ZUG_VARIANT_STD 1
#endif

// ============================================================
// Feature Toggle: Strict Indexed Nexus
// ============================================================

/// @brief Fail fast on stale indexed-nexus lenses
///
/// Lenses produced by indexed_lenses() remember the length of the list
/// they were derived from. Applied to a value whose list has a different
/// length (or an index past its end) they:
/// - throw StaleAccessorError from both get and set (default, =1)
/// - (=0) log the mismatch to std::cerr from set and return the whole
///   unchanged; get still throws since it has nothing to return
///
/// Read when the library itself is compiled (reject_stale_set). The CMake
/// option of the same name sets it as a public definition so consumers see
/// the value the library was built with.
#ifndef LAGER_OPTICS_STRICT_NEXUS
#define LAGER_OPTICS_STRICT_NEXUS 1
#endif

// ============================================================
// Configuration Summary (compile-time message)
// ============================================================

#ifdef LAGER_OPTICS_CONFIG_VERBOSE
#if IMMER_NO_THREAD_SAFETY
#pragma message("lager_optics: Thread safety DISABLED (optimized for single-thread)")
#else
#pragma message("lager_optics: Thread safety ENABLED")
#endif

#if LAGER_OPTICS_STRICT_NEXUS
#pragma message("lager_optics: Stale nexus accessors THROW")
#else
#pragma message("lager_optics: Stale nexus accessors are LOGGED and ignored")
#endif
#endif // LAGER_OPTICS_CONFIG_VERBOSE
