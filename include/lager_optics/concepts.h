// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file concepts.h
/// @brief C++20 Concepts for type constraints in lager_optics.
///
/// These concepts constrain the accessor algebra and the generic logic so
/// that an ill-shaped accessor or a missing capability is rejected at
/// compile time rather than misbehaving at run time.
///
/// @note Requires C++20 or later.

#pragma once

#include <lager_optics/optics_fwd.h>

#include <concepts>
#include <functional>
#include <type_traits>

namespace lager_optics {

// ============================================================
// Accessor Kind Detection
// ============================================================

namespace detail {

template<typename T>
struct is_lens : std::false_type {};

template<typename S, typename A>
struct is_lens<Lens<S, A>> : std::true_type {};

template<typename T>
struct is_traversal : std::false_type {};

template<typename S, typename A>
struct is_traversal<Traversal<S, A>> : std::true_type {};

template<typename T>
struct is_program : std::false_type {};

template<typename S, typename A>
struct is_program<Program<S, A>> : std::true_type {};

} // namespace detail

/// Concept for single-field accessors
template<typename T>
concept LensType = detail::is_lens<std::remove_cvref_t<T>>::value;

/// Concept for zero-or-more-field accessors
template<typename T>
concept TraversalType = detail::is_traversal<std::remove_cvref_t<T>>::value;

/// Either kind of accessor
template<typename T>
concept AccessorType = LensType<T> || TraversalType<T>;

/// Concept for state-threading programs
template<typename T>
concept ProgramType = detail::is_program<std::remove_cvref_t<T>>::value;

// ============================================================
// Callable Concepts
// ============================================================

/// Concept for update functions that transform a focused part
template<typename Fn, typename ValueType>
concept ValueTransformer = std::invocable<Fn, ValueType> &&
                           std::convertible_to<std::invoke_result_t<Fn, ValueType>, ValueType>;

/// Concept for functions producing one program step per element
template<typename Fn, typename T>
concept ProgramFactory = std::invocable<Fn, const T&> &&
                         ProgramType<std::invoke_result_t<Fn, const T&>>;

} // namespace lager_optics
