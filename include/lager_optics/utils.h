// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file utils.h
/// @brief Small pure helpers used by the generic logic.

#pragma once

#include <lager_optics/lager_optics_config.h>
#include <lager_optics/api.h>

#include <immer/vector.hpp>

#include <numeric>
#include <string>
#include <type_traits>

namespace lager_optics {

/// Upper-cases ASCII letters only, e.g. "urjc" -> "URJC". Bytes outside
/// ASCII (UTF-8 sequences included) are copied unchanged, so "é" stays "é".
[[nodiscard]] LAGER_OPTICS_API std::string to_upper(std::string text);

namespace detail {

/// a + b, wrapping around for signed integers instead of overflowing
template<typename T>
T wrapping_add(T a, T b) {
    if constexpr (std::is_integral_v<T> && std::is_signed_v<T>) {
        using U = std::make_unsigned_t<T>;
        return static_cast<T>(static_cast<U>(a) + static_cast<U>(b));
    } else {
        return a + b;
    }
}

} // namespace detail

/// Sum of all elements (T{} for an empty vector). Signed integers wrap on
/// overflow, e.g. sum({INT_MAX, 1}) == INT_MIN.
template<typename T>
[[nodiscard]] T sum(const immer::vector<T>& items) {
    return std::accumulate(items.begin(), items.end(), T{}, detail::wrapping_add<T>);
}

} // namespace lager_optics
