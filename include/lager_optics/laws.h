// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file laws.h
/// @brief Checks for the lens laws and the traversal invariants.
///
/// Nothing verifies an accessor when it is built; these checks are meant to
/// be run from tests over many sample wholes. Each check returns a
/// LawCheckResult describing the first law it found broken.
///
/// ## Example
/// ```cpp
/// auto result = check_lens_laws(budget, dept, 1, 2);
/// REQUIRE(result);
/// ```

#pragma once

#include <lager_optics/lager_optics_config.h>
#include <lager_optics/api.h>
#include <lager_optics/concepts.h>
#include <lager_optics/lens.h>
#include <lager_optics/traversal.h>

#include <concepts>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace lager_optics {

enum class LawViolation {
    None = 0,
    GetSet,             // set(s, get(s)) != s
    SetGet,             // get(set(s, a)) != a
    SetSet,             // set(set(s, a1), a2) != set(s, a2)
    CountChanged,       // get_all(over(s, f)).size() != get_all(s).size()
    PositionMismatch,   // get_all(over(s, f))[i] != f(get_all(s)[i])
    IdentityChanged,    // over(s, id) != s
};

struct LawCheckResult {
    bool success = true;
    LawViolation violation = LawViolation::None;
    std::string message;
    std::size_t position = 0;   // Occurrence index, for PositionMismatch

    explicit operator bool() const noexcept { return success; }

    /// Throw std::logic_error if a law was broken
    void require() const {
        if (!success) {
            throw std::logic_error("Law violated: " + message);
        }
    }
};

[[nodiscard]] LAGER_OPTICS_API std::string_view law_name(LawViolation violation);

[[nodiscard]] LAGER_OPTICS_API LawCheckResult law_failure(LawViolation violation, std::size_t position = 0);

/// Check the three lens laws at `whole`, using `a1` and `a2` as sample parts
template<typename S, typename A>
    requires std::equality_comparable<S> && std::equality_comparable<A>
[[nodiscard]] LawCheckResult check_lens_laws(const Lens<S, A>& lens, const S& whole, const A& a1, const A& a2) {
    if (!(lens.set(whole, lens.get(whole)) == whole)) {
        return law_failure(LawViolation::GetSet);
    }
    if (!(lens.get(lens.set(whole, a1)) == a1)) {
        return law_failure(LawViolation::SetGet);
    }
    if (!(lens.set(lens.set(whole, a1), a2) == lens.set(whole, a2))) {
        return law_failure(LawViolation::SetSet);
    }
    return LawCheckResult{};
}

/// Check that over(whole, fn) keeps the count and order of occurrences and
/// that over(whole, id) leaves the whole unchanged
template<typename S, typename A, typename Fn>
    requires std::equality_comparable<S> && std::equality_comparable<A> && ValueTransformer<Fn, A>
[[nodiscard]] LawCheckResult check_traversal_invariants(const Traversal<S, A>& traversal, const S& whole, Fn fn) {
    const auto before = traversal.get_all(whole);
    const auto after = traversal.get_all(traversal.over(whole, fn));
    if (before.size() != after.size()) {
        return law_failure(LawViolation::CountChanged);
    }
    for (std::size_t i = 0; i < before.size(); ++i) {
        if (!(after[i] == fn(before[i]))) {
            return law_failure(LawViolation::PositionMismatch, i);
        }
    }
    if (!(traversal.over(whole, [](A part) { return part; }) == whole)) {
        return law_failure(LawViolation::IdentityChanged);
    }
    return LawCheckResult{};
}

} // namespace lager_optics
