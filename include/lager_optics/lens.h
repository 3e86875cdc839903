// lens.h - Typed single-field lenses backed by lager::lens<S, A>

#pragma once

#include <lager_optics/lager_optics_config.h>
#include <lager_optics/api.h>
#include <lager_optics/concepts.h>

#include <lager/lens.hpp>
#include <lager/lenses.hpp>
#include <lager/lenses/attr.hpp>
#include <zug/compose.hpp>

#include <type_traits>
#include <utility>

namespace lager_optics {

// ============================================================
// Lens<S, A>
//
// A total accessor for exactly one `A` inside an `S`. The lens itself is
// a lager::lens<S, A>, so anything lager accepts as a lens can be wrapped:
//
//   Lens<Dept, int> budget = lager::lenses::attr(&Dept::budget);
//   Lens<Univ, int> nested = zug::comp(first_dept, budget);
//
// and the wrapped lens can be handed back to lager::view/set/over through
// lager_lens(). The lens laws
//
//   get(set(s, a)) == a
//   set(s, get(s)) == s
//   set(set(s, a1), a2) == set(s, a2)
//
// are an obligation of whoever builds the lens; use check_lens_laws() from
// laws.h in tests to verify them.
// ============================================================
template<typename S, typename A>
class Lens {
public:
    using whole_type = S;
    using part_type = A;
    using lager_lens_type = lager::lens<S, A>;

    /// Wrap any lager lens (attr, getset, zug::comp of lenses, ...)
    template<typename L>
        requires(!std::is_same_v<std::remove_cvref_t<L>, Lens>)
    Lens(L&& lens) : lens_(std::forward<L>(lens)) {}

    [[nodiscard]] A get(const S& whole) const { return lager::view(lens_, whole); }

    [[nodiscard]] S set(S whole, A part) const {
        return lager::set(lens_, std::move(whole), std::move(part));
    }

    template<typename Fn>
    [[nodiscard]] S over(S whole, Fn&& fn) const {
        return lager::over(lens_, std::move(whole), std::forward<Fn>(fn));
    }

    /// Same as over() with the argument order of `modify: (A -> A) -> S -> S`
    template<typename Fn>
    [[nodiscard]] S modify(Fn&& fn, S whole) const {
        return over(std::move(whole), std::forward<Fn>(fn));
    }

    [[nodiscard]] const lager_lens_type& lager_lens() const noexcept { return lens_; }

private:
    lager_lens_type lens_;
};

// ============================================================
// Lens factory functions
// ============================================================

/// Build a lens from a getter `S -> A` and a setter `(S, A) -> S`
template<typename S, typename A, typename Getter, typename Setter>
[[nodiscard]] Lens<S, A> make_lens(Getter getter, Setter setter) {
    return Lens<S, A>{lager::lenses::getset(std::move(getter), std::move(setter))};
}

/// Lens on a data member, e.g. attr_lens(&Department::budget)
template<typename S, typename A>
[[nodiscard]] Lens<S, A> attr_lens(A S::*member) {
    return Lens<S, A>{lager::lenses::attr(member)};
}

/// Identity lens on `S`
template<typename S>
[[nodiscard]] Lens<S, S> identity_lens() {
    return Lens<S, S>{zug::identity};
}

} // namespace lager_optics
