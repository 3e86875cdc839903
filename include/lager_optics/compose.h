// compose.h - Composition algebra for Lens and Traversal

#pragma once

#include <lager_optics/lager_optics_config.h>
#include <lager_optics/lens.h>
#include <lager_optics/traversal.h>

#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>
#include <zug/compose.hpp>

#include <functional>
#include <utility>

namespace lager_optics {

// ============================================================
// compose(outer, inner)
//
// Composing an accessor S -> B with an accessor B -> A yields an
// accessor S -> A of the weaker kind:
//
//   Lens      | Lens      -> Lens
//   Lens      | Traversal -> Traversal
//   Traversal | Lens      -> Traversal
//   Traversal | Traversal -> Traversal
//
// get_all() of a composed traversal lists, for each outer occurrence in
// order, that occurrence's inner parts. over() threads the inner update
// through every outer occurrence.
//
// Example:
//   auto budgets = attr_lens(&Univ::departments) | each<Dept>() | attr_lens(&Dept::budget);
//   int total = sum(budgets.get_all(univ));
//
// operator| composes left-to-right, the same convention as zug::comp.
// ============================================================

template<typename S, typename B, typename A>
[[nodiscard]] Lens<S, A> compose(const Lens<S, B>& outer, const Lens<B, A>& inner) {
    return Lens<S, A>{zug::comp(outer.lager_lens(), inner.lager_lens())};
}

template<typename S, typename B, typename A>
[[nodiscard]] Traversal<S, A> compose(const Lens<S, B>& outer, const Traversal<B, A>& inner) {
    return Traversal<S, A>{
        [outer, inner](const S& whole) { return inner.get_all(outer.get(whole)); },
        [outer, inner](S whole, const std::function<A(A)>& fn) {
            return outer.over(std::move(whole), [&](B part) { return inner.over(std::move(part), fn); });
        }};
}

template<typename S, typename B, typename A>
[[nodiscard]] Traversal<S, A> compose(const Traversal<S, B>& outer, const Lens<B, A>& inner) {
    return Traversal<S, A>{
        [outer, inner](const S& whole) {
            auto out = immer::vector<A>{}.transient();
            for (const auto& part : outer.get_all(whole)) {
                out.push_back(inner.get(part));
            }
            return out.persistent();
        },
        [outer, inner](S whole, const std::function<A(A)>& fn) {
            return outer.over(std::move(whole), [&](B part) { return inner.over(std::move(part), fn); });
        }};
}

template<typename S, typename B, typename A>
[[nodiscard]] Traversal<S, A> compose(const Traversal<S, B>& outer, const Traversal<B, A>& inner) {
    return Traversal<S, A>{
        [outer, inner](const S& whole) {
            auto out = immer::vector<A>{}.transient();
            for (const auto& part : outer.get_all(whole)) {
                for (const auto& leaf : inner.get_all(part)) {
                    out.push_back(leaf);
                }
            }
            return out.persistent();
        },
        [outer, inner](S whole, const std::function<A(A)>& fn) {
            return outer.over(std::move(whole), [&](B part) { return inner.over(std::move(part), fn); });
        }};
}

template<typename S, typename B, typename A>
[[nodiscard]] Lens<S, A> operator|(const Lens<S, B>& outer, const Lens<B, A>& inner) {
    return compose(outer, inner);
}

template<typename S, typename B, typename A>
[[nodiscard]] Traversal<S, A> operator|(const Lens<S, B>& outer, const Traversal<B, A>& inner) {
    return compose(outer, inner);
}

template<typename S, typename B, typename A>
[[nodiscard]] Traversal<S, A> operator|(const Traversal<S, B>& outer, const Lens<B, A>& inner) {
    return compose(outer, inner);
}

template<typename S, typename B, typename A>
[[nodiscard]] Traversal<S, A> operator|(const Traversal<S, B>& outer, const Traversal<B, A>& inner) {
    return compose(outer, inner);
}

} // namespace lager_optics
