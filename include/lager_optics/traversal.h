// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file traversal.h
/// @brief Type-erased traversals over zero or more parts of a whole.
///
/// A Traversal<S, A> focuses on every `A` inside an `S`, in a fixed order.
/// get_all() returns the occurrences as an immer::vector; over() applies a
/// function pointwise and never changes how many occurrences there are or
/// where they sit.

#pragma once

#include <lager_optics/lager_optics_config.h>
#include <lager_optics/api.h>
#include <lager_optics/concepts.h>
#include <lager_optics/lens.h>

#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <cstddef>
#include <functional>
#include <utility>

namespace lager_optics {

// ============================================================
// Traversal<S, A>
//
// Type erasure follows ErasedLens: the two operations are held as
// std::function so traversals built from different pieces share a type
// and can be stored in capability descriptors.
// ============================================================
template<typename S, typename A>
class Traversal {
public:
    using whole_type = S;
    using part_type = A;
    using Update = std::function<A(A)>;
    using GetAll = std::function<immer::vector<A>(const S&)>;
    using Over = std::function<S(S, const Update&)>;

    Traversal(GetAll get_all, Over over)
        : get_all_(std::move(get_all))
        , over_(std::move(over))
    {}

    /// Every focused part, in traversal order
    [[nodiscard]] immer::vector<A> get_all(const S& whole) const { return get_all_(whole); }

    /// Apply `fn` to every focused part
    template<typename Fn>
        requires ValueTransformer<Fn, A>
    [[nodiscard]] S over(S whole, Fn&& fn) const {
        return over_(std::move(whole), Update{std::forward<Fn>(fn)});
    }

    template<typename Fn>
        requires ValueTransformer<Fn, A>
    [[nodiscard]] S modify(Fn&& fn, S whole) const {
        return over(std::move(whole), std::forward<Fn>(fn));
    }

    /// Replace every focused part with `part`
    [[nodiscard]] S set(S whole, const A& part) const {
        return over(std::move(whole), [part](const A&) { return part; });
    }

    [[nodiscard]] std::size_t count(const S& whole) const { return get_all_(whole).size(); }

private:
    GetAll get_all_;
    Over over_;
};

// ============================================================
// Traversal factory functions
// ============================================================

/// Traverse every element of an immer::vector, in index order
template<typename T>
[[nodiscard]] Traversal<immer::vector<T>, T> each() {
    return Traversal<immer::vector<T>, T>{
        [](const immer::vector<T>& items) { return items; },
        [](immer::vector<T> items, const std::function<T(T)>& fn) {
            auto out = immer::vector<T>{}.transient();
            for (const auto& item : items) {
                out.push_back(fn(item));
            }
            return out.persistent();
        }};
}

/// View a lens as a traversal with exactly one occurrence
template<typename S, typename A>
[[nodiscard]] Traversal<S, A> as_traversal(Lens<S, A> lens) {
    return Traversal<S, A>{
        [lens](const S& whole) { return immer::vector<A>{lens.get(whole)}; },
        [lens](S whole, const std::function<A(A)>& fn) {
            return lens.over(std::move(whole), fn);
        }};
}

} // namespace lager_optics
