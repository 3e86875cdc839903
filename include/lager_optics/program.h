// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file program.h
/// @brief State-threading programs over an immutable whole.
///
/// A Program<S, A> is one step `S -> (S, A)`: it reads and/or rebuilds the
/// whole and produces a result. Programs are sequenced with then() or
/// operator>> and bind(); every step runs against the state the previous
/// step returned, strictly in program order.
///
/// ## Example
/// ```cpp
/// auto program = mod_(name, to_upper) >> extract(name);
/// auto [state, upper] = program.run(univ);
/// ```

#pragma once

#include <lager_optics/lager_optics_config.h>
#include <lager_optics/concepts.h>
#include <lager_optics/lens.h>

#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <functional>
#include <type_traits>
#include <utility>
#include <variant>

namespace lager_optics {

/// Result of programs run only for their effect on the state
using Unit = std::monostate;

template<typename S, typename A>
class Program {
public:
    using state_type = S;
    using value_type = A;
    using Step = std::function<std::pair<S, A>(S)>;

    explicit Program(Step step) : step_(std::move(step)) {}

    /// Run the program, returning the final state and the result
    [[nodiscard]] std::pair<S, A> run(S state) const { return step_(std::move(state)); }

    /// Run the program and keep only the result
    [[nodiscard]] A eval(S state) const { return run(std::move(state)).second; }

    /// Run the program and keep only the final state
    [[nodiscard]] S exec(S state) const { return run(std::move(state)).first; }

    template<typename Fn>
    [[nodiscard]] auto map(Fn fn) const {
        using B = std::invoke_result_t<Fn, A>;
        return Program<S, B>{[step = step_, fn](S state) {
            auto [next, result] = step(std::move(state));
            return std::pair<S, B>{std::move(next), fn(std::move(result))};
        }};
    }

    /// Feed the result into `fn` and run the program it returns on the
    /// state this program left behind
    template<typename Fn>
        requires ProgramType<std::invoke_result_t<Fn, A>>
    [[nodiscard]] auto bind(Fn fn) const {
        using B = typename std::invoke_result_t<Fn, A>::value_type;
        return Program<S, B>{[step = step_, fn](S state) {
            auto [next, result] = step(std::move(state));
            return fn(std::move(result)).run(std::move(next));
        }};
    }

    /// Run `next` after this program, discarding this program's result
    template<typename B>
    [[nodiscard]] Program<S, B> then(Program<S, B> next) const {
        return bind([next = std::move(next)](const A&) { return next; });
    }

private:
    Step step_;
};

template<typename S, typename A, typename B>
[[nodiscard]] Program<S, B> operator>>(const Program<S, A>& first, Program<S, B> second) {
    return first.then(std::move(second));
}

// ============================================================
// Program combinators
// ============================================================

template<typename S, typename A>
[[nodiscard]] Program<S, A> pure(A value) {
    return Program<S, A>{[value = std::move(value)](S state) {
        return std::pair<S, A>{std::move(state), value};
    }};
}

/// Read the whole state
template<typename S>
[[nodiscard]] Program<S, S> get_state() {
    return Program<S, S>{[](S state) {
        S copy = state;
        return std::pair<S, S>{std::move(state), std::move(copy)};
    }};
}

/// Read something computed from the state
template<typename S, typename Fn>
[[nodiscard]] auto gets(Fn fn) {
    using A = std::invoke_result_t<Fn, const S&>;
    return Program<S, A>{[fn = std::move(fn)](S state) {
        A result = fn(state);
        return std::pair<S, A>{std::move(state), std::move(result)};
    }};
}

/// Replace the state with `fn(state)`
template<typename S, typename Fn>
    requires ValueTransformer<Fn, S>
[[nodiscard]] Program<S, Unit> modify(Fn fn) {
    return Program<S, Unit>{[fn = std::move(fn)](S state) {
        return std::pair<S, Unit>{fn(std::move(state)), Unit{}};
    }};
}

/// Read the part a lens focuses on
template<typename S, typename A>
[[nodiscard]] Program<S, A> extract(Lens<S, A> lens) {
    return gets<S>([lens = std::move(lens)](const S& state) { return lens.get(state); });
}

/// Update the part a lens focuses on
template<typename S, typename A, typename Fn>
    requires ValueTransformer<Fn, A>
[[nodiscard]] Program<S, Unit> mod_(Lens<S, A> lens, Fn fn) {
    return modify<S>([lens = std::move(lens), fn = std::move(fn)](S state) {
        return lens.over(std::move(state), fn);
    });
}

/// Update the part a lens focuses on and return its new value
template<typename S, typename A, typename Fn>
    requires ValueTransformer<Fn, A>
[[nodiscard]] Program<S, A> mod(Lens<S, A> lens, Fn fn) {
    return mod_(lens, std::move(fn)) >> extract(lens);
}

/// Run `fn(item)` for every item, in order, threading the state through
/// each step, and collect the results
template<typename T, typename Fn>
    requires ProgramFactory<Fn, T>
[[nodiscard]] auto traverse(immer::vector<T> items, Fn fn) {
    using P = std::invoke_result_t<Fn, const T&>;
    using S = typename P::state_type;
    using B = typename P::value_type;
    return Program<S, immer::vector<B>>{[items = std::move(items), fn = std::move(fn)](S state) {
        auto results = immer::vector<B>{}.transient();
        for (const auto& item : items) {
            auto [next, result] = fn(item).run(std::move(state));
            state = std::move(next);
            results.push_back(std::move(result));
        }
        return std::pair<S, immer::vector<B>>{std::move(state), results.persistent()};
    }};
}

/// traverse() for steps run only for their effect
template<typename T, typename Fn>
    requires ProgramFactory<Fn, T>
[[nodiscard]] auto traverse_(immer::vector<T> items, Fn fn) {
    return traverse(std::move(items), std::move(fn)).map([](const auto&) { return Unit{}; });
}

} // namespace lager_optics
