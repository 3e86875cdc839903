// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file capability.h
/// @brief Capability descriptors exposing a record type to generic logic.
///
/// A capability descriptor bundles the accessors generic logic needs to
/// work with a record type it knows nothing else about. A record type takes
/// part by specializing the matching traits template with a static
/// capability() returning its descriptor:
///
/// ```cpp
/// template<>
/// struct department_traits<MyDept> {
///     static DepartmentCapability<MyDept> capability() {
///         return {attr_lens(&MyDept::budget)};
///     }
/// };
/// ```
///
/// The Record concepts below check, at compile time, that a specialization
/// exists and that its descriptor carries every accessor with the right
/// type. Generic logic is constrained on them, so a missing or ill-typed
/// accessor is a build error instead of a run-time failure.

#pragma once

#include <lager_optics/lager_optics_config.h>
#include <lager_optics/compose.h>
#include <lager_optics/indexed_nexus.h>
#include <lager_optics/lens.h>
#include <lager_optics/traversal.h>

#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <concepts>
#include <functional>
#include <string>
#include <type_traits>

namespace lager_optics {

// ============================================================
// Descriptors
// ============================================================

template<typename Dep>
struct DepartmentCapability {
    Lens<Dep, int> budg;
};

/// Structural nexus: departments are reached through a Traversal
template<typename Univ, typename Dep>
struct UniversityCapability {
    Lens<Univ, std::string> name;
    Lens<Univ, int> comm;
    Traversal<Univ, Dep> deps;
};

/// Dynamic nexus: departments are reached through lenses derived from the
/// current whole, each one addressing the whole directly
template<typename Univ>
struct IndexedUniversityCapability {
    using Nexus = std::function<immer::vector<DepartmentCapability<Univ>>(const Univ&)>;

    Lens<Univ, std::string> name;
    Lens<Univ, int> comm;
    Nexus deps;
};

// ============================================================
// Registration
//
// The primary templates are empty; a record type registers by
// specializing them.
// ============================================================

template<typename Dep>
struct department_traits {};

template<typename Univ, typename Dep>
struct university_traits {};

template<typename Univ>
struct indexed_university_traits {};

// ============================================================
// Descriptor shape concepts
// ============================================================

template<typename Member, typename Expected>
concept Exactly = std::same_as<std::remove_cvref_t<Member>, Expected>;

template<typename D, typename Dep>
concept DepartmentDescriptor = requires(const D& d) {
    { d.budg } -> Exactly<Lens<Dep, int>>;
};

template<typename D, typename Univ, typename Dep>
concept UniversityDescriptor = requires(const D& d) {
    { d.name } -> Exactly<Lens<Univ, std::string>>;
    { d.comm } -> Exactly<Lens<Univ, int>>;
    { d.deps } -> Exactly<Traversal<Univ, Dep>>;
};

template<typename D, typename Univ>
concept IndexedUniversityDescriptor = requires(const D& d, const Univ& u) {
    { d.name } -> Exactly<Lens<Univ, std::string>>;
    { d.comm } -> Exactly<Lens<Univ, int>>;
    { d.deps(u) } -> std::convertible_to<immer::vector<DepartmentCapability<Univ>>>;
};

// ============================================================
// Record concepts (registration + shape)
// ============================================================

template<typename Dep>
concept DepartmentRecord = requires {
    department_traits<Dep>::capability();
} && DepartmentDescriptor<decltype(department_traits<Dep>::capability()), Dep>;

template<typename Univ, typename Dep>
concept UniversityRecord = requires {
    university_traits<Univ, Dep>::capability();
} && UniversityDescriptor<decltype(university_traits<Univ, Dep>::capability()), Univ, Dep>;

template<typename Univ>
concept IndexedUniversityRecord = requires {
    indexed_university_traits<Univ>::capability();
} && IndexedUniversityDescriptor<decltype(indexed_university_traits<Univ>::capability()), Univ>;

// ============================================================
// Lookup
// ============================================================

template<typename Dep>
    requires DepartmentRecord<Dep>
[[nodiscard]] DepartmentCapability<Dep> department_capability() {
    const auto descriptor = department_traits<Dep>::capability();
    return DepartmentCapability<Dep>{descriptor.budg};
}

template<typename Univ, typename Dep>
    requires UniversityRecord<Univ, Dep>
[[nodiscard]] UniversityCapability<Univ, Dep> university_capability() {
    const auto descriptor = university_traits<Univ, Dep>::capability();
    return UniversityCapability<Univ, Dep>{descriptor.name, descriptor.comm, descriptor.deps};
}

template<typename Univ>
    requires IndexedUniversityRecord<Univ>
[[nodiscard]] IndexedUniversityCapability<Univ> indexed_university_capability() {
    const auto descriptor = indexed_university_traits<Univ>::capability();
    return IndexedUniversityCapability<Univ>{
        descriptor.name, descriptor.comm,
        [deps = descriptor.deps](const Univ& univ) -> immer::vector<DepartmentCapability<Univ>> {
            return deps(univ);
        }};
}

// ============================================================
// Dynamic nexus construction
// ============================================================

/// Build the dynamic nexus for a list field: for a whole `u`, one
/// DepartmentCapability<Univ> per element of `list.get(u)`, whose budget
/// lens addresses `budg` of that element through the whole
template<typename Univ, typename Dep>
[[nodiscard]] typename IndexedUniversityCapability<Univ>::Nexus
make_indexed_nexus(Lens<Univ, immer::vector<Dep>> list, Lens<Dep, int> budg) {
    return [list = std::move(list), budg = std::move(budg)](const Univ& univ) {
        auto out = immer::vector<DepartmentCapability<Univ>>{}.transient();
        for (const auto& lens : indexed_lenses(list, budg, univ)) {
            out.push_back(DepartmentCapability<Univ>{lens});
        }
        return out.persistent();
    };
}

} // namespace lager_optics
