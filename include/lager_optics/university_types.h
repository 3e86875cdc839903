// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file university_types.h
/// @brief Concrete university/department records and their descriptors.
///
/// This is the data layer the generic logic in logic.h is interpreted
/// over:
/// - SDepartment / SUniversity: plain immutable records
/// - department_traits / university_traits: structural nexus
///   (departments | each)
/// - indexed_university_traits: dynamic nexus (deps2)

#pragma once

#include <lager_optics/lager_optics_config.h>
#include <lager_optics/api.h>
#include <lager_optics/capability.h>

#include <immer/vector.hpp>

#include <string>

namespace lager_optics {

struct SDepartment {
    int budget = 0;

    bool operator==(const SDepartment&) const = default;
};

struct SUniversity {
    std::string name;
    int community = 0;
    immer::vector<SDepartment> departments;

    bool operator==(const SUniversity&) const = default;
};

// ============================================================
// Field lenses
// ============================================================

[[nodiscard]] LAGER_OPTICS_API Lens<SDepartment, int> budget_lens();
[[nodiscard]] LAGER_OPTICS_API Lens<SUniversity, std::string> name_lens();
[[nodiscard]] LAGER_OPTICS_API Lens<SUniversity, int> community_lens();
[[nodiscard]] LAGER_OPTICS_API Lens<SUniversity, immer::vector<SDepartment>> departments_lens();

/// Dynamic nexus: one budget lens per department of `univ`, each
/// addressing the university as a whole
[[nodiscard]] LAGER_OPTICS_API immer::vector<DepartmentCapability<SUniversity>> deps2(const SUniversity& univ);

// ============================================================
// Registration
// ============================================================

template<>
struct department_traits<SDepartment> {
    LAGER_OPTICS_API static DepartmentCapability<SDepartment> capability();
};

template<>
struct university_traits<SUniversity, SDepartment> {
    LAGER_OPTICS_API static UniversityCapability<SUniversity, SDepartment> capability();
};

template<>
struct indexed_university_traits<SUniversity> {
    LAGER_OPTICS_API static IndexedUniversityCapability<SUniversity> capability();
};

// ============================================================
// Sample data and printing
// ============================================================

/// urjc = SUniversity("urjc", 7500, [SDepartment(80000), SDepartment(100000)])
[[nodiscard]] LAGER_OPTICS_API SUniversity create_sample_university();

[[nodiscard]] LAGER_OPTICS_API std::string to_string(const SDepartment& dep);
[[nodiscard]] LAGER_OPTICS_API std::string to_string(const SUniversity& univ);

} // namespace lager_optics
