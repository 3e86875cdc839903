// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <lager_optics/university_types.h>

#include <sstream>

namespace lager_optics {

// ============================================================
// Field lenses
// ============================================================

Lens<SDepartment, int> budget_lens()
{
    return attr_lens(&SDepartment::budget);
}

Lens<SUniversity, std::string> name_lens()
{
    return attr_lens(&SUniversity::name);
}

Lens<SUniversity, int> community_lens()
{
    return attr_lens(&SUniversity::community);
}

Lens<SUniversity, immer::vector<SDepartment>> departments_lens()
{
    return attr_lens(&SUniversity::departments);
}

immer::vector<DepartmentCapability<SUniversity>> deps2(const SUniversity& univ)
{
    static const auto nexus = make_indexed_nexus(departments_lens(), budget_lens());
    return nexus(univ);
}

// ============================================================
// Registration
// ============================================================

DepartmentCapability<SDepartment> department_traits<SDepartment>::capability()
{
    return DepartmentCapability<SDepartment>{budget_lens()};
}

UniversityCapability<SUniversity, SDepartment> university_traits<SUniversity, SDepartment>::capability()
{
    return UniversityCapability<SUniversity, SDepartment>{
        name_lens(),
        community_lens(),
        departments_lens() | each<SDepartment>()};
}

IndexedUniversityCapability<SUniversity> indexed_university_traits<SUniversity>::capability()
{
    return IndexedUniversityCapability<SUniversity>{name_lens(), community_lens(), deps2};
}

// ============================================================
// Sample data and printing
// ============================================================

SUniversity create_sample_university()
{
    const SDepartment math{80000};
    const SDepartment cs{100000};
    return SUniversity{"urjc", 7500, immer::vector<SDepartment>{math, cs}};
}

std::string to_string(const SDepartment& dep)
{
    return "SDepartment(" + std::to_string(dep.budget) + ")";
}

std::string to_string(const SUniversity& univ)
{
    std::ostringstream oss;
    oss << "SUniversity(" << univ.name << ", " << univ.community << ", [";
    bool first = true;
    for (const auto& dep : univ.departments) {
        if (!first) {
            oss << ", ";
        }
        oss << to_string(dep);
        first = false;
    }
    oss << "])";
    return oss.str();
}

} // namespace lager_optics
