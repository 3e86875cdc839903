// main.cpp
// University Example - The same generic logic over two kinds of nexus
//
// The university logic only knows its records through capability
// descriptors. The department collection is exposed two ways:
//
// Approach 1: a structural Traversal (departments | each), composed with
//             the department budget lens
// Approach 2: a function that derives, from the current university, one
//             budget lens per department (deps2)
//
// Both approaches must produce identical results.

#include <lager_optics/optics.h>
#include <lager_optics/university_types.h>

#include <iostream>

using namespace lager_optics;

int main()
{
    const SUniversity urjc = create_sample_university();

    std::cout << "\n=== Approach 1: Traversal nexus ===\n\n";
    {
        UniversityLogic<SUniversity, SDepartment> logic;

        std::cout << "upcase_name:  " << to_string(logic.upcase_name().exec(urjc)) << "\n";

        auto [doubled, total] = (logic.double_budget() >> logic.get_budget()).run(urjc);
        std::cout << "double >> get: (" << to_string(doubled) << ", " << total << ")\n";
    }

    std::cout << "\n=== Approach 2: Indexed nexus ===\n\n";
    {
        IndexedUniversityLogic<SUniversity> logic;

        std::cout << "upcase_name:  " << to_string(logic.upcase_name().exec(urjc)) << "\n";

        auto [doubled, total] = (logic.double_budget() >> logic.get_budget()).run(urjc);
        std::cout << "double >> get: (" << to_string(doubled) << ", " << total << ")\n";
    }

    std::cout << "\n=== Equivalence ===\n\n";
    {
        UniversityLogic<SUniversity, SDepartment> logic;
        IndexedUniversityLogic<SUniversity> logic2;

        const bool same_total = logic.total_budget(urjc) == logic2.total_budget(urjc);
        const bool same_doubled = logic.double_budgets(urjc) == logic2.double_budgets(urjc);
        std::cout << "total_budget agrees:   " << (same_total ? "yes" : "no") << "\n";
        std::cout << "double_budgets agrees: " << (same_doubled ? "yes" : "no") << "\n";

        if (!same_total || !same_doubled) {
            return 1;
        }
    }

    std::cout << "\n=== Demo End ===\n\n";
    return 0;
}
