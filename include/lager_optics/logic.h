// logic.h - Generic university logic written against capability descriptors

#pragma once

#include <lager_optics/lager_optics_config.h>
#include <lager_optics/capability.h>
#include <lager_optics/compose.h>
#include <lager_optics/program.h>
#include <lager_optics/utils.h>

#include <string>
#include <utility>

namespace lager_optics {

namespace detail {
// Wraps modulo 2^32 instead of overflowing
inline int times_two(int x) { return static_cast<int>(static_cast<unsigned>(x) * 2u); }
} // namespace detail

// ============================================================
// UniversityLogic - structural nexus
//
// Works for any Univ/Dep pair with descriptors. The descriptors are
// injected through the constructor; the default constructor looks them
// up through university_traits / department_traits and only exists when
// both are registered.
//
// Every operation comes as a pure function and as a Program that can be
// sequenced with others:
//
//   auto total = (logic.double_budget() >> logic.get_budget()).eval(univ);
// ============================================================
template<typename Univ, typename Dep>
class UniversityLogic {
public:
    UniversityLogic()
        requires UniversityRecord<Univ, Dep> && DepartmentRecord<Dep>
        : UniversityLogic(university_capability<Univ, Dep>(), department_capability<Dep>())
    {}

    UniversityLogic(UniversityCapability<Univ, Dep> univ, DepartmentCapability<Dep> dep)
        : univ_(std::move(univ))
        , dep_(std::move(dep))
        , budgets_(univ_.deps | dep_.budg)
    {}

    [[nodiscard]] std::string read_name(const Univ& univ) const { return univ_.name.get(univ); }

    [[nodiscard]] Univ upper_name(Univ univ) const {
        return univ_.name.over(std::move(univ), to_upper);
    }

    [[nodiscard]] int total_budget(const Univ& univ) const { return sum(budgets_.get_all(univ)); }

    [[nodiscard]] Univ double_budgets(Univ univ) const {
        return budgets_.over(std::move(univ), detail::times_two);
    }

    [[nodiscard]] Program<Univ, std::string> get_name() const { return extract(univ_.name); }

    [[nodiscard]] Program<Univ, Unit> upcase_name() const { return mod_(univ_.name, to_upper); }

    [[nodiscard]] Program<Univ, int> get_budget() const {
        return gets<Univ>([budgets = budgets_](const Univ& univ) { return sum(budgets.get_all(univ)); });
    }

    [[nodiscard]] Program<Univ, Unit> double_budget() const {
        return modify<Univ>([budgets = budgets_](Univ univ) {
            return budgets.over(std::move(univ), detail::times_two);
        });
    }

    [[nodiscard]] const UniversityCapability<Univ, Dep>& university() const noexcept { return univ_; }
    [[nodiscard]] const DepartmentCapability<Dep>& department() const noexcept { return dep_; }

    /// deps | budg, the composed traversal over every department budget
    [[nodiscard]] const Traversal<Univ, int>& budgets() const noexcept { return budgets_; }

private:
    UniversityCapability<Univ, Dep> univ_;
    DepartmentCapability<Dep> dep_;
    Traversal<Univ, int> budgets_;
};

// ============================================================
// IndexedUniversityLogic - dynamic nexus
//
// Same operations, but the departments are obtained from the current
// whole before each traversal, as lenses that address the whole directly.
// They are applied one after another to the running whole, never to the
// original value.
// ============================================================
template<typename Univ>
class IndexedUniversityLogic {
public:
    IndexedUniversityLogic()
        requires IndexedUniversityRecord<Univ>
        : IndexedUniversityLogic(indexed_university_capability<Univ>())
    {}

    explicit IndexedUniversityLogic(IndexedUniversityCapability<Univ> univ)
        : univ_(std::move(univ))
    {}

    [[nodiscard]] std::string read_name(const Univ& univ) const { return univ_.name.get(univ); }

    [[nodiscard]] Univ upper_name(Univ univ) const {
        return univ_.name.over(std::move(univ), to_upper);
    }

    [[nodiscard]] int total_budget(const Univ& univ) const { return get_budget().eval(univ); }

    [[nodiscard]] Univ double_budgets(Univ univ) const { return double_budget().exec(std::move(univ)); }

    [[nodiscard]] Program<Univ, std::string> get_name() const { return extract(univ_.name); }

    [[nodiscard]] Program<Univ, Unit> upcase_name() const { return mod_(univ_.name, to_upper); }

    [[nodiscard]] Program<Univ, int> get_budget() const {
        return gets<Univ>(univ_.deps).bind([](immer::vector<DepartmentCapability<Univ>> deps) {
            return traverse(std::move(deps), [](const DepartmentCapability<Univ>& dep) {
                       return extract(dep.budg);
                   })
                .map([](const immer::vector<int>& budgets) { return sum(budgets); });
        });
    }

    [[nodiscard]] Program<Univ, Unit> double_budget() const {
        return gets<Univ>(univ_.deps).bind([](immer::vector<DepartmentCapability<Univ>> deps) {
            return traverse_(std::move(deps), [](const DepartmentCapability<Univ>& dep) {
                return mod_(dep.budg, detail::times_two);
            });
        });
    }

    [[nodiscard]] const IndexedUniversityCapability<Univ>& university() const noexcept { return univ_; }

private:
    IndexedUniversityCapability<Univ> univ_;
};

} // namespace lager_optics
