// test_lens.cpp - Tests for Lens and Lens | Lens composition
// Module 1: Lens, make_lens, attr_lens, compose

#include <catch2/catch_all.hpp>
#include <lager_optics/compose.h>
#include <lager_optics/laws.h>
#include <lager_optics/lens.h>

#include <string>

using namespace lager_optics;

namespace {

struct Inner {
    int value = 0;
    std::string label;

    bool operator==(const Inner&) const = default;
};

struct Middle {
    Inner inner;
    int weight = 0;

    bool operator==(const Middle&) const = default;
};

struct Outer {
    Middle middle;
    std::string title;

    bool operator==(const Outer&) const = default;
};

Outer create_test_outer(int value = 7) {
    return Outer{Middle{Inner{value, "leaf"}, 3}, "root"};
}

} // namespace

// ============================================================
// Construction
// ============================================================

TEST_CASE("attr_lens basic operations", "[lens][attr]") {
    auto value = attr_lens(&Inner::value);
    Inner inner{42, "x"};

    SECTION("get") {
        REQUIRE(value.get(inner) == 42);
    }

    SECTION("set") {
        auto updated = value.set(inner, 100);
        REQUIRE(updated.value == 100);
        REQUIRE(updated.label == "x");
        REQUIRE(inner.value == 42); // Original unchanged
    }

    SECTION("over and modify agree") {
        auto inc = [](int v) { return v + 1; };
        REQUIRE(value.over(inner, inc).value == 43);
        REQUIRE(value.modify(inc, inner) == value.over(inner, inc));
    }

    SECTION("usable with lager directly") {
        REQUIRE(lager::view(value.lager_lens(), inner) == 42);
        REQUIRE(lager::set(value.lager_lens(), inner, 5).value == 5);
    }
}

TEST_CASE("make_lens from getter and setter", "[lens][getset]") {
    auto label = make_lens<Inner, std::string>(
        [](const Inner& i) { return i.label; },
        [](Inner i, std::string l) {
            i.label = std::move(l);
            return i;
        });

    Inner inner{1, "a"};
    REQUIRE(label.get(inner) == "a");
    REQUIRE(label.set(inner, "b").label == "b");
    REQUIRE(label.set(inner, "b").value == 1);
}

TEST_CASE("identity_lens focuses on the whole", "[lens][identity]") {
    auto id = identity_lens<Inner>();
    Inner inner{1, "a"};
    REQUIRE(id.get(inner) == inner);
    REQUIRE(id.set(inner, Inner{2, "b"}) == Inner{2, "b"});
}

// ============================================================
// Lens laws
// ============================================================

TEST_CASE("field lenses satisfy the lens laws", "[lens][laws]") {
    const int v = GENERATE(take(25, random(-100000, 100000)));
    const int a1 = GENERATE(take(4, random(-1000, 1000)));
    const int a2 = v / 2 + 1;
    const auto outer = create_test_outer(v);

    auto inner_value = attr_lens(&Outer::middle) | attr_lens(&Middle::inner) | attr_lens(&Inner::value);
    auto weight = attr_lens(&Outer::middle) | attr_lens(&Middle::weight);

    REQUIRE(check_lens_laws(inner_value, outer, a1, a2));
    REQUIRE(check_lens_laws(weight, outer, a1, a2));
    REQUIRE(check_lens_laws(attr_lens(&Outer::title), outer, std::string{"a"}, std::string{"b"}));
}

TEST_CASE("check_lens_laws reports a broken lens", "[lens][laws]") {
    // Setter ignores the new part: set-get fails
    auto broken = make_lens<Inner, int>(
        [](const Inner& i) { return i.value; },
        [](Inner i, int) { return i; });

    auto result = check_lens_laws(broken, Inner{1, "x"}, 5, 6);
    REQUIRE_FALSE(result);
    REQUIRE(result.violation == LawViolation::SetGet);
    REQUIRE_THROWS_AS(result.require(), std::logic_error);

    // Setter also bumps a counter: get-set fails
    auto noisy = make_lens<Inner, int>(
        [](const Inner& i) { return i.value; },
        [](Inner i, int v) {
            i.value = v;
            i.label += "!";
            return i;
        });

    auto noisy_result = check_lens_laws(noisy, Inner{1, "x"}, 5, 6);
    REQUIRE_FALSE(noisy_result);
    REQUIRE(noisy_result.violation == LawViolation::GetSet);
    REQUIRE(law_name(noisy_result.violation) == "get-set");
}

// ============================================================
// Composition
// ============================================================

TEST_CASE("Lens | Lens composition", "[lens][compose]") {
    auto outer = create_test_outer();
    auto lens = attr_lens(&Outer::middle) | attr_lens(&Middle::inner) | attr_lens(&Inner::value);

    SECTION("get reads through every level") {
        REQUIRE(lens.get(outer) == 7);
    }

    SECTION("set only touches the focused field") {
        auto updated = lens.set(outer, 9);
        REQUIRE(updated.middle.inner.value == 9);
        REQUIRE(updated.middle.inner.label == "leaf");
        REQUIRE(updated.middle.weight == 3);
        REQUIRE(updated.title == "root");
    }

    SECTION("compose() and operator| agree") {
        auto explicit_lens = compose(compose(attr_lens(&Outer::middle), attr_lens(&Middle::inner)),
                                     attr_lens(&Inner::value));
        REQUIRE(explicit_lens.get(outer) == lens.get(outer));
        REQUIRE(explicit_lens.set(outer, 1) == lens.set(outer, 1));
    }
}

TEST_CASE("Lens composition is associative", "[lens][compose][laws]") {
    const int v = GENERATE(take(20, random(-100000, 100000)));
    const auto outer = create_test_outer(v);

    auto x = attr_lens(&Outer::middle);
    auto y = attr_lens(&Middle::inner);
    auto z = attr_lens(&Inner::value);

    auto left = (x | y) | z;
    auto right = x | (y | z);
    auto triple = [](int n) { return n * 3 - 1; };

    REQUIRE(left.get(outer) == right.get(outer));
    REQUIRE(left.over(outer, triple) == right.over(outer, triple));
    REQUIRE(left.set(outer, v + 1) == right.set(outer, v + 1));
}
