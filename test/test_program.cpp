// test_program.cpp - Tests for state-threading programs
// Module 5: Program, gets, modify, extract, mod_, traverse

#include <catch2/catch_all.hpp>
#include <lager_optics/program.h>

#include <string>

using namespace lager_optics;

namespace {

struct Counter {
    int count = 0;
    std::string log;

    bool operator==(const Counter&) const = default;
};

Program<Counter, Unit> append(std::string text) {
    return modify<Counter>([text = std::move(text)](Counter c) {
        c.log += text;
        return c;
    });
}

} // namespace

TEST_CASE("Program run/eval/exec", "[program]") {
    auto program = gets<Counter>([](const Counter& c) { return c.count * 2; });
    Counter start{21, ""};

    auto [state, result] = program.run(start);
    REQUIRE(state == start);
    REQUIRE(result == 42);
    REQUIRE(program.eval(start) == 42);
    REQUIRE(program.exec(start) == start);
}

TEST_CASE("Program steps apply in program order", "[program][sequence]") {
    auto program = append("a") >> append("b") >> append("c");
    REQUIRE(program.exec(Counter{}).log == "abc");

    SECTION("then is the same as operator>>") {
        auto chained = append("a").then(append("b")).then(append("c"));
        REQUIRE(chained.exec(Counter{}) == program.exec(Counter{}));
    }

    SECTION("each step sees the previous step's state") {
        auto count = attr_lens(&Counter::count);
        auto step = mod_(count, [](int c) { return c + 1; }) >>
                    mod_(count, [](int c) { return c * 10; }) >>
                    extract(count);
        REQUIRE(step.run(Counter{1, ""}) == std::pair<Counter, int>{Counter{20, ""}, 20});
    }
}

TEST_CASE("Program bind and map", "[program]") {
    auto count = attr_lens(&Counter::count);

    auto program = extract(count).bind([](int c) {
        return append(std::to_string(c));
    });
    REQUIRE(program.exec(Counter{7, "n="}).log == "n=7");

    auto mapped = extract(count).map([](int c) { return std::to_string(c) + "!"; });
    REQUIRE(mapped.eval(Counter{3, ""}) == "3!");

    REQUIRE(pure<Counter>(5).run(Counter{1, "x"}) == std::pair<Counter, int>{Counter{1, "x"}, 5});
    REQUIRE(get_state<Counter>().eval(Counter{1, "x"}) == Counter{1, "x"});
}

TEST_CASE("mod returns the updated part", "[program][lens]") {
    auto count = attr_lens(&Counter::count);
    auto [state, result] = mod(count, [](int c) { return c - 1; }).run(Counter{10, ""});
    REQUIRE(result == 9);
    REQUIRE(state.count == 9);
}

TEST_CASE("traverse threads the state through every item", "[program][traverse]") {
    auto count = attr_lens(&Counter::count);
    auto items = immer::vector<int>{1, 2, 3};

    SECTION("results are collected in order") {
        auto program = traverse(items, [count](int n) {
            return mod(count, [n](int c) { return c + n; });
        });
        auto [state, results] = program.run(Counter{});
        REQUIRE(results == immer::vector<int>{1, 3, 6});
        REQUIRE(state.count == 6);
    }

    SECTION("traverse_ discards results") {
        auto program = traverse_(items, [](int n) { return append(std::to_string(n)); });
        auto [state, unit] = program.run(Counter{});
        REQUIRE(state.log == "123");
        REQUIRE(unit == Unit{});
    }

    SECTION("empty list leaves the state alone") {
        auto program = traverse_(immer::vector<int>{}, [](int n) { return append(std::to_string(n)); });
        REQUIRE(program.exec(Counter{4, "z"}) == Counter{4, "z"});
    }
}
