#include <catch2/catch_test_macros.hpp>
#include "core/expected.hpp"
#include <string>
#include <variant>
#include <vector>

namespace {
struct Err { int code; std::string what; };

wv::expected<std::vector<int>, Err> parse(bool ok) {
    if (!ok) return wv::make_unexpected(Err{7, "bad"});
    return std::vector<int>{1, 2, 3};
}
}

TEST_CASE("expected holds a value", "[expected]") {
    auto r = parse(true);
    REQUIRE(r.has_value());
    REQUIRE(static_cast<bool>(r));
    REQUIRE(r->size() == 3);
    REQUIRE((*r)[2] == 3);
}

TEST_CASE("expected holds an error", "[expected]") {
    auto r = parse(false);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == 7);
    REQUIRE(r.error().what == "bad");
}

TEST_CASE("expected assignment switches alternatives", "[expected]") {
    auto r = parse(true);
    r = parse(false);
    REQUIRE_FALSE(r);
    REQUIRE(r.error().code == 7);

    const auto good = parse(true);
    r = good;
    REQUIRE(r);
    REQUIRE(r.value().front() == 1);

    wv::expected<std::string, Err> s = wv::make_unexpected(Err{1, "x"});
    REQUIRE_FALSE(s);
    s = std::string("moved");
    REQUIRE(*s == "moved");
}

TEST_CASE("expected value can be moved out", "[expected]") {
    auto r = parse(true);
    std::vector<int> v = std::move(r).value();
    REQUIRE(v.size() == 3);
}

TEST_CASE("expected rejects access to the missing value", "[expected]") {
    auto r = parse(false);
    REQUIRE_THROWS_AS(r.value(), std::bad_variant_access);
}
