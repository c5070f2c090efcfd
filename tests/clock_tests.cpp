#include "test_common.hpp"
#include <catch2/catch_approx.hpp>
#include <ctime>

using Catch::Approx;

TEST_CASE("tv_interval borrows across the second boundary") {
    Timestamp a{10, 900000};
    Timestamp b{12, 100000};
    REQUIRE(tv_interval(a, b) == Approx(1.2));
    REQUIRE(tv_interval(Timestamp{5, 0}, Timestamp{5, 250000}) == Approx(0.25));
    REQUIRE(tv_interval(Timestamp{7, 999999}, Timestamp{8, 0}) == Approx(0.000001));
    REQUIRE(tv_interval(Timestamp{3, 500}, Timestamp{3, 500}) == 0.0);
}

TEST_CASE("hires_available is stable") {
    bool first = hires_available();
    REQUIRE(hires_available() == first);
#ifdef __linux__
    REQUIRE(first);
#endif
}

TEST_CASE("coarse clock reads whole seconds") {
    std::time_t before = std::time(nullptr);
    Timestamp ts = now(false);
    std::time_t after = std::time(nullptr);
    REQUIRE(ts.microseconds == 0);
    REQUIRE(ts.seconds >= static_cast<std::int64_t>(before));
    REQUIRE(ts.seconds <= static_cast<std::int64_t>(after));
}

TEST_CASE("fine clock reads microseconds") {
    if (!hires_available())
        SKIP("no sub-second clock");
    std::time_t before = std::time(nullptr);
    Timestamp ts = now(true);
    REQUIRE(ts.microseconds >= 0);
    REQUIRE(ts.microseconds < 1000000);
    REQUIRE(ts.seconds >= static_cast<std::int64_t>(before) - 1);
    Timestamp later = now(true);
    REQUIRE(tv_interval(ts, later) >= 0.0);
}
