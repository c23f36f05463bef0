#include "bipolar_array.hpp"

#include <doctest.h>

TEST_CASE("BipolarArray") {
    SUBCASE("negative_and_positive_indices") {
        auto a = patchy::BipolarArray<unsigned int>(-1, 1);
        a[0] = 1;
        a[-1] = 2;
        a[1] = 3;

        REQUIRE(a[-1] == 2);
        REQUIRE(a[0] == 1);
        REQUIRE(a[1] == 3);
    }

    SUBCASE("copy_is_independent") {
        auto a = patchy::BipolarArray<int>(-3, 3);
        for (int i = -3; i <= 3; i++) {
            a[i] = i * 10;
        }
        auto b = a;
        a[0] = 99;
        for (int i = -3; i <= 3; i++) {
            CHECK(b[i] == i * 10);
        }
        CHECK(a[0] == 99);
    }
}
