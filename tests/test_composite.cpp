#include "sar_compose/composite/composite.hpp"
#include "sar_compose/core/errors.hpp"
#include "sar_compose/core/types.hpp"

#include <cmath>
#include <limits>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using sar_compose::Matrix2Df;
namespace composite = sar_compose::composite;

TEST_CASE("decibel_floors_non_positive_values") {
    REQUIRE(composite::to_decibel(0.0f) == Catch::Approx(-100.0f));
    REQUIRE(composite::to_decibel(-5.0f) == Catch::Approx(-100.0f));
    REQUIRE(composite::to_decibel(1.0f) == Catch::Approx(0.0f).margin(1e-6));
    REQUIRE(composite::to_decibel(10.0f) == Catch::Approx(10.0f));
    REQUIRE(std::isnan(composite::to_decibel(std::numeric_limits<float>::quiet_NaN())));
}

TEST_CASE("decibel_is_monotonic") {
    float prev = composite::to_decibel(1e-12f);
    for (float x : {1e-9f, 1e-6f, 1e-3f, 0.5f, 1.0f, 2.0f, 1000.0f}) {
        const float db = composite::to_decibel(x);
        REQUIRE(db > prev);
        prev = db;
    }
}

TEST_CASE("stretch_stays_in_unit_interval") {
    Matrix2Df band(4, 5);
    for (int i = 0; i < band.size(); ++i) band.data()[i] = static_cast<float>(i * i) - 7.0f;

    auto s = composite::percentile_stretch(band, 2.0f, 98.0f);
    REQUIRE(s.minCoeff() >= 0.0f);
    REQUIRE(s.maxCoeff() <= 1.0f);
    REQUIRE(s(0, 0) == 0.0f);
    REQUIRE(s(3, 4) == 1.0f);
}

TEST_CASE("stretch_of_constant_band_is_zero") {
    Matrix2Df band = Matrix2Df::Constant(3, 3, -12.5f);
    auto s = composite::percentile_stretch(band);
    REQUIRE(s.maxCoeff() == Catch::Approx(0.0f));
    REQUIRE(s.minCoeff() == Catch::Approx(0.0f));
}

TEST_CASE("stretch_ignores_and_keeps_nan") {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    Matrix2Df band(1, 4);
    band << nan, 0.0f, 5.0f, 10.0f;

    auto s = composite::percentile_stretch(band, 0.0f, 100.0f);
    REQUIRE(std::isnan(s(0, 0)));
    REQUIRE(s(0, 1) == Catch::Approx(0.0f));
    REQUIRE(s(0, 2) == Catch::Approx(0.5f));
    REQUIRE(s(0, 3) == Catch::Approx(1.0f));

    Matrix2Df empty = Matrix2Df::Constant(2, 2, nan);
    auto e = composite::percentile_stretch(empty);
    REQUIRE(std::isnan(e(1, 1)));
}

TEST_CASE("identical_bands_give_zero_blue_channel") {
    Matrix2Df vv(2, 3);
    vv << -20.0f, -15.0f, -10.0f,
          -5.0f, -8.0f, -12.0f;

    auto rgb = composite::build_composite(vv, vv);
    REQUIRE(rgb.blue.cwiseAbs().maxCoeff() == Catch::Approx(0.0f));
    REQUIRE(rgb.red.isApprox(rgb.green));
}

TEST_CASE("composite_requires_equal_band_shapes") {
    REQUIRE_THROWS_AS(composite::build_composite(Matrix2Df::Zero(2, 2), Matrix2Df::Zero(2, 3)),
                      sar_compose::ValidationError);
}

TEST_CASE("mask_nodata_turns_sentinel_into_nan") {
    Matrix2Df band(1, 3);
    band << 0.0f, 1.0f, 0.0f;
    auto m = composite::mask_nodata(band, 0.0);
    REQUIRE(std::isnan(m(0, 0)));
    REQUIRE(m(0, 1) == 1.0f);
    REQUIRE(std::isnan(m(0, 2)));

    auto unchanged = composite::mask_nodata(band, std::nullopt);
    REQUIRE(unchanged(0, 0) == 0.0f);
}

TEST_CASE("to_u8_scales_and_zeroes_nan") {
    Matrix2Df ch(1, 4);
    ch << 0.0f, 0.5f, 1.0f, std::numeric_limits<float>::quiet_NaN();
    auto u = composite::to_u8(ch);
    REQUIRE(u(0, 0) == 0);
    REQUIRE(u(0, 1) == 128);
    REQUIRE(u(0, 2) == 255);
    REQUIRE(u(0, 3) == 0);
}
