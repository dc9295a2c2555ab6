#include "sar_compose/core/errors.hpp"
#include "sar_compose/pipeline/safe_archive.hpp"

#include <catch2/catch_test_macros.hpp>

using sar_compose::Polarization;
namespace pipeline = sar_compose::pipeline;

namespace {

const std::vector<std::string> kEntries = {
    "S1A_IW_GRDH_1SDV_X.SAFE/manifest.safe",
    "S1A_IW_GRDH_1SDV_X.SAFE/annotation/s1a-iw-grd-vv-20240105t163012-001.xml",
    "S1A_IW_GRDH_1SDV_X.SAFE/measurement/s1a-iw-grd-vh-20240105t163012-002.tiff",
    "S1A_IW_GRDH_1SDV_X.SAFE/measurement/s1a-iw-grd-vv-20240105t163012-001.tiff",
    "S1A_IW_GRDH_1SDV_X.SAFE/preview/quick-look-vv-x.tiff",
};

} // namespace

TEST_CASE("select_measurements_picks_polarization_in_measurement_dir") {
    auto vv = pipeline::select_measurements(kEntries, Polarization::VV);
    REQUIRE(vv == std::vector<std::string>{
                      "S1A_IW_GRDH_1SDV_X.SAFE/measurement/s1a-iw-grd-vv-20240105t163012-001.tiff"});

    auto vh = pipeline::select_measurements(kEntries, Polarization::VH);
    REQUIRE(vh.size() == 1);
    REQUIRE(vh.front().find("-vh-") != std::string::npos);
}

TEST_CASE("select_measurements_empty_for_single_pol_product") {
    std::vector<std::string> single = {"S1A.SAFE/measurement/s1a-iw-grd-hh-x-001.tiff"};
    REQUIRE(pipeline::select_measurements(single, Polarization::VV).empty());
}

TEST_CASE("vsizip_path_is_absolute") {
    const std::string p = pipeline::vsizip_path("product.zip");
    REQUIRE(p.rfind("/vsizip//", 0) == 0);
    REQUIRE(p.size() > std::string("/vsizip/product.zip").size());
}

TEST_CASE("missing_archive_is_io_error") {
    REQUIRE_THROWS_AS(pipeline::locate_measurement_bands("/nonexistent/product.zip"), sar_compose::IOError);
}
