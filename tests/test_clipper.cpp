#include "sar_compose/core/errors.hpp"
#include "sar_compose/core/utils.hpp"
#include "sar_compose/geo/geometry.hpp"
#include "sar_compose/raster/alignment.hpp"
#include "sar_compose/raster/clipper.hpp"
#include "sar_compose/raster/raster_io.hpp"

#include <gdal_priv.h>

#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using sar_compose::AreaOfInterest;
using sar_compose::Matrix2Df;
using sar_compose::RasterGrid;
namespace fs = std::filesystem;
namespace core = sar_compose::core;
namespace geo = sar_compose::geo;
namespace raster = sar_compose::raster;

namespace {

const AreaOfInterest kAoi(21.65, 40.67, 21.75, 40.76);

// 100 m UTM 34N grid spanning 550-570 km E, 4495-4520 km N
RasterGrid utm_fixture_grid() {
    RasterGrid g;
    g.crs_wkt = geo::crs_to_wkt("EPSG:32634");
    g.transform = sar_compose::GeoTransform{550000.0, 100.0, 0.0, 4520000.0, 0.0, -100.0};
    g.width = 200;
    g.height = 250;
    return g;
}

fs::path write_utm_fixture(const fs::path& dir, const std::string& name, float value) {
    const RasterGrid g = utm_fixture_grid();
    const fs::path path = dir / name;
    raster::write_float_geotiff(path, Matrix2Df::Constant(g.height, g.width, value), g);
    return path;
}

// UInt16 raster georeferenced only by a 3x3 lattice of EPSG:4326 GCPs
fs::path write_gcp_fixture(const fs::path& dir) {
    raster::ensure_gdal_registered();
    const fs::path path = dir / "gcp.tif";
    const int size = 120;

    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("GTiff");
    REQUIRE(driver != nullptr);
    GDALDatasetUniquePtr ds(driver->Create(path.c_str(), size, size, 1, GDT_UInt16, nullptr));
    REQUIRE(ds != nullptr);

    std::vector<uint16_t> pixels(static_cast<size_t>(size) * size, 500);
    REQUIRE(ds->GetRasterBand(1)->RasterIO(GF_Write, 0, 0, size, size, pixels.data(), size, size,
                                           GDT_UInt16, 0, 0) == CE_None);

    std::vector<GDAL_GCP> gcps(9);
    GDALInitGCPs(static_cast<int>(gcps.size()), gcps.data());
    for (int j = 0; j < 3; ++j) {
        for (int i = 0; i < 3; ++i) {
            GDAL_GCP& g = gcps[static_cast<size_t>(j * 3 + i)];
            g.dfGCPPixel = i * (size / 2.0);
            g.dfGCPLine = j * (size / 2.0);
            g.dfGCPX = 21.6 + i * 0.1;
            g.dfGCPY = 40.8 - j * 0.1;
            g.dfGCPZ = 0.0;
        }
    }
    const std::string wgs84 = geo::crs_to_wkt("EPSG:4326");
    const CPLErr err = ds->SetGCPs(static_cast<int>(gcps.size()), gcps.data(), wgs84.c_str());
    GDALDeinitGCPs(static_cast<int>(gcps.size()), gcps.data());
    REQUIRE(err == CE_None);
    return path;
}

} // namespace

TEST_CASE("detect_mode_for_affine_gcp_and_bare_rasters") {
    core::ScopedTempDir tmp(fs::temp_directory_path(), "clip");

    REQUIRE(raster::detect_geolocation_mode(write_utm_fixture(tmp.path(), "utm.tif", 1.0f)) ==
            raster::GeolocationMode::AFFINE);
    REQUIRE(raster::detect_geolocation_mode(write_gcp_fixture(tmp.path())) ==
            raster::GeolocationMode::GCP);

    const fs::path bare = tmp.path() / "bare.tif";
    raster::write_float_geotiff(bare, Matrix2Df::Zero(4, 4), RasterGrid{});
    REQUIRE_THROWS_AS(raster::detect_geolocation_mode(bare), sar_compose::NoCRSError);
}

TEST_CASE("affine_clip_keeps_crs_and_covers_aoi") {
    core::ScopedTempDir tmp(fs::temp_directory_path(), "clip");
    const fs::path src = write_utm_fixture(tmp.path(), "vv.tif", 1.0f);
    const fs::path dst = tmp.path() / "vv_clip.tif";

    const RasterGrid grid = raster::clip_affine(src, dst, kAoi);
    REQUIRE(geo::crs_equal(grid.crs_wkt, utm_fixture_grid().crs_wkt));
    REQUIRE(grid.transform.has_value());
    REQUIRE((*grid.transform)[1] == 100.0);
    REQUIRE((*grid.transform)[5] == -100.0);
    REQUIRE(grid.width < 200);
    REQUIRE(grid.height < 250);

    const auto& gt = *grid.transform;
    const auto b = geo::polygon_bounds(
        geo::transform_polygon(geo::aoi_polygon(kAoi), "EPSG:4326", "EPSG:32634"));
    REQUIRE(gt[0] <= b.min_x);
    REQUIRE(gt[3] >= b.max_y);
    REQUIRE(gt[0] + grid.width * gt[1] >= b.max_x);
    REQUIRE(gt[3] + grid.height * gt[5] <= b.min_y);
    // Outward rounding adds at most one pixel on each side
    REQUIRE(b.min_x - gt[0] < 100.0);
    REQUIRE(gt[3] - b.max_y < 100.0);

    const auto band = raster::read_band(dst);
    REQUIRE(band.grid.width == grid.width);
    REQUIRE(band.grid.height == grid.height);
    REQUIRE(band.data(grid.height / 2, grid.width / 2) == 1.0f);
}

TEST_CASE("affine_clip_without_mask_keeps_every_pixel") {
    core::ScopedTempDir tmp(fs::temp_directory_path(), "clip");
    const fs::path src = write_utm_fixture(tmp.path(), "vh.tif", 3.0f);
    const fs::path dst = tmp.path() / "vh_clip.tif";

    raster::ClipOptions opts;
    opts.mask_outside_polygon = false;
    raster::clip_affine(src, dst, kAoi, opts);

    const auto band = raster::read_band(dst);
    REQUIRE(band.data.minCoeff() == 3.0f);
    REQUIRE_FALSE(band.nodata.has_value());
}

TEST_CASE("affine_clips_of_two_bands_on_one_grid_align") {
    core::ScopedTempDir tmp(fs::temp_directory_path(), "clip");
    const fs::path vv = write_utm_fixture(tmp.path(), "vv.tif", 1.0f);
    const fs::path vh = write_utm_fixture(tmp.path(), "vh.tif", 2.0f);

    raster::clip_to_aoi(vv, tmp.path() / "vv_clip.tif", kAoi);
    raster::clip_to_aoi(vh, tmp.path() / "vh_clip.tif", kAoi);
    REQUIRE_NOTHROW(raster::verify_alignment(tmp.path() / "vv_clip.tif", tmp.path() / "vh_clip.tif"));
}

TEST_CASE("affine_clip_rejects_disjoint_aoi") {
    core::ScopedTempDir tmp(fs::temp_directory_path(), "clip");
    const fs::path src = write_utm_fixture(tmp.path(), "vv.tif", 1.0f);
    REQUIRE_THROWS_AS(raster::clip_affine(src, tmp.path() / "out.tif", AreaOfInterest(20.0, 38.0, 20.1, 38.1)),
                      sar_compose::RasterError);
}

TEST_CASE("gcp_clip_outputs_wgs84_grid_on_aoi_bounds") {
    core::ScopedTempDir tmp(fs::temp_directory_path(), "clip");
    const fs::path src = write_gcp_fixture(tmp.path());
    const fs::path dst = tmp.path() / "gcp_clip.tif";

    raster::ClipOptions opts;
    opts.warp_threads = 1;
    const RasterGrid grid = raster::clip_to_aoi(src, dst, kAoi, opts);

    REQUIRE(geo::crs_equal(grid.crs_wkt, geo::crs_to_wkt("EPSG:4326")));
    REQUIRE(grid.transform.has_value());
    const auto& gt = *grid.transform;
    REQUIRE(gt[0] == Catch::Approx(21.65).margin(1e-9));
    REQUIRE(gt[3] == Catch::Approx(40.76).margin(1e-9));
    REQUIRE(gt[0] + grid.width * gt[1] == Catch::Approx(21.75).margin(1e-9));
    REQUIRE(gt[3] + grid.height * gt[5] == Catch::Approx(40.67).margin(1e-9));

    GDALDatasetUniquePtr out(GDALDataset::Open(dst.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY));
    REQUIRE(out != nullptr);
    REQUIRE(out->GetRasterBand(1)->GetRasterDataType() == GDT_UInt16);
}

TEST_CASE("gcp_warp_arguments_pin_output_extent_and_resampling") {
    const auto args = raster::gcp_warp_arguments(kAoi, 4);
    auto has = [&](const std::string& a) { return std::find(args.begin(), args.end(), a) != args.end(); };

    REQUIRE(has("-tps"));
    REQUIRE(has("bilinear"));
    REQUIRE(has("UInt16"));
    REQUIRE(has("NUM_THREADS=4"));

    auto te = std::find(args.begin(), args.end(), "-te");
    REQUIRE(te != args.end());
    REQUIRE(std::stod(*(te + 1)) == 21.65);
    REQUIRE(std::stod(*(te + 2)) == 40.67);
    REQUIRE(std::stod(*(te + 3)) == 21.75);
    REQUIRE(std::stod(*(te + 4)) == 40.76);

    const auto all_cpus = raster::gcp_warp_arguments(kAoi, 0);
    REQUIRE(std::find(all_cpus.begin(), all_cpus.end(), "NUM_THREADS=ALL_CPUS") != all_cpus.end());
}
