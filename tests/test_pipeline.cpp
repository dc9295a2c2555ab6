#include "sar_compose/config/configuration.hpp"
#include "sar_compose/core/errors.hpp"
#include "sar_compose/core/events.hpp"
#include "sar_compose/core/utils.hpp"
#include "sar_compose/geo/geometry.hpp"
#include "sar_compose/pipeline/band_provider.hpp"
#include "sar_compose/pipeline/pipeline.hpp"
#include "sar_compose/raster/raster_io.hpp"

#include <filesystem>
#include <sstream>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

using sar_compose::AreaOfInterest;
using sar_compose::DiscoveredScene;
using sar_compose::Matrix2Df;
using sar_compose::RasterGrid;
using sar_compose::RawBands;
namespace fs = std::filesystem;
namespace catalog = sar_compose::catalog;
namespace core = sar_compose::core;
namespace pipeline = sar_compose::pipeline;
namespace raster = sar_compose::raster;

namespace {

const char* kSceneId = "S1A_IW_GRDH_1SDV_20240105T163012_20240105T163037_051978_064775_1234_COG";

class FixedDiscovery : public catalog::Discovery {
public:
    std::string name() const override { return "fixed"; }

    DiscoveredScene discover(const AreaOfInterest&, const sar_compose::TimeInterval& window) override {
        last_window = window;
        DiscoveredScene s;
        s.pointer = catalog::parse_scene_pointer(kSceneId);
        s.acquired_at = "2024-01-05T16:30:12Z";
        return s;
    }

    sar_compose::TimeInterval last_window;
};

// Writes UTM 34N rasters; `vh_pixel` != 100 gives VH a different grid
class FixtureBandProvider : public pipeline::BandProvider {
public:
    FixtureBandProvider(fs::path dir, double vh_pixel) : dir_(std::move(dir)), vh_pixel_(vh_pixel) {}

    std::string name() const override { return "fixture"; }

    RawBands provide(const DiscoveredScene&, const AreaOfInterest&, core::EventEmitter& events) override {
        events.phase_start(sar_compose::Phase::BAND_PROVISION);
        RawBands b{dir_ / "vv.tif", dir_ / "vh.tif"};
        write(b.vv, 100.0, 0.2f);
        write(b.vh, vh_pixel_, 0.03f);
        events.phase_end(sar_compose::Phase::BAND_PROVISION, "ok");
        return b;
    }

private:
    void write(const fs::path& path, double pixel, float base) const {
        RasterGrid g;
        g.crs_wkt = sar_compose::geo::crs_to_wkt("EPSG:32634");
        g.transform = sar_compose::GeoTransform{550000.0, pixel, 0.0, 4520000.0, 0.0, -pixel};
        g.width = static_cast<int>(20000.0 / pixel);
        g.height = static_cast<int>(25000.0 / pixel);
        Matrix2Df data(g.height, g.width);
        for (int r = 0; r < g.height; ++r) {
            for (int c = 0; c < g.width; ++c) {
                data(r, c) = base * (1.0f + 0.01f * static_cast<float>((r * 7 + c * 3) % 50));
            }
        }
        raster::write_float_geotiff(path, data, g);
    }

    fs::path dir_;
    double vh_pixel_;
};

sar_compose::config::Config test_config() {
    sar_compose::config::Config cfg;
    cfg.aoi.bbox = {21.65, 40.67, 21.75, 40.76};
    cfg.time.start = "2024-01-01";
    cfg.time.end = "2024-01-31";
    cfg.composite.write_preview = false;
    return cfg;
}

std::vector<nlohmann::json> parse_events(const std::string& text) {
    std::vector<nlohmann::json> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) out.push_back(nlohmann::json::parse(line));
    return out;
}

} // namespace

TEST_CASE("pipeline_writes_clips_and_composite_in_phase_order") {
    core::ScopedTempDir tmp(fs::temp_directory_path(), "pipeline");
    const auto cfg = test_config();
    const auto paths = pipeline::RunPaths::under(tmp.path() / "run");
    paths.create();

    auto discovery = std::make_unique<FixedDiscovery>();
    FixedDiscovery* discovery_ptr = discovery.get();
    pipeline::Pipeline p(cfg, paths, std::move(discovery),
                         std::make_unique<FixtureBandProvider>(tmp.path(), 100.0));

    std::ostringstream log;
    core::EventEmitter events("run-test", log);
    const auto result = p.run(events);

    REQUIRE(fs::exists(paths.outputs_dir / "VV_clip.tif"));
    REQUIRE(fs::exists(paths.outputs_dir / "VH_clip.tif"));
    REQUIRE(fs::exists(paths.outputs_dir / "S1_RGB.tif"));
    REQUIRE_FALSE(result.preview.has_value());
    REQUIRE(fs::exists(paths.aoi_geojson));
    REQUIRE_FALSE(result.match.has_value());

    // Bare end date covers the whole day
    REQUIRE(core::format_iso_ms(discovery_ptr->last_window.end) == "2024-01-31T23:59:59.000Z");

    const auto rgb = raster::read_grid(result.rgb);
    REQUIRE(rgb.width == result.grid.width);
    REQUIRE(rgb.height == result.grid.height);

    std::vector<std::string> started;
    for (const auto& e : parse_events(log.str())) {
        if (e["type"] == "phase_start") started.push_back(e["phase_name"].get<std::string>());
    }
    REQUIRE(started ==
            std::vector<std::string>{"DISCOVERY", "BAND_PROVISION", "CLIP", "VERIFY", "COMPOSITE"});
    REQUIRE_FALSE(events.open_phase().has_value());

    const fs::path manifest = paths.artifacts_dir / "manifest.json";
    pipeline::write_manifest(manifest, "run-test", cfg, result);
    const auto m = nlohmann::json::parse(core::read_text(manifest));
    REQUIRE(m["scene"]["id"] == kSceneId);
    REQUIRE(m["outputs"].size() == 3);
    REQUIRE(m["outputs"][2]["sha256"] == core::sha256_file(result.rgb));
    REQUIRE_FALSE(m.contains("product"));
}

TEST_CASE("pipeline_stops_before_composite_on_misaligned_bands") {
    core::ScopedTempDir tmp(fs::temp_directory_path(), "pipeline");
    const auto cfg = test_config();
    const auto paths = pipeline::RunPaths::under(tmp.path() / "run");
    paths.create();

    pipeline::Pipeline p(cfg, paths, std::make_unique<FixedDiscovery>(),
                         std::make_unique<FixtureBandProvider>(tmp.path(), 50.0));

    std::ostringstream log;
    core::EventEmitter events("run-test", log);
    REQUIRE_THROWS_AS(p.run(events), sar_compose::AlignmentError);
    REQUIRE(events.open_phase().value() == sar_compose::Phase::VERIFY);
    REQUIRE_FALSE(fs::exists(paths.outputs_dir / "S1_RGB.tif"));
}

TEST_CASE("run_paths_layout") {
    const auto p = pipeline::RunPaths::under("/runs/20240105_x");
    REQUIRE(p.logs_dir == fs::path("/runs/20240105_x/logs"));
    REQUIRE(p.outputs_dir == fs::path("/runs/20240105_x/outputs"));
    REQUIRE(p.aoi_geojson == fs::path("/runs/20240105_x/artifacts/aoi.geojson"));
}

TEST_CASE("s3_href_maps_to_gdal_virtual_path") {
    REQUIRE(pipeline::s3_href_to_vsi("s3://eodata/Sentinel-1/a/vv.tif") == "/vsis3/eodata/Sentinel-1/a/vv.tif");
    REQUIRE_THROWS_AS(pipeline::s3_href_to_vsi("https://example.test/vv.tif"), sar_compose::ValidationError);
}

TEST_CASE("make_pipeline_wires_variant_collaborators") {
    auto cfg = test_config();
    const auto paths = pipeline::RunPaths::under("/tmp/unused-run");

    cfg.pipeline.variant = "cog_s3";
    auto cog = pipeline::make_pipeline(cfg, paths);
    REQUIRE(cog.pipeline->discovery().name() == "stac");
    REQUIRE(cog.pipeline->provider().name() == "object_store");
    REQUIRE(cog.products == nullptr);

    cfg.pipeline.variant = "cdse_gcp";
    auto gcp = pipeline::make_pipeline(cfg, paths);
    REQUIRE(gcp.pipeline->provider().name() == "safe_archive");
    REQUIRE(gcp.products != nullptr);

    cfg.pipeline.variant = "asf_geocode";
    auto asf = pipeline::make_pipeline(cfg, paths);
    REQUIRE(asf.pipeline->discovery().name() == "asf");
    REQUIRE(asf.pipeline->provider().name() == "geocoded");

    cfg.pipeline.variant = "bogus";
    REQUIRE_THROWS_AS(pipeline::make_pipeline(cfg, paths), sar_compose::ConfigError);
}
