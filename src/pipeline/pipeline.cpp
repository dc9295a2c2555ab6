#include "sar_compose/pipeline/pipeline.hpp"
#include "sar_compose/composite/composite.hpp"
#include "sar_compose/core/errors.hpp"
#include "sar_compose/core/utils.hpp"
#include "sar_compose/geo/geometry.hpp"
#include "sar_compose/raster/alignment.hpp"
#include "sar_compose/raster/clipper.hpp"

#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

namespace sar_compose::pipeline {

namespace {

TimeInterval search_window(const config::TimeConfig& t) {
    TimeInterval w;
    w.start = core::parse_iso_utc(t.start);
    w.end = core::parse_iso_utc(t.end);
    // A bare end date covers that whole day
    if (t.end.size() == 10) {
        w.end += std::chrono::hours(24) - std::chrono::seconds(1);
    }
    return w;
}

fs::path cache_dir_for(const config::Config& cfg, const RunPaths& paths) {
    return cfg.download.cache_dir.empty() ? paths.run_dir / "downloads"
                                          : fs::path(cfg.download.cache_dir);
}

} // namespace

RunPaths RunPaths::under(const fs::path& run_dir) {
    RunPaths p;
    p.run_dir = run_dir;
    p.logs_dir = run_dir / "logs";
    p.outputs_dir = run_dir / "outputs";
    p.artifacts_dir = run_dir / "artifacts";
    p.aoi_geojson = run_dir / "artifacts" / "aoi.geojson";
    return p;
}

void RunPaths::create() const {
    fs::create_directories(logs_dir);
    fs::create_directories(outputs_dir);
    fs::create_directories(artifacts_dir);
}

Pipeline::Pipeline(const config::Config& cfg, RunPaths paths,
                   std::unique_ptr<catalog::Discovery> discovery,
                   std::unique_ptr<BandProvider> provider)
    : cfg_(cfg), paths_(std::move(paths)), discovery_(std::move(discovery)),
      provider_(std::move(provider)) {
    if (!discovery_ || !provider_) {
        throw PipelineError("pipeline requires a discovery catalog and a band provider");
    }
}

PipelineResult Pipeline::run(core::EventEmitter& events) {
    const AreaOfInterest aoi = cfg_.aoi.to_area();
    PipelineResult result;

    geo::write_aoi_geojson(aoi, paths_.aoi_geojson);

    // DISCOVERY
    const TimeInterval window = search_window(cfg_.time);
    events.phase_start(Phase::DISCOVERY, {{"catalog", discovery_->name()},
                                          {"start", core::format_iso_ms(window.start)},
                                          {"end", core::format_iso_ms(window.end)}});
    result.scene = discovery_->discover(aoi, window);
    std::cerr << "[DISCOVERY] " << result.scene.pointer.id << " (" << result.scene.acquired_at << ")"
              << std::endl;
    events.phase_end(Phase::DISCOVERY, "ok", {{"scene_id", result.scene.pointer.id},
                                              {"acquired_at", result.scene.acquired_at}});

    // MATCH / DOWNLOAD / BAND_PROVISION
    result.raw = provider_->provide(result.scene, aoi, events);
    result.match = provider_->matched_product();

    // CLIP
    raster::ClipOptions clip_opts;
    clip_opts.warp_threads = cfg_.clip.warp_threads;
    clip_opts.mask_outside_polygon = cfg_.clip.mask_outside_polygon;

    result.vv_clip = paths_.outputs_dir / "VV_clip.tif";
    result.vh_clip = paths_.outputs_dir / "VH_clip.tif";

    const auto vv_mode = raster::detect_geolocation_mode(result.raw.vv);
    const auto vh_mode = raster::detect_geolocation_mode(result.raw.vh);
    events.phase_start(Phase::CLIP, {{"vv_mode", raster::geolocation_mode_to_string(vv_mode)},
                                     {"vh_mode", raster::geolocation_mode_to_string(vh_mode)}});
    const RasterGrid vv_grid = raster::clip_to_aoi(result.raw.vv, result.vv_clip, aoi, clip_opts);
    events.phase_progress(Phase::CLIP, 0.5f, "VV clipped");
    const RasterGrid vh_grid = raster::clip_to_aoi(result.raw.vh, result.vh_clip, aoi, clip_opts);
    events.phase_end(Phase::CLIP, "ok", {{"vv", result.vv_clip.string()},
                                         {"vh", result.vh_clip.string()},
                                         {"width", vv_grid.width},
                                         {"height", vv_grid.height}});

    // VERIFY
    events.phase_start(Phase::VERIFY);
    raster::verify_alignment(raster::read_grid(result.vv_clip), raster::read_grid(result.vh_clip));
    result.grid = vv_grid;
    events.phase_end(Phase::VERIFY, "ok", {{"width", vv_grid.width}, {"height", vv_grid.height}});

    // COMPOSITE
    events.phase_start(Phase::COMPOSITE, {{"input_scale", cfg_.composite.input_scale},
                                          {"p_low", cfg_.composite.p_low},
                                          {"p_high", cfg_.composite.p_high}});
    const auto product = composite::compose_from_files(result.vv_clip, result.vh_clip,
                                                       cfg_.composite.scale(), cfg_.composite.p_low,
                                                       cfg_.composite.p_high);
    result.rgb = paths_.outputs_dir / "S1_RGB.tif";
    composite::write_composite_geotiff(result.rgb, product);
    if (cfg_.composite.write_preview) {
        result.preview = paths_.outputs_dir / "S1_RGB.png";
        composite::write_composite_preview(*result.preview, product.rgb);
    }
    events.phase_end(Phase::COMPOSITE, "ok", {{"rgb", result.rgb.string()}});

    return result;
}

PipelineBundle make_pipeline(const config::Config& cfg, const RunPaths& paths) {
    PipelineBundle b;
    b.http = std::make_unique<catalog::HttpClient>(cfg.catalog.timeout_s);
    const catalog::HttpClient& http = *b.http;
    const std::string& variant = cfg.pipeline.variant;

    auto stac = [&]() {
        return std::make_unique<catalog::StacDiscovery>(cfg.catalog.stac_url, cfg.catalog.stac_collection,
                                                        cfg.catalog.stac_limit, http);
    };
    auto cdse_source = [&]() {
        b.products = std::make_unique<catalog::ODataProductCatalog>(cfg.catalog.odata_url, http);
        return std::make_unique<CdseProductSource>(cfg, *b.products, http, cache_dir_for(cfg, paths));
    };
    auto engine = [&]() {
        return GeocodingEngine(cfg.geocode, paths.logs_dir / "geocode.log");
    };

    std::unique_ptr<catalog::Discovery> discovery;
    std::unique_ptr<BandProvider> provider;

    if (variant == "cdse_gcp") {
        discovery = stac();
        provider = std::make_unique<SafeArchiveBandProvider>(cdse_source(), cfg.archive, paths.run_dir);
    } else if (variant == "cdse_geocode") {
        discovery = stac();
        provider = std::make_unique<GeocodedBandProvider>(cdse_source(), engine(),
                                                          paths.run_dir / "geocoded", paths.aoi_geojson);
    } else if (variant == "asf_geocode") {
        discovery = std::make_unique<catalog::AsfDiscovery>(cfg.catalog.asf_search_url, http);
        auto source = std::make_unique<AsfProductSource>(cfg, http, cache_dir_for(cfg, paths));
        provider = std::make_unique<GeocodedBandProvider>(std::move(source), engine(),
                                                          paths.run_dir / "geocoded", paths.aoi_geojson);
    } else if (variant == "cog_s3") {
        discovery = stac();
        ObjectStoreSettings s3{cfg.credentials.s3_endpoint, cfg.credentials.s3_access_key,
                               cfg.credentials.s3_secret_key};
        provider = std::make_unique<ObjectStoreBandProvider>(std::move(s3), paths.run_dir / "cog");
    } else {
        throw ConfigError("unknown pipeline.variant '" + variant + "'");
    }

    b.pipeline = std::make_unique<Pipeline>(cfg, paths, std::move(discovery), std::move(provider));
    return b;
}

void write_manifest(const fs::path& path, const std::string& run_id, const config::Config& cfg,
                    const PipelineResult& result) {
    using json = nlohmann::json;

    auto entry = [](const std::string& role, const fs::path& p) {
        return json{{"role", role},
                    {"path", p.filename().string()},
                    {"bytes", fs::file_size(p)},
                    {"sha256", core::sha256_file(p)}};
    };

    json outputs = json::array();
    outputs.push_back(entry("vv_clip", result.vv_clip));
    outputs.push_back(entry("vh_clip", result.vh_clip));
    outputs.push_back(entry("rgb", result.rgb));
    if (result.preview) outputs.push_back(entry("preview", *result.preview));

    json manifest = {
        {"run_id", run_id},
        {"variant", cfg.pipeline.variant},
        {"aoi", cfg.aoi.bbox},
        {"scene", {{"id", result.scene.pointer.id},
                   {"acquired_at", result.scene.acquired_at},
                   {"sensing_start", core::format_iso_ms(result.scene.pointer.sensing.start)},
                   {"sensing_end", core::format_iso_ms(result.scene.pointer.sensing.end)}}},
        {"grid", {{"width", result.grid.width}, {"height", result.grid.height}}},
        {"outputs", outputs},
    };
    if (result.grid.transform) {
        manifest["grid"]["transform"] = *result.grid.transform;
    }
    if (result.match) {
        manifest["product"] = {{"id", result.match->product.id},
                               {"name", result.match->product.name},
                               {"publication_date", result.match->product.publication_date},
                               {"policy", match_policy_to_string(result.match->policy)},
                               {"candidates", result.match->candidates_seen}};
    }

    std::ofstream out(path);
    if (!out) {
        throw IOError("Cannot create file: " + path.string());
    }
    out << manifest.dump(2) << "\n";
}

} // namespace sar_compose::pipeline
