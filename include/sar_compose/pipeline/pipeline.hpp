#pragma once

#include "sar_compose/catalog/discovery.hpp"
#include "sar_compose/catalog/http_client.hpp"
#include "sar_compose/catalog/product_catalog.hpp"
#include "sar_compose/config/configuration.hpp"
#include "sar_compose/core/events.hpp"
#include "sar_compose/core/types.hpp"
#include "sar_compose/pipeline/band_provider.hpp"

#include <memory>
#include <optional>
#include <string>

namespace sar_compose::pipeline {

// Per-run directory layout.
struct RunPaths {
    fs::path run_dir;
    fs::path logs_dir;
    fs::path outputs_dir;
    fs::path artifacts_dir;
    fs::path aoi_geojson;

    static RunPaths under(const fs::path& run_dir);
    void create() const;
};

struct PipelineResult {
    DiscoveredScene scene;
    std::optional<MatchResult> match;
    RawBands raw;
    fs::path vv_clip;
    fs::path vh_clip;
    RasterGrid grid;
    fs::path rgb;
    std::optional<fs::path> preview;
};

// Discovery -> band provision -> clip -> verify -> composite, strictly in order.
class Pipeline {
public:
    Pipeline(const config::Config& cfg, RunPaths paths, std::unique_ptr<catalog::Discovery> discovery,
             std::unique_ptr<BandProvider> provider);

    PipelineResult run(core::EventEmitter& events);

    const catalog::Discovery& discovery() const { return *discovery_; }
    const BandProvider& provider() const { return *provider_; }

private:
    const config::Config& cfg_;
    RunPaths paths_;
    std::unique_ptr<catalog::Discovery> discovery_;
    std::unique_ptr<BandProvider> provider_;
};

// Owns the network collaborators a variant needs and the assembled pipeline.
struct PipelineBundle {
    std::unique_ptr<catalog::HttpClient> http;
    std::unique_ptr<catalog::ProductCatalog> products;
    std::unique_ptr<Pipeline> pipeline;
};

// Wires Discovery/BandProvider for cfg.pipeline.variant. Throws ConfigError.
PipelineBundle make_pipeline(const config::Config& cfg, const RunPaths& paths);

// artifacts/manifest.json: outputs with SHA-256 and the matched product.
void write_manifest(const fs::path& path, const std::string& run_id, const config::Config& cfg,
                    const PipelineResult& result);

} // namespace sar_compose::pipeline
