#pragma once

#include "sar_compose/catalog/http_client.hpp"
#include "sar_compose/catalog/product_catalog.hpp"
#include "sar_compose/config/configuration.hpp"
#include "sar_compose/core/events.hpp"
#include "sar_compose/core/types.hpp"

#include <optional>
#include <string>

namespace sar_compose::pipeline {

// Downloads `url` to `dest` through "<dest>.part", renamed on success. The
// partial file is removed on failure. Progress is reported on `phase` in 5%
// steps when the server announces a length.
void download_with_checkpoint(const catalog::HttpClient& http, const std::string& url,
                              const fs::path& dest, const catalog::HttpAuth& auth,
                              int timeout_s, core::EventEmitter& events, Phase phase);

// Produces a local raw product archive for a discovered scene.
class ProductSource {
public:
    virtual ~ProductSource() = default;

    virtual std::string name() const = 0;

    virtual fs::path fetch(const DiscoveredScene& scene, const AreaOfInterest& aoi,
                           core::EventEmitter& events) = 0;

    // Set by sources that resolve the scene in a second catalog.
    const std::optional<MatchResult>& last_match() const { return match_; }

protected:
    std::optional<MatchResult> match_;
};

// Matches the scene in the OData catalog, then downloads the SAFE zip with a
// bearer token into the cache directory.
class CdseProductSource : public ProductSource {
public:
    CdseProductSource(const config::Config& cfg, catalog::ProductCatalog& products,
                      const catalog::HttpClient& http, fs::path cache_dir)
        : cfg_(cfg), products_(products), http_(http), cache_dir_(std::move(cache_dir)) {}

    std::string name() const override { return "cdse"; }
    fs::path fetch(const DiscoveredScene& scene, const AreaOfInterest& aoi,
                   core::EventEmitter& events) override;

private:
    const config::Config& cfg_;
    catalog::ProductCatalog& products_;
    const catalog::HttpClient& http_;
    fs::path cache_dir_;
};

// Downloads the scene's "url" asset with Earthdata basic credentials.
class AsfProductSource : public ProductSource {
public:
    AsfProductSource(const config::Config& cfg, const catalog::HttpClient& http, fs::path cache_dir)
        : cfg_(cfg), http_(http), cache_dir_(std::move(cache_dir)) {}

    std::string name() const override { return "asf"; }
    fs::path fetch(const DiscoveredScene& scene, const AreaOfInterest& aoi,
                   core::EventEmitter& events) override;

private:
    const config::Config& cfg_;
    const catalog::HttpClient& http_;
    fs::path cache_dir_;
};

} // namespace sar_compose::pipeline
