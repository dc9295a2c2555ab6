#pragma once

#include "sar_compose/config/configuration.hpp"
#include "sar_compose/core/events.hpp"
#include "sar_compose/core/types.hpp"
#include "sar_compose/core/utils.hpp"
#include "sar_compose/pipeline/geocoding.hpp"
#include "sar_compose/pipeline/product_source.hpp"

#include <memory>
#include <optional>
#include <string>

namespace sar_compose::pipeline {

// Turns a discovered scene into raw VV/VH raster paths ready for clipping.
class BandProvider {
public:
    virtual ~BandProvider() = default;

    virtual std::string name() const = 0;

    virtual RawBands provide(const DiscoveredScene& scene, const AreaOfInterest& aoi,
                             core::EventEmitter& events) = 0;

    // Product resolved in the authoritative catalog, when the provider does one.
    virtual std::optional<MatchResult> matched_product() const { return std::nullopt; }
};

// Measurement TIFFs read from the SAFE zip. With extraction enabled they are
// copied either to `<run>/extract` (kept) or to a scoped temporary directory
// released with the provider.
class SafeArchiveBandProvider : public BandProvider {
public:
    SafeArchiveBandProvider(std::unique_ptr<ProductSource> source, config::ArchiveConfig archive,
                            fs::path run_dir)
        : source_(std::move(source)), archive_(archive), run_dir_(std::move(run_dir)) {}

    std::string name() const override { return "safe_archive"; }
    RawBands provide(const DiscoveredScene& scene, const AreaOfInterest& aoi,
                     core::EventEmitter& events) override;
    std::optional<MatchResult> matched_product() const override { return source_->last_match(); }

private:
    std::unique_ptr<ProductSource> source_;
    config::ArchiveConfig archive_;
    fs::path run_dir_;
    core::ScopedTempDir scratch_;
};

// Raw product handed to the external geocoding engine.
class GeocodedBandProvider : public BandProvider {
public:
    GeocodedBandProvider(std::unique_ptr<ProductSource> source, GeocodingEngine engine,
                         fs::path outdir, fs::path aoi_geojson)
        : source_(std::move(source)), engine_(std::move(engine)),
          outdir_(std::move(outdir)), aoi_geojson_(std::move(aoi_geojson)) {}

    std::string name() const override { return "geocoded"; }
    RawBands provide(const DiscoveredScene& scene, const AreaOfInterest& aoi,
                     core::EventEmitter& events) override;
    std::optional<MatchResult> matched_product() const override { return source_->last_match(); }

private:
    std::unique_ptr<ProductSource> source_;
    GeocodingEngine engine_;
    fs::path outdir_;
    fs::path aoi_geojson_;
};

struct ObjectStoreSettings {
    std::string endpoint;   // host, no scheme
    std::string access_key;
    std::string secret_key;
};

// s3://bucket/key -> /vsis3/bucket/key. Throws ValidationError for other schemes.
std::string s3_href_to_vsi(const std::string& href);

// Cloud-optimized VV/VH assets copied from object storage through GDAL.
// Credentials are bound to the bucket path, not the process environment.
class ObjectStoreBandProvider : public BandProvider {
public:
    ObjectStoreBandProvider(ObjectStoreSettings settings, fs::path download_dir)
        : settings_(std::move(settings)), download_dir_(std::move(download_dir)) {}

    std::string name() const override { return "object_store"; }
    RawBands provide(const DiscoveredScene& scene, const AreaOfInterest& aoi,
                     core::EventEmitter& events) override;

private:
    void configure_bucket(const std::string& vsi_path) const;

    ObjectStoreSettings settings_;
    fs::path download_dir_;
};

} // namespace sar_compose::pipeline
