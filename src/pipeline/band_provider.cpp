#include "sar_compose/pipeline/band_provider.hpp"
#include "sar_compose/core/errors.hpp"
#include "sar_compose/pipeline/safe_archive.hpp"
#include "sar_compose/raster/raster_io.hpp"

#include <cpl_vsi.h>

#include <iostream>

namespace sar_compose::pipeline {

RawBands SafeArchiveBandProvider::provide(const DiscoveredScene& scene, const AreaOfInterest& aoi,
                                          core::EventEmitter& events) {
    const fs::path zip = source_->fetch(scene, aoi, events);

    events.phase_start(Phase::BAND_PROVISION, {{"archive", zip.string()},
                                               {"extract", archive_.extract}});
    RawBands bands = locate_measurement_bands(zip);

    if (archive_.extract) {
        fs::path dir;
        if (archive_.keep_extracted) {
            dir = run_dir_ / "extract";
        } else {
            scratch_ = core::ScopedTempDir(run_dir_, "extract");
            dir = scratch_.path();
        }
        bands = extract_bands(bands, dir);
    }

    std::cerr << "[BAND_PROVISION] VV: " << bands.vv.string() << std::endl;
    std::cerr << "[BAND_PROVISION] VH: " << bands.vh.string() << std::endl;
    events.phase_end(Phase::BAND_PROVISION, "ok", {{"vv", bands.vv.string()},
                                                   {"vh", bands.vh.string()}});
    return bands;
}

RawBands GeocodedBandProvider::provide(const DiscoveredScene& scene, const AreaOfInterest& aoi,
                                       core::EventEmitter& events) {
    const fs::path product = source_->fetch(scene, aoi, events);

    events.phase_start(Phase::BAND_PROVISION, {{"product", product.string()},
                                               {"engine_log", engine_.log_path().string()}});
    RawBands bands = engine_.run(product, outdir_, aoi_geojson_);

    std::cerr << "[BAND_PROVISION] VV: " << bands.vv.string() << std::endl;
    std::cerr << "[BAND_PROVISION] VH: " << bands.vh.string() << std::endl;
    events.phase_end(Phase::BAND_PROVISION, "ok", {{"vv", bands.vv.string()},
                                                   {"vh", bands.vh.string()}});
    return bands;
}

std::string s3_href_to_vsi(const std::string& href) {
    const std::string scheme = "s3://";
    if (!core::starts_with(href, scheme) || href.size() <= scheme.size()) {
        throw ValidationError("expected an s3:// asset href, got '" + href + "'");
    }
    return "/vsis3/" + href.substr(scheme.size());
}

void ObjectStoreBandProvider::configure_bucket(const std::string& vsi_path) const {
    // "/vsis3/<bucket>/"
    const size_t bucket_end = vsi_path.find('/', std::string("/vsis3/").size());
    const std::string prefix = vsi_path.substr(0, bucket_end == std::string::npos ? vsi_path.size()
                                                                                  : bucket_end + 1);
    VSISetPathSpecificOption(prefix.c_str(), "AWS_ACCESS_KEY_ID", settings_.access_key.c_str());
    VSISetPathSpecificOption(prefix.c_str(), "AWS_SECRET_ACCESS_KEY", settings_.secret_key.c_str());
    VSISetPathSpecificOption(prefix.c_str(), "AWS_S3_ENDPOINT", settings_.endpoint.c_str());
    VSISetPathSpecificOption(prefix.c_str(), "AWS_VIRTUAL_HOSTING", "FALSE");
    VSISetPathSpecificOption(prefix.c_str(), "AWS_HTTPS", "YES");
}

RawBands ObjectStoreBandProvider::provide(const DiscoveredScene& scene, const AreaOfInterest&,
                                          core::EventEmitter& events) {
    auto vv_it = scene.assets.find("vv");
    auto vh_it = scene.assets.find("vh");
    if (vv_it == scene.assets.end() || vh_it == scene.assets.end()) {
        throw ProductError("STAC item " + scene.pointer.id + " has no vv/vh assets");
    }

    const std::string vv_src = s3_href_to_vsi(vv_it->second);
    const std::string vh_src = s3_href_to_vsi(vh_it->second);
    raster::ensure_gdal_registered();
    configure_bucket(vv_src);
    configure_bucket(vh_src);

    events.phase_start(Phase::DOWNLOAD, {{"vv", vv_it->second}, {"vh", vh_it->second}});
    fs::create_directories(download_dir_);
    RawBands bands{download_dir_ / "VV.tif", download_dir_ / "VH.tif"};
    std::cerr << "[DOWNLOAD] " << vv_it->second << std::endl;
    raster::copy_vsi_file(vv_src, bands.vv);
    events.phase_progress(Phase::DOWNLOAD, 0.5f, "VV copied");
    std::cerr << "[DOWNLOAD] " << vh_it->second << std::endl;
    raster::copy_vsi_file(vh_src, bands.vh);
    events.phase_end(Phase::DOWNLOAD, "ok", {{"vv", bands.vv.string()}, {"vh", bands.vh.string()}});

    events.phase_start(Phase::BAND_PROVISION, {{"source", "object_store"}});
    events.phase_end(Phase::BAND_PROVISION, "ok", {{"vv", bands.vv.string()},
                                                   {"vh", bands.vh.string()}});
    return bands;
}

} // namespace sar_compose::pipeline
