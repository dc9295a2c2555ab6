#include "sar_compose/raster/clipper.hpp"
#include "sar_compose/core/errors.hpp"
#include "sar_compose/geo/geometry.hpp"

#include <cpl_string.h>
#include <gdal_alg.h>
#include <gdal_priv.h>
#include <gdal_utils.h>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <memory>
#include <sstream>
#include <vector>

namespace sar_compose::raster {

namespace {

// Snap tolerance when rounding the window outward, in pixels
constexpr double kPixelEps = 1e-6;

struct WarpOptionsDeleter {
    void operator()(GDALWarpAppOptions* o) const { GDALWarpAppOptionsFree(o); }
};

std::string format_bound(double v) {
    std::ostringstream oss;
    oss << std::setprecision(17) << v;
    return oss.str();
}

} // namespace

RasterGrid clip_affine(const fs::path& src, const fs::path& dst, const AreaOfInterest& aoi,
                       const ClipOptions& options) {
    ensure_gdal_registered();
    GDALDatasetUniquePtr in(GDALDataset::Open(src.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY));
    if (!in) {
        throw RasterError("cannot open " + src.string() + ": " + last_gdal_error());
    }

    const char* wkt = in->GetProjectionRef();
    const std::string src_wkt = wkt ? wkt : "";
    if (src_wkt.empty()) {
        throw NoCRSError(src.string() + " has no CRS; cannot clip");
    }

    GeoTransform gt{};
    if (in->GetGeoTransform(gt.data()) != CE_None) {
        throw RasterError(src.string() + " has no geotransform");
    }
    GeoTransform inv{};
    if (!GDALInvGeoTransform(gt.data(), inv.data())) {
        throw RasterError(src.string() + " has a non-invertible geotransform");
    }

    const geo::Polygon ring =
        geo::transform_polygon(geo::aoi_polygon(aoi), "EPSG:4326", src_wkt);

    // Pixel/line extent of the transformed ring
    double px_min = std::numeric_limits<double>::max();
    double px_max = std::numeric_limits<double>::lowest();
    double ln_min = px_min;
    double ln_max = px_max;
    for (const auto& p : ring) {
        const double px = inv[0] + p.x * inv[1] + p.y * inv[2];
        const double ln = inv[3] + p.x * inv[4] + p.y * inv[5];
        px_min = std::min(px_min, px);
        px_max = std::max(px_max, px);
        ln_min = std::min(ln_min, ln);
        ln_max = std::max(ln_max, ln);
    }

    const int width = in->GetRasterXSize();
    const int height = in->GetRasterYSize();
    const int col0 = std::max(0, static_cast<int>(std::floor(px_min + kPixelEps)));
    const int row0 = std::max(0, static_cast<int>(std::floor(ln_min + kPixelEps)));
    const int col1 = std::min(width, static_cast<int>(std::ceil(px_max - kPixelEps)));
    const int row1 = std::min(height, static_cast<int>(std::ceil(ln_max - kPixelEps)));
    if (col1 <= col0 || row1 <= row0) {
        throw RasterError("AOI does not intersect " + src.string());
    }
    const int out_w = col1 - col0;
    const int out_h = row1 - row0;

    RasterGrid grid;
    grid.crs_wkt = src_wkt;
    grid.width = out_w;
    grid.height = out_h;
    GeoTransform out_gt = gt;
    out_gt[0] = gt[0] + col0 * gt[1] + row0 * gt[2];
    out_gt[3] = gt[3] + col0 * gt[4] + row0 * gt[5];
    grid.transform = out_gt;

    // Pixel-centre mask shared by every band
    std::vector<uint8_t> outside;
    if (options.mask_outside_polygon) {
        outside.assign(static_cast<size_t>(out_w) * static_cast<size_t>(out_h), 0);
        for (int r = 0; r < out_h; ++r) {
            for (int c = 0; c < out_w; ++c) {
                const double pc = c + 0.5;
                const double lc = r + 0.5;
                const double x = out_gt[0] + pc * out_gt[1] + lc * out_gt[2];
                const double y = out_gt[3] + pc * out_gt[4] + lc * out_gt[5];
                if (!geo::point_in_polygon(ring, x, y)) {
                    outside[static_cast<size_t>(r) * out_w + c] = 1;
                }
            }
        }
    }

    const int n_bands = in->GetRasterCount();
    if (n_bands < 1) {
        throw RasterError(src.string() + " has no raster bands");
    }
    const GDALDataType type = in->GetRasterBand(1)->GetRasterDataType();

    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("GTiff");
    if (!driver) {
        throw RasterError("GTiff driver not available");
    }
    CPLStringList co;
    co.AddNameValue("TILED", "YES");
    co.AddNameValue("COMPRESS", "DEFLATE");
    co.AddNameValue("BIGTIFF", "IF_SAFER");
    GDALDatasetUniquePtr out(driver->Create(dst.c_str(), out_w, out_h, n_bands, type, co.List()));
    if (!out) {
        throw RasterError("cannot create " + dst.string() + ": " + last_gdal_error());
    }
    out->SetProjection(src_wkt.c_str());
    out->SetGeoTransform(out_gt.data());

    std::vector<double> buf(static_cast<size_t>(out_w) * static_cast<size_t>(out_h));
    for (int b = 1; b <= n_bands; ++b) {
        GDALRasterBand* in_band = in->GetRasterBand(b);
        GDALRasterBand* out_band = out->GetRasterBand(b);

        if (in_band->RasterIO(GF_Read, col0, row0, out_w, out_h, buf.data(), out_w, out_h,
                              GDT_Float64, 0, 0) != CE_None) {
            throw RasterError("cannot read " + src.string() + ": " + last_gdal_error());
        }

        int has_nodata = FALSE;
        const double nodata = in_band->GetNoDataValue(&has_nodata);
        if (has_nodata) out_band->SetNoDataValue(nodata);
        const double fill = has_nodata ? nodata : 0.0;

        if (!outside.empty()) {
            for (size_t i = 0; i < buf.size(); ++i) {
                if (outside[i]) buf[i] = fill;
            }
        }

        if (out_band->RasterIO(GF_Write, 0, 0, out_w, out_h, buf.data(), out_w, out_h,
                               GDT_Float64, 0, 0) != CE_None) {
            throw RasterError("cannot write " + dst.string() + ": " + last_gdal_error());
        }
    }

    if (out->Close() != CE_None) {
        throw RasterError("cannot finalise " + dst.string() + ": " + last_gdal_error());
    }
    return grid;
}

std::vector<std::string> gcp_warp_arguments(const AreaOfInterest& aoi, int warp_threads) {
    return {
        "-of", "GTiff",
        "-tps",
        "-s_srs", "EPSG:4326",
        "-t_srs", "EPSG:4326",
        "-te", format_bound(aoi.min_lon()), format_bound(aoi.min_lat()),
               format_bound(aoi.max_lon()), format_bound(aoi.max_lat()),
        "-te_srs", "EPSG:4326",
        "-r", "bilinear",
        "-srcnodata", "0",
        "-dstnodata", "0",
        "-ot", "UInt16",
        "-multi",
        "-wo", warp_threads > 0 ? "NUM_THREADS=" + std::to_string(warp_threads)
                                : std::string("NUM_THREADS=ALL_CPUS"),
        "-co", "TILED=YES",
        "-co", "COMPRESS=ZSTD",
        "-co", "BIGTIFF=IF_SAFER",
        "-overwrite",
    };
}

RasterGrid clip_gcp(const fs::path& src, const fs::path& dst, const AreaOfInterest& aoi,
                    const ClipOptions& options) {
    ensure_gdal_registered();
    GDALDatasetUniquePtr in(GDALDataset::Open(src.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY));
    if (!in) {
        throw RasterError("cannot open " + src.string() + ": " + last_gdal_error());
    }
    if (in->GetGCPCount() == 0) {
        throw RasterError(src.string() + " carries no GCPs; cannot warp with thin-plate spline");
    }

    CPLStringList args;
    for (const auto& a : gcp_warp_arguments(aoi, options.warp_threads)) {
        args.AddString(a.c_str());
    }

    std::unique_ptr<GDALWarpAppOptions, WarpOptionsDeleter> warp_opts(
        GDALWarpAppOptionsNew(args.List(), nullptr));
    if (!warp_opts) {
        throw RasterError("invalid warp options: " + last_gdal_error());
    }

    GDALDatasetH src_h = GDALDataset::ToHandle(in.get());
    int usage_error = FALSE;
    GDALDatasetH out_h = GDALWarp(dst.c_str(), nullptr, 1, &src_h, warp_opts.get(), &usage_error);
    if (!out_h || usage_error) {
        if (out_h) GDALClose(out_h);
        throw RasterError("GDAL warp failed for " + src.string() + ": " + last_gdal_error());
    }

    GDALDatasetUniquePtr out(GDALDataset::FromHandle(out_h));
    RasterGrid grid;
    const char* wkt = out->GetProjectionRef();
    grid.crs_wkt = wkt ? wkt : "";
    grid.width = out->GetRasterXSize();
    grid.height = out->GetRasterYSize();
    GeoTransform gt{};
    if (out->GetGeoTransform(gt.data()) == CE_None) grid.transform = gt;

    if (out->Close() != CE_None) {
        throw RasterError("cannot finalise " + dst.string() + ": " + last_gdal_error());
    }
    return grid;
}

RasterGrid clip_to_aoi(const fs::path& src, const fs::path& dst, const AreaOfInterest& aoi,
                       const ClipOptions& options) {
    switch (detect_geolocation_mode(src)) {
        case GeolocationMode::AFFINE: return clip_affine(src, dst, aoi, options);
        case GeolocationMode::GCP: return clip_gcp(src, dst, aoi, options);
    }
    throw RasterError("unsupported geolocation mode for " + src.string());
}

} // namespace sar_compose::raster
