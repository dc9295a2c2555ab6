#pragma once

#include "sar_compose/core/types.hpp"

#include <optional>
#include <string>

namespace sar_compose::raster {

enum class GeolocationMode {
    AFFINE,
    GCP
};

inline std::string geolocation_mode_to_string(GeolocationMode mode) {
    switch (mode) {
        case GeolocationMode::AFFINE: return "affine";
        case GeolocationMode::GCP: return "gcp";
        default: return "unknown";
    }
}

// GDALAllRegister once per process.
void ensure_gdal_registered();

// Last CPL error message, or a generic text when GDAL reported none.
std::string last_gdal_error();

// CRS, geotransform and size without reading pixels. Throws RasterError.
RasterGrid read_grid(const fs::path& path);

// First band as float32 plus grid, GCPs and nodata. Throws RasterError.
RasterBand read_band(const fs::path& path);

// AFFINE when the raster declares a CRS and a geotransform, GCP when it
// carries ground control points instead. Throws NoCRSError otherwise.
GeolocationMode detect_geolocation_mode(const fs::path& path);

// Single float32 band GeoTIFF. Used for derived products and fixtures.
void write_float_geotiff(const fs::path& path, const Matrix2Df& data, const RasterGrid& grid,
                         std::optional<double> nodata = std::nullopt);

// Three Byte bands in R,G,B order, no nodata.
void write_rgb_geotiff(const fs::path& path, const Matrix2Du8& red, const Matrix2Du8& green,
                       const Matrix2Du8& blue, const RasterGrid& grid);

// Copies any GDAL-readable path (including /vsis3/, /vsizip/) to a local file.
void copy_vsi_file(const std::string& src, const fs::path& dst);

} // namespace sar_compose::raster
