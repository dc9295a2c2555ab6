#pragma once

#include "sar_compose/core/types.hpp"
#include "sar_compose/raster/raster_io.hpp"

#include <string>
#include <vector>

namespace sar_compose::raster {

struct ClipOptions {
    int warp_threads = 0;            // GCP mode; 0 = all CPUs
    bool mask_outside_polygon = true; // affine mode
};

// Affine mode: crops to the extent of the AOI transformed into the raster CRS.
// The pixel window is rounded outward and intersected with the raster; pixels
// whose centre falls outside the transformed polygon get the source nodata
// (0 when none is declared). Output keeps the source CRS and data type.
// Throws NoCRSError, CRSError, RasterError.
RasterGrid clip_affine(const fs::path& src, const fs::path& dst, const AreaOfInterest& aoi,
                       const ClipOptions& options = {});

// GCP mode: thin-plate-spline warp with GCPs read as EPSG:4326 into EPSG:4326,
// output bounds exactly the AOI box, bilinear, nodata 0 in and out, UInt16.
// Throws RasterError.
RasterGrid clip_gcp(const fs::path& src, const fs::path& dst, const AreaOfInterest& aoi,
                    const ClipOptions& options = {});

// Dispatches on detect_geolocation_mode(src).
RasterGrid clip_to_aoi(const fs::path& src, const fs::path& dst, const AreaOfInterest& aoi,
                       const ClipOptions& options = {});

// GDALWarp argument list used by clip_gcp.
std::vector<std::string> gcp_warp_arguments(const AreaOfInterest& aoi, int warp_threads);

} // namespace sar_compose::raster
