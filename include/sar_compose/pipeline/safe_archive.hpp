#pragma once

#include "sar_compose/core/types.hpp"

#include <string>
#include <vector>

namespace sar_compose::pipeline {

// "/vsizip/<zip>" prefix for GDAL access to archive members.
std::string vsizip_path(const fs::path& zip);

// Members of `entries` under a measurement/ directory whose file name matches
// "*-<pol>-*.tiff" (case-insensitive), sorted.
std::vector<std::string> select_measurements(const std::vector<std::string>& entries,
                                             Polarization pol);

// Locates the VV and VH measurement TIFFs inside a SAFE zip and returns their
// /vsizip/ paths. Throws ProductError when either is missing.
RawBands locate_measurement_bands(const fs::path& zip);

// Copies both bands out of the archive into `dir`.
RawBands extract_bands(const RawBands& bands, const fs::path& dir);

} // namespace sar_compose::pipeline
