#pragma once

#include "sar_compose/core/types.hpp"

#include <string>
#include <vector>

namespace sar_compose::raster {

// Names of the differing fields among "crs", "transform", "width", "height",
// in that order. Transforms are compared exactly.
std::vector<std::string> grid_differences(const RasterGrid& a, const RasterGrid& b);

// Throws AlignmentError listing every differing field.
void verify_alignment(const RasterGrid& a, const RasterGrid& b);

// Reads both grids from disk, then verify_alignment.
void verify_alignment(const fs::path& a, const fs::path& b);

} // namespace sar_compose::raster
