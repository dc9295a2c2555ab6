#include "sar_compose/raster/alignment.hpp"
#include "sar_compose/core/errors.hpp"
#include "sar_compose/core/utils.hpp"
#include "sar_compose/geo/geometry.hpp"
#include "sar_compose/raster/raster_io.hpp"

namespace sar_compose::raster {

std::vector<std::string> grid_differences(const RasterGrid& a, const RasterGrid& b) {
    std::vector<std::string> diffs;
    if (!geo::crs_equal(a.crs_wkt, b.crs_wkt)) diffs.emplace_back("crs");
    if (a.transform.has_value() != b.transform.has_value() ||
        (a.transform && *a.transform != *b.transform)) {
        diffs.emplace_back("transform");
    }
    if (a.width != b.width) diffs.emplace_back("width");
    if (a.height != b.height) diffs.emplace_back("height");
    return diffs;
}

void verify_alignment(const RasterGrid& a, const RasterGrid& b) {
    auto diffs = grid_differences(a, b);
    if (!diffs.empty()) {
        throw AlignmentError("Clipped VV and VH are not perfectly aligned (differing: " +
                                 core::join(diffs, ", ") + ")",
                             std::move(diffs));
    }
}

void verify_alignment(const fs::path& a, const fs::path& b) {
    verify_alignment(read_grid(a), read_grid(b));
}

} // namespace sar_compose::raster
