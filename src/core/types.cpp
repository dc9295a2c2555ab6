#include "sar_compose/core/types.hpp"
#include "sar_compose/core/errors.hpp"

#include <cmath>
#include <sstream>

namespace sar_compose {

AreaOfInterest::AreaOfInterest(double min_lon, double min_lat, double max_lon, double max_lat)
    : min_lon_(min_lon), min_lat_(min_lat), max_lon_(max_lon), max_lat_(max_lat) {
    if (!std::isfinite(min_lon) || !std::isfinite(min_lat) ||
        !std::isfinite(max_lon) || !std::isfinite(max_lat)) {
        throw ValidationError("AOI bounds must be finite numbers");
    }
    if (!(min_lon < max_lon) || !(min_lat < max_lat)) {
        std::ostringstream oss;
        oss << "AOI bounds must satisfy min_lon < max_lon and min_lat < max_lat, got ["
            << min_lon << ", " << min_lat << ", " << max_lon << ", " << max_lat << "]";
        throw ValidationError(oss.str());
    }
    if (min_lon < -180.0 || max_lon > 180.0 || min_lat < -90.0 || max_lat > 90.0) {
        throw ValidationError("AOI bounds must lie within [-180,180] x [-90,90]");
    }
}

} // namespace sar_compose
