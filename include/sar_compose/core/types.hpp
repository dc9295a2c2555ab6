#pragma once

#include <Eigen/Dense>
#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sar_compose {

namespace fs = std::filesystem;

// Raster sample matrices (row = image line)
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Matrix2Du8 = Eigen::Matrix<uint8_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// GDAL ordering: x0, dx/dcol, dx/drow, y0, dy/dcol, dy/drow
using GeoTransform = std::array<double, 6>;

using UtcTime = std::chrono::system_clock::time_point;

// WGS84 bounding box. Bounds are validated on construction and never change.
class AreaOfInterest {
public:
    AreaOfInterest(double min_lon, double min_lat, double max_lon, double max_lat);

    double min_lon() const { return min_lon_; }
    double min_lat() const { return min_lat_; }
    double max_lon() const { return max_lon_; }
    double max_lat() const { return max_lat_; }

    std::array<double, 4> bbox() const { return {min_lon_, min_lat_, max_lon_, max_lat_}; }

private:
    double min_lon_;
    double min_lat_;
    double max_lon_;
    double max_lat_;
};

struct TimeInterval {
    UtcTime start;
    UtcTime end;
};

// Scene identifier from the discovery catalog, with the sensing interval and
// the name stem that the authoritative catalog is expected to share.
struct ScenePointer {
    std::string id;
    TimeInterval sensing;
    std::string prefix;
};

// Scene returned by a discovery catalog. Assets map role ("vv", "vh", "url")
// to a location understood by the band provider.
struct DiscoveredScene {
    ScenePointer pointer;
    std::string acquired_at;
    std::map<std::string, std::string> assets;
};

// Record of the authoritative product catalog.
struct ProductCandidate {
    std::string id;
    std::string name;
    std::string publication_date;
    std::string content_start;
};

enum class MatchPolicy {
    PREFIX,
    FALLBACK
};

inline std::string match_policy_to_string(MatchPolicy policy) {
    switch (policy) {
        case MatchPolicy::PREFIX: return "prefix";
        case MatchPolicy::FALLBACK: return "fallback";
        default: return "unknown";
    }
}

struct MatchResult {
    ProductCandidate product;
    MatchPolicy policy = MatchPolicy::PREFIX;
    int candidates_seen = 0;
};

enum class Polarization {
    VV,
    VH
};

inline std::string polarization_to_string(Polarization pol) {
    switch (pol) {
        case Polarization::VV: return "VV";
        case Polarization::VH: return "VH";
        default: return "UNKNOWN";
    }
}

// Raw per-polarization rasters handed to the clipper
struct RawBands {
    fs::path vv;
    fs::path vh;
};

// Pixel grid identity used by the alignment gate
struct RasterGrid {
    std::string crs_wkt;
    std::optional<GeoTransform> transform;
    int width = 0;
    int height = 0;
};

struct GroundControlPoint {
    std::string id;
    double pixel = 0.0;
    double line = 0.0;
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

struct RasterBand {
    RasterGrid grid;
    std::vector<GroundControlPoint> gcps;
    std::string gcp_crs_wkt;
    std::optional<double> nodata;
    Matrix2Df data;
};

// Stretched channels in [0,1] (NaN where no valid sample)
struct Composite {
    Matrix2Df red;
    Matrix2Df green;
    Matrix2Df blue;
};

enum class InputScale {
    LINEAR,
    DB
};

// Pipeline phase enumeration
enum class Phase {
    DISCOVERY = 0,
    MATCH = 1,
    DOWNLOAD = 2,
    BAND_PROVISION = 3,
    CLIP = 4,
    VERIFY = 5,
    COMPOSITE = 6,
    DONE = 7
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::DISCOVERY: return "DISCOVERY";
        case Phase::MATCH: return "MATCH";
        case Phase::DOWNLOAD: return "DOWNLOAD";
        case Phase::BAND_PROVISION: return "BAND_PROVISION";
        case Phase::CLIP: return "CLIP";
        case Phase::VERIFY: return "VERIFY";
        case Phase::COMPOSITE: return "COMPOSITE";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace sar_compose
