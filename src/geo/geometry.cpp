#include "sar_compose/geo/geometry.hpp"
#include "sar_compose/core/errors.hpp"

#include <cpl_conv.h>
#include <cpl_error.h>
#include <ogr_spatialref.h>

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

#include <nlohmann/json.hpp>

namespace sar_compose::geo {

namespace {

struct CoordinateTransformationDeleter {
    void operator()(OGRCoordinateTransformation* ct) const {
        OGRCoordinateTransformation::DestroyCT(ct);
    }
};

using CoordinateTransformationPtr =
    std::unique_ptr<OGRCoordinateTransformation, CoordinateTransformationDeleter>;

std::string last_gdal_error() {
    const char* msg = CPLGetLastErrorMsg();
    return (msg && *msg) ? std::string(msg) : std::string("unknown GDAL error");
}

void load_srs(OGRSpatialReference& srs, const std::string& crs) {
    if (crs.empty()) {
        throw CRSError("empty CRS definition");
    }
    if (srs.SetFromUserInput(crs.c_str()) != OGRERR_NONE) {
        throw CRSError("cannot resolve CRS '" + crs + "': " + last_gdal_error());
    }
    srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
}

std::string format_coord(double v) {
    std::ostringstream oss;
    oss << std::setprecision(15) << v;
    return oss.str();
}

std::string ring_text(const Polygon& ring, const char* vertex_sep) {
    std::ostringstream oss;
    for (size_t i = 0; i < ring.size(); ++i) {
        if (i > 0) oss << vertex_sep;
        oss << format_coord(ring[i].x) << ' ' << format_coord(ring[i].y);
    }
    return oss.str();
}

} // namespace

Polygon aoi_polygon(const AreaOfInterest& aoi) {
    return {
        {aoi.min_lon(), aoi.min_lat()},
        {aoi.max_lon(), aoi.min_lat()},
        {aoi.max_lon(), aoi.max_lat()},
        {aoi.min_lon(), aoi.max_lat()},
        {aoi.min_lon(), aoi.min_lat()},
    };
}

Polygon transform_polygon(const Polygon& polygon, const std::string& from_crs,
                          const std::string& to_crs) {
    OGRSpatialReference src;
    OGRSpatialReference dst;
    load_srs(src, from_crs);
    load_srs(dst, to_crs);

    CoordinateTransformationPtr ct(OGRCreateCoordinateTransformation(&src, &dst));
    if (!ct) {
        throw CRSError("no transformation from '" + from_crs + "' to '" + to_crs +
                       "': " + last_gdal_error());
    }

    std::vector<double> xs;
    std::vector<double> ys;
    xs.reserve(polygon.size());
    ys.reserve(polygon.size());
    for (const auto& p : polygon) {
        xs.push_back(p.x);
        ys.push_back(p.y);
    }

    if (!polygon.empty() &&
        !ct->Transform(static_cast<int>(polygon.size()), xs.data(), ys.data())) {
        throw CRSError("coordinate transformation failed: " + last_gdal_error());
    }

    Polygon out;
    out.reserve(polygon.size());
    for (size_t i = 0; i < polygon.size(); ++i) {
        out.push_back({xs[i], ys[i]});
    }
    return out;
}

Bounds polygon_bounds(const Polygon& polygon) {
    if (polygon.empty()) {
        throw ValidationError("polygon has no vertices");
    }
    Bounds b{polygon[0].x, polygon[0].y, polygon[0].x, polygon[0].y};
    for (const auto& p : polygon) {
        b.min_x = std::min(b.min_x, p.x);
        b.min_y = std::min(b.min_y, p.y);
        b.max_x = std::max(b.max_x, p.x);
        b.max_y = std::max(b.max_y, p.y);
    }
    return b;
}

bool point_in_polygon(const Polygon& polygon, double x, double y) {
    bool inside = false;
    const size_t n = polygon.size();
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        const Point2D& a = polygon[i];
        const Point2D& b = polygon[j];
        if ((a.y > y) != (b.y > y)) {
            const double x_cross = (b.x - a.x) * (y - a.y) / (b.y - a.y) + a.x;
            if (x < x_cross) inside = !inside;
        }
    }
    return inside;
}

std::string aoi_as_catalog_polygon_literal(const AreaOfInterest& aoi) {
    return "geography'SRID=4326;POLYGON((" + ring_text(aoi_polygon(aoi), ",") + "))'";
}

std::string aoi_to_wkt(const AreaOfInterest& aoi) {
    return "POLYGON((" + ring_text(aoi_polygon(aoi), ", ") + "))";
}

void write_aoi_geojson(const AreaOfInterest& aoi, const fs::path& path) {
    nlohmann::json ring = nlohmann::json::array();
    for (const auto& p : aoi_polygon(aoi)) {
        ring.push_back({p.x, p.y});
    }

    nlohmann::json feature = {
        {"type", "Feature"},
        {"properties", nlohmann::json::object()},
        {"geometry", {{"type", "Polygon"}, {"coordinates", nlohmann::json::array({ring})}}},
    };
    nlohmann::json fc = {
        {"type", "FeatureCollection"},
        {"features", nlohmann::json::array({feature})},
    };

    if (!path.parent_path().empty()) {
        fs::create_directories(path.parent_path());
    }
    std::ofstream out(path);
    if (!out) {
        throw IOError("Cannot create file: " + path.string());
    }
    out << fc.dump();
}

std::string crs_to_wkt(const std::string& crs) {
    OGRSpatialReference srs;
    load_srs(srs, crs);

    char* wkt = nullptr;
    if (srs.exportToWkt(&wkt) != OGRERR_NONE || !wkt) {
        CPLFree(wkt);
        throw CRSError("cannot export CRS '" + crs + "' to WKT");
    }
    std::string out(wkt);
    CPLFree(wkt);
    return out;
}

bool crs_equal(const std::string& a_wkt, const std::string& b_wkt) {
    if (a_wkt == b_wkt) return true;
    if (a_wkt.empty() || b_wkt.empty()) return false;

    OGRSpatialReference a;
    OGRSpatialReference b;
    if (a.SetFromUserInput(a_wkt.c_str()) != OGRERR_NONE ||
        b.SetFromUserInput(b_wkt.c_str()) != OGRERR_NONE) {
        return false;
    }
    return a.IsSame(&b) == TRUE;
}

} // namespace sar_compose::geo
