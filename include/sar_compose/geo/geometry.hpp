#pragma once

#include "sar_compose/core/types.hpp"

#include <string>
#include <vector>

namespace sar_compose::geo {

struct Point2D {
    double x = 0.0;
    double y = 0.0;
};

// Outer ring only. A closed ring repeats its first vertex at the end.
using Polygon = std::vector<Point2D>;

struct Bounds {
    double min_x = 0.0;
    double min_y = 0.0;
    double max_x = 0.0;
    double max_y = 0.0;
};

// Counter-clockwise closed ring (5 vertices) starting at (min_lon, min_lat).
Polygon aoi_polygon(const AreaOfInterest& aoi);

// Transforms every vertex from `from_crs` to `to_crs`, keeping vertex order.
// CRS strings are anything OGR accepts as user input (EPSG:xxxx, WKT, PROJ).
// Coordinates are always x/easting = longitude first. Throws CRSError.
Polygon transform_polygon(const Polygon& polygon, const std::string& from_crs,
                          const std::string& to_crs);

Bounds polygon_bounds(const Polygon& polygon);

// Even-odd rule. Boundary points are unspecified.
bool point_in_polygon(const Polygon& polygon, double x, double y);

// geography'SRID=4326;POLYGON((lon lat,...,lon lat))' as used by OData spatial filters
std::string aoi_as_catalog_polygon_literal(const AreaOfInterest& aoi);

// POLYGON((lon lat, ...)) for search APIs taking plain WKT
std::string aoi_to_wkt(const AreaOfInterest& aoi);

// FeatureCollection with one Feature, empty properties, Polygon geometry.
void write_aoi_geojson(const AreaOfInterest& aoi, const fs::path& path);

// Canonical WKT for a CRS given as user input. Throws CRSError.
std::string crs_to_wkt(const std::string& crs);

// Exact string comparison first, then OGR semantic equivalence.
bool crs_equal(const std::string& a_wkt, const std::string& b_wkt);

} // namespace sar_compose::geo
