#pragma once

/**
 * @file GeometryUtils.hpp
 * @brief Polygon operations used by AOI loading, scene selection and clipping
 *
 * Thin layer over OGR (GEOS-backed) geometry predicates and overlays.
 * All functions accept null or empty geometries and treat them as having
 * zero area.
 */

#include "aoi_composite.hpp"
#include <ogr_geometry.h>
#include <ogr_spatialref.h>
#include <string>
#include <vector>

namespace aoi {
namespace geometry {

/**
 * @brief Area of any polygonal geometry (polygon, multipolygon, collection)
 */
double area(const OGRGeometry* geom);

/**
 * @brief Intersection of two geometries, empty geometry when disjoint
 */
OGRGeometryUniquePtr intersection(const OGRGeometry* a, const OGRGeometry* b);

/**
 * @brief Union of two geometries; a null operand yields a clone of the other
 */
OGRGeometryUniquePtr union_of(const OGRGeometry* a, const OGRGeometry* b);

/**
 * @brief Area of geom divided by area of reference, 0 when reference has no area
 */
double area_ratio(const OGRGeometry* geom, const OGRGeometry* reference);

/**
 * @brief Fraction of aoi covered by footprint: area(footprint ∩ aoi) / area(aoi)
 */
double coverage_fraction(const OGRGeometry* footprint, const OGRGeometry* aoi);

/**
 * @brief True when inner lies entirely within outer
 */
bool within(const OGRGeometry* inner, const OGRGeometry* outer);

/**
 * @brief True when the geometries share any point
 */
bool intersects(const OGRGeometry* a, const OGRGeometry* b);

/**
 * @brief Parse a GeoJSON geometry object
 * @return Geometry, or null when the text is not a valid geometry
 */
OGRGeometryUniquePtr from_geojson(const std::string& geojson);

/**
 * @brief Serialize a geometry as a GeoJSON geometry object
 */
std::string to_geojson(const OGRGeometry* geom);

/**
 * @brief Envelope of a geometry as a BoundingBox
 */
BoundingBox envelope(const OGRGeometry* geom);

/**
 * @brief Spatial reference for an EPSG code using lon/lat (x/y) axis order
 */
OGRSpatialReference srs_from_epsg(int epsg);

/**
 * @brief Reproject a copy of geom from source to target
 * @return Reprojected clone, or null when the transformation fails
 */
OGRGeometryUniquePtr reproject(const OGRGeometry* geom,
                               const OGRSpatialReference& source,
                               const OGRSpatialReference& target);

/**
 * @brief Buffer a geometry by distance expressed in the units of its CRS
 */
OGRGeometryUniquePtr buffer(const OGRGeometry* geom, double distance);

} // namespace geometry
} // namespace aoi
