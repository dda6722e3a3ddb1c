/**
 * @file GeometryUtils.cpp
 * @brief Implementation of polygon operations over OGR geometries
 */

#include "GeometryUtils.hpp"
#include "Logger.hpp"
#include <ogr_api.h>
#include <cpl_conv.h>
#include <memory>

namespace aoi {
namespace geometry {

namespace {

struct CoordinateTransformationDeleter {
    void operator()(OGRCoordinateTransformation* ct) {
        OGRCoordinateTransformation::DestroyCT(ct);
    }
};

using CoordinateTransformationPtr =
    std::unique_ptr<OGRCoordinateTransformation, CoordinateTransformationDeleter>;

// Matches the default resolution of common planar buffer implementations
constexpr int BUFFER_QUADRANT_SEGMENTS = 16;

OGRGeometryUniquePtr empty_polygon() {
    return OGRGeometryUniquePtr(new OGRPolygon());
}

} // namespace

double area(const OGRGeometry* geom) {
    if (!geom || geom->IsEmpty()) {
        return 0.0;
    }

    OGRwkbGeometryType type = wkbFlatten(geom->getGeometryType());
    if (OGR_GT_IsSubClassOf(type, wkbSurface)) {
        return geom->toSurface()->get_Area();
    }
    if (OGR_GT_IsSubClassOf(type, wkbGeometryCollection)) {
        return geom->toGeometryCollection()->get_Area();
    }
    return 0.0;
}

OGRGeometryUniquePtr intersection(const OGRGeometry* a, const OGRGeometry* b) {
    if (!a || !b || a->IsEmpty() || b->IsEmpty()) {
        return empty_polygon();
    }

    OGRGeometryUniquePtr result(a->Intersection(b));
    if (!result) {
        Logger logger("GeometryUtils");
        logger.warning("Geometry intersection failed; treating as empty");
        return empty_polygon();
    }
    return result;
}

OGRGeometryUniquePtr union_of(const OGRGeometry* a, const OGRGeometry* b) {
    if (!a || a->IsEmpty()) {
        return b ? OGRGeometryUniquePtr(b->clone()) : empty_polygon();
    }
    if (!b || b->IsEmpty()) {
        return OGRGeometryUniquePtr(a->clone());
    }

    OGRGeometryUniquePtr result(a->Union(b));
    if (!result) {
        Logger logger("GeometryUtils");
        logger.warning("Geometry union failed; keeping the first operand");
        return OGRGeometryUniquePtr(a->clone());
    }
    return result;
}

double area_ratio(const OGRGeometry* geom, const OGRGeometry* reference) {
    double reference_area = area(reference);
    if (reference_area <= 0.0) {
        return 0.0;
    }
    return area(geom) / reference_area;
}

double coverage_fraction(const OGRGeometry* footprint, const OGRGeometry* aoi) {
    auto overlap = intersection(footprint, aoi);
    return area_ratio(overlap.get(), aoi);
}

bool within(const OGRGeometry* inner, const OGRGeometry* outer) {
    if (!inner || !outer || inner->IsEmpty() || outer->IsEmpty()) {
        return false;
    }
    return inner->Within(outer);
}

bool intersects(const OGRGeometry* a, const OGRGeometry* b) {
    if (!a || !b || a->IsEmpty() || b->IsEmpty()) {
        return false;
    }
    return a->Intersects(b);
}

OGRGeometryUniquePtr from_geojson(const std::string& geojson) {
    OGRGeometryH handle = OGR_G_CreateGeometryFromJson(geojson.c_str());
    if (!handle) {
        return nullptr;
    }
    return OGRGeometryUniquePtr(OGRGeometry::FromHandle(handle));
}

std::string to_geojson(const OGRGeometry* geom) {
    if (!geom) {
        return "null";
    }
    char* json = geom->exportToJson();
    std::string result = json ? json : "null";
    CPLFree(json);
    return result;
}

BoundingBox envelope(const OGRGeometry* geom) {
    if (!geom || geom->IsEmpty()) {
        return BoundingBox();
    }
    OGREnvelope env;
    geom->getEnvelope(&env);
    return BoundingBox(env.MinX, env.MinY, env.MaxX, env.MaxY);
}

OGRSpatialReference srs_from_epsg(int epsg) {
    OGRSpatialReference srs;
    if (srs.importFromEPSG(epsg) != OGRERR_NONE) {
        Logger logger("GeometryUtils");
        logger.error("Unknown EPSG code: " + std::to_string(epsg));
    }
    srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
    return srs;
}

OGRGeometryUniquePtr reproject(const OGRGeometry* geom,
                               const OGRSpatialReference& source,
                               const OGRSpatialReference& target) {
    if (!geom) {
        return nullptr;
    }

    // x/y order regardless of how the authority defines the axes
    OGRSpatialReference src(source);
    OGRSpatialReference dst(target);
    src.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
    dst.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

    CoordinateTransformationPtr ct(OGRCreateCoordinateTransformation(&src, &dst));
    if (!ct) {
        Logger logger("GeometryUtils");
        logger.error("Failed to create coordinate transformation");
        return nullptr;
    }

    OGRGeometryUniquePtr result(geom->clone());
    if (result->transform(ct.get()) != OGRERR_NONE) {
        Logger logger("GeometryUtils");
        logger.error("Failed to reproject geometry");
        return nullptr;
    }
    result->assignSpatialReference(nullptr);
    return result;
}

OGRGeometryUniquePtr buffer(const OGRGeometry* geom, double distance) {
    if (!geom || geom->IsEmpty()) {
        return empty_polygon();
    }

    OGRGeometryUniquePtr result(geom->Buffer(distance, BUFFER_QUADRANT_SEGMENTS));
    if (!result) {
        Logger logger("GeometryUtils");
        logger.warning("Geometry buffer failed; using the unbuffered geometry");
        return OGRGeometryUniquePtr(geom->clone());
    }
    return result;
}

} // namespace geometry
} // namespace aoi
