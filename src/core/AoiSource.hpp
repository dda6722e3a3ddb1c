/**
 * @file AoiSource.hpp
 * @brief Reads AOI polygons and the buffered clipping mask for a line
 */

#pragma once

#include "aoi_composite.hpp"
#include <ogr_geometry.h>
#include <ogr_spatialref.h>
#include <optional>
#include <string>
#include <vector>

class OGRFeature;
class OGRFeatureDefn;

namespace aoi {

/**
 * @brief AOI polygon and its line identifier, read from the AOI file
 */
struct AreaOfInterest {
    OGRGeometryUniquePtr geometry;   // EPSG:4326
    std::string line_id;
    int index = 0;

    /**
     * @brief Geometry as a GeoJSON object for catalog queries
     */
    std::string geojson() const;
};

/**
 * @brief Buffered geometries used to clip composites of one line
 */
struct AoiMask {
    std::vector<OGRGeometryUniquePtr> geometries;
    OGRSpatialReference srs;
};

/**
 * @brief Accessor for an attribute that may be a layer column or a key of
 * a nested JSON properties object
 *
 * The strategy is resolved once from the layer definition; a column with
 * the attribute's name wins over the nested object.
 */
class AttributeLookup {
public:
    enum class Strategy {
        FLATTENED,   // attribute is a column of the layer
        NESTED,      // attribute is a key of a JSON object column
        NONE         // neither is present
    };

    static AttributeLookup resolve(OGRFeatureDefn* definition,
                                   const std::string& attribute,
                                   const std::string& nested_key);

    Strategy strategy() const { return strategy_; }

    /**
     * @brief Attribute value of a feature, nullopt when absent or null
     */
    std::optional<std::string> value(OGRFeature* feature) const;

private:
    Strategy strategy_ = Strategy::NONE;
    std::string attribute_;
    int field_index_ = -1;
};

/**
 * @brief Loader for the AOI feature collection and the buffer layer
 */
class AoiSource {
public:
    struct Options {
        std::string aoi_file;
        std::string buffer_file;
        std::string line_id_attribute;
        std::string buffer_id_attribute;
        std::string nested_properties_key;
        std::string missing_line_id;
        double buffer_distance_m;
        int projected_epsg;

        Options()
            : line_id_attribute("ID_Linea"),
              buffer_id_attribute("UBITEC"),
              nested_properties_key("original_properties"),
              missing_line_id("Sin ID"),
              buffer_distance_m(100.0),
              projected_epsg(3857) {}
    };

    AoiSource();
    explicit AoiSource(const Options& options);

    /**
     * @brief Read the feature at index from the AOI file
     * @return AOI, or nullopt with last_error() set
     */
    std::optional<AreaOfInterest> load_area(int index);

    /**
     * @brief Buffer the buffer-layer geometries whose identifier equals line_id
     *
     * Geographic layers are buffered in the projected CRS and returned to
     * EPSG:4326; projected layers are buffered in their own units.
     * @return Mask with exactly one non-empty geometry, or nullopt with
     *         last_error() set when none or several features match
     */
    std::optional<AoiMask> load_mask(const std::string& line_id);

    const std::string& last_error() const { return last_error_; }

private:
    Options options_;
    std::string last_error_;

    std::optional<AreaOfInterest> fail_area(const std::string& message);
    std::optional<AoiMask> fail_mask(const std::string& message);
};

} // namespace aoi
