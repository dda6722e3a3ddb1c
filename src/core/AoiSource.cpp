/**
 * @file AoiSource.cpp
 * @brief Implementation of AOI and buffer layer loading
 */

#include "AoiSource.hpp"
#include "GdalHandles.hpp"
#include "GeometryUtils.hpp"
#include "Logger.hpp"
#include <ogrsf_frmts.h>
#include <nlohmann/json.hpp>
#include <filesystem>

using json = nlohmann::json;

namespace aoi {

namespace {

struct FeatureDeleter {
    void operator()(OGRFeature* feature) {
        OGRFeature::DestroyFeature(feature);
    }
};

using FeaturePtr = std::unique_ptr<OGRFeature, FeatureDeleter>;

GDALDatasetPtr open_vector(const std::string& path) {
    return GDALDatasetPtr(GDALDataset::FromHandle(
        GDALOpenEx(path.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY, nullptr, nullptr, nullptr)));
}

std::string json_scalar_to_string(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<long long>());
    }
    return value.dump();
}

std::string field_names(OGRFeatureDefn* definition) {
    std::string names;
    for (int i = 0; i < definition->GetFieldCount(); ++i) {
        if (!names.empty()) names += ", ";
        names += definition->GetFieldDefn(i)->GetNameRef();
    }
    return "[" + names + "]";
}

} // namespace

// ============================================================================
// AttributeLookup
// ============================================================================

AttributeLookup AttributeLookup::resolve(OGRFeatureDefn* definition,
                                         const std::string& attribute,
                                         const std::string& nested_key) {
    AttributeLookup lookup;
    lookup.attribute_ = attribute;

    int column = definition->GetFieldIndex(attribute.c_str());
    if (column >= 0) {
        lookup.strategy_ = Strategy::FLATTENED;
        lookup.field_index_ = column;
        return lookup;
    }

    int nested = definition->GetFieldIndex(nested_key.c_str());
    if (nested >= 0) {
        lookup.strategy_ = Strategy::NESTED;
        lookup.field_index_ = nested;
    }
    return lookup;
}

std::optional<std::string> AttributeLookup::value(OGRFeature* feature) const {
    if (strategy_ == Strategy::NONE || !feature->IsFieldSetAndNotNull(field_index_)) {
        return std::nullopt;
    }

    if (strategy_ == Strategy::FLATTENED) {
        return std::string(feature->GetFieldAsString(field_index_));
    }

    try {
        auto properties = json::parse(feature->GetFieldAsString(field_index_));
        if (!properties.is_object() || !properties.contains(attribute_) ||
            properties[attribute_].is_null()) {
            return std::nullopt;
        }
        return json_scalar_to_string(properties[attribute_]);
    } catch (const json::exception& e) {
        Logger logger("AoiSource");
        logger.debug("Nested properties are not JSON: " + std::string(e.what()));
        return std::nullopt;
    }
}

// ============================================================================
// AreaOfInterest
// ============================================================================

std::string AreaOfInterest::geojson() const {
    return geometry::to_geojson(geometry.get());
}

// ============================================================================
// AoiSource
// ============================================================================

AoiSource::AoiSource() : options_() {
    GDALAllRegister();
}

AoiSource::AoiSource(const Options& options) : options_(options) {
    GDALAllRegister();
}

std::optional<AreaOfInterest> AoiSource::fail_area(const std::string& message) {
    last_error_ = message;
    return std::nullopt;
}

std::optional<AoiMask> AoiSource::fail_mask(const std::string& message) {
    last_error_ = message;
    return std::nullopt;
}

std::optional<AreaOfInterest> AoiSource::load_area(int index) {
    Logger logger("AoiSource");
    last_error_.clear();

    if (!std::filesystem::exists(options_.aoi_file)) {
        return fail_area("JSON file not found: " + options_.aoi_file);
    }

    GDALDatasetPtr dataset = open_vector(options_.aoi_file);
    if (!dataset || dataset->GetLayerCount() == 0) {
        return fail_area(last_gdal_error("Cannot read AOI file " + options_.aoi_file));
    }

    OGRLayer* layer = dataset->GetLayer(0);
    if (index < 0 || index >= layer->GetFeatureCount()) {
        return fail_area("Feature index " + std::to_string(index) + " out of range for " +
                         options_.aoi_file + " (" + std::to_string(layer->GetFeatureCount()) +
                         " features)");
    }

    AttributeLookup lookup = AttributeLookup::resolve(
        layer->GetLayerDefn(), options_.line_id_attribute, options_.nested_properties_key);

    layer->ResetReading();
    FeaturePtr feature;
    for (int i = 0; i <= index; ++i) {
        feature.reset(layer->GetNextFeature());
        if (!feature) {
            return fail_area("Feature index " + std::to_string(index) + " could not be read");
        }
    }

    OGRGeometry* geom = feature->GetGeometryRef();
    if (!geom || geom->IsEmpty()) {
        return fail_area("AOI feature " + std::to_string(index) + " has no geometry");
    }

    AreaOfInterest area;
    area.geometry.reset(geom->clone());
    area.geometry->assignSpatialReference(nullptr);
    area.line_id = lookup.value(feature.get()).value_or(options_.missing_line_id);
    area.index = index;

    logger.debug("Loaded AOI feature " + std::to_string(index) + " with line id " + area.line_id);
    return area;
}

std::optional<AoiMask> AoiSource::load_mask(const std::string& line_id) {
    Logger logger("AoiSource");
    last_error_.clear();

    if (!std::filesystem::exists(options_.buffer_file)) {
        return fail_mask("Recorte JSON file not found: " + options_.buffer_file);
    }

    GDALDatasetPtr dataset = open_vector(options_.buffer_file);
    if (!dataset || dataset->GetLayerCount() == 0) {
        return fail_mask(last_gdal_error("Cannot read buffer file " + options_.buffer_file));
    }

    OGRLayer* layer = dataset->GetLayer(0);
    AttributeLookup lookup = AttributeLookup::resolve(
        layer->GetLayerDefn(), options_.buffer_id_attribute, options_.nested_properties_key);

    if (lookup.strategy() == AttributeLookup::Strategy::NONE) {
        return fail_mask("'" + options_.buffer_id_attribute + "' column and '" +
                         options_.nested_properties_key + "' not found. Columns: " +
                         field_names(layer->GetLayerDefn()));
    }

    // GeoJSON without a crs member is WGS84
    OGRSpatialReference layer_srs = geometry::srs_from_epsg(4326);
    if (const OGRSpatialReference* srs = layer->GetSpatialRef()) {
        layer_srs = *srs;
        layer_srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
    }
    const bool geographic = layer_srs.IsGeographic();
    OGRSpatialReference wgs84 = geometry::srs_from_epsg(4326);
    OGRSpatialReference projected = geometry::srs_from_epsg(options_.projected_epsg);

    AoiMask mask;
    mask.srs = geographic ? wgs84 : layer_srs;
    GIntBig matched_fid = OGRNullFID;

    layer->ResetReading();
    for (FeaturePtr feature(layer->GetNextFeature()); feature; feature.reset(layer->GetNextFeature())) {
        auto id = lookup.value(feature.get());
        if (!id || *id != line_id) {
            continue;
        }

        OGRGeometry* geom = feature->GetGeometryRef();
        if (!geom || geom->IsEmpty()) {
            continue;
        }

        OGRGeometryUniquePtr buffered;
        if (geographic) {
            auto metric = geometry::reproject(geom, layer_srs, projected);
            if (!metric) {
                return fail_mask("Failed to reproject buffer geometry to EPSG:" +
                                 std::to_string(options_.projected_epsg));
            }
            auto grown = geometry::buffer(metric.get(), options_.buffer_distance_m);
            buffered = geometry::reproject(grown.get(), projected, wgs84);
            if (!buffered) {
                return fail_mask("Failed to reproject buffered geometry to EPSG:4326");
            }
        } else {
            buffered = geometry::buffer(geom, options_.buffer_distance_m);
            buffered->assignSpatialReference(nullptr);
        }

        if (buffered->IsEmpty()) {
            continue;
        }
        if (!mask.geometries.empty()) {
            return fail_mask("Multiple geometries found for ID_Linea: " + line_id +
                             " (ambiguous buffer selection)");
        }
        mask.geometries.push_back(std::move(buffered));
        matched_fid = feature->GetFID();
    }

    if (mask.geometries.empty()) {
        return fail_mask("No valid geometries found for ID_Linea: " + line_id);
    }

    logger.debug("Buffer mask for " + line_id + " built from feature " +
                 std::to_string(static_cast<long long>(matched_fid)));
    return mask;
}

} // namespace aoi
