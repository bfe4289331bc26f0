/**
 * @file OgrPlanarGeometry.hpp
 * @brief GDAL/OGR implementation of the planar geometry backend
 */

#pragma once

#include "PlanarGeometry.hpp"
#include "Logger.hpp"
#include <string>

class OGRSpatialReference;

namespace gex {

/**
 * @brief PlanarGeometry backed by OGR geometries and OSR transformations
 *
 * Convex hulls require a GEOS-enabled GDAL build; without GEOS every hull
 * request reports failure and callers fall back to bounding boxes.
 * Spatial references use traditional GIS axis order (x = longitude).
 */
class OgrPlanarGeometry : public PlanarGeometry {
public:
    OgrPlanarGeometry();

    Ring rectangle(const BoundingBox& box) const override;
    std::optional<BoundingBox> envelope(const std::vector<Ring>& parts) const override;
    std::optional<Ring> convex_hull(const std::vector<Point2D>& points) const override;
    void transform(std::vector<Point2D>& points,
                   const std::string& source_crs,
                   const std::string& target_crs) const override;

private:
    Logger logger_;

    /**
     * @brief Import "4326", "EPSG:4326" or any SetFromUserInput definition
     * @throws ReprojectionError on failure
     */
    static void import_reference(OGRSpatialReference& srs, const std::string& code);
};

} // namespace gex
