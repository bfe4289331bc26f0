/**
 * @file CoordinateNormalizer.hpp
 * @brief Reprojection of record extents into the common output reference
 */

#pragma once

#include "extent_engine.hpp"
#include "PlanarGeometry.hpp"
#include "Logger.hpp"
#include <string>
#include <vector>

namespace gex {

/**
 * @brief Canonical form of a reference code ("epsg:4326" -> "EPSG:4326", "4326" -> "EPSG:4326")
 *
 * Codes that are not plain EPSG identifiers are returned trimmed but
 * otherwise unchanged.
 */
std::string canonical_crs(const std::string& code);

/**
 * @brief True when both codes name the same EPSG reference
 */
bool same_crs(const std::string& a, const std::string& b);

/**
 * @brief Reprojects boxes and vertex lists through a PlanarGeometry backend
 *
 * Boxes are reprojected by transforming only the two diagonal corners and
 * re-deriving min/max. Under rotated or strongly curved projections the
 * true envelope can be larger than the result.
 */
class CoordinateNormalizer {
public:
    explicit CoordinateNormalizer(const PlanarGeometry& geometry);

    /**
     * @brief Reproject a box
     * @param bbox Box in @p source_crs
     * @param source_crs Reference of the input
     * @param target_crs Reference of the output
     * @return bbox unchanged when the references are equal
     * @throws ReprojectionError on unusable references or failed corners
     */
    BoundingBox normalize(const BoundingBox& bbox,
                          const std::string& source_crs,
                          const std::string& target_crs = WGS84_CRS) const;

    /**
     * @brief Reproject every vertex of a list
     * @throws ReprojectionError as normalize()
     */
    Ring normalize_points(const Ring& points,
                          const std::string& source_crs,
                          const std::string& target_crs = WGS84_CRS) const;

    /**
     * @brief Validate a WGS84 box, flipping latitude/longitude when needed
     *
     * A box inside [-180,180] x [-90,90] is returned as is. Otherwise the
     * axis-swapped box is tried; if it is valid a warning is logged and it is
     * returned.
     *
     * @throws InvalidGeometryError when neither orientation is valid
     */
    BoundingBox repair_axis_order(const BoundingBox& bbox) const;

    /**
     * @brief True if the box fits WGS84 longitude/latitude ranges
     */
    static bool is_valid_wgs84(const BoundingBox& bbox);

private:
    const PlanarGeometry& geometry_;
    Logger logger_;
};

} // namespace gex
