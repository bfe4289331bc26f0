/**
 * @file PlanarGeometry.hpp
 * @brief Geometry backend used by the mergers
 *
 * The mergers only need rectangle construction, the envelope of a union,
 * a convex hull of a point set and reprojection of vertices. Keeping these
 * behind an interface lets tests substitute a backend with controlled
 * failures.
 */

#pragma once

#include "extent_engine.hpp"
#include <optional>
#include <string>
#include <vector>

namespace gex {

/**
 * @brief Planar geometry operations in the coordinate space of the caller
 */
class PlanarGeometry {
public:
    virtual ~PlanarGeometry() = default;

    /**
     * @brief Closed ring of the four corners of a box
     */
    virtual Ring rectangle(const BoundingBox& box) const = 0;

    /**
     * @brief Envelope of the union of all parts
     * @return nullopt when no part carries a vertex
     */
    virtual std::optional<BoundingBox> envelope(const std::vector<Ring>& parts) const = 0;

    /**
     * @brief Convex hull of a point set
     * @return Closed exterior ring, or nullopt when the hull is not a polygon
     *         with positive area (collinear input, fewer than 3 distinct
     *         points, backend failure)
     */
    virtual std::optional<Ring> convex_hull(const std::vector<Point2D>& points) const = 0;

    /**
     * @brief Reproject vertices in place
     * @throws ReprojectionError if either reference is unusable or any vertex
     *         fails to transform
     */
    virtual void transform(std::vector<Point2D>& points,
                           const std::string& source_crs,
                           const std::string& target_crs) const = 0;
};

} // namespace gex
