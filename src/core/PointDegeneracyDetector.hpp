/**
 * @file PointDegeneracyDetector.hpp
 * @brief Classifies merged geometries that collapse to a single coordinate
 *
 * Datasets made of one sampling station or one specimen record produce a
 * zero-area extent. Callers present those as point geometries.
 */

#pragma once

#include "extent_engine.hpp"
#include <optional>

namespace gex {

/**
 * @brief Outcome of point detection
 */
struct PointDetection {
    bool is_point = false;
    std::optional<Point2D> point;
};

class PointDegeneracyDetector {
public:
    static constexpr double DEFAULT_TOLERANCE = 1e-6;

    explicit PointDegeneracyDetector(double tolerance = DEFAULT_TOLERANCE)
        : tolerance_(tolerance) {}

    /**
     * @brief A box is a point when both its width and height are within tolerance
     * @return point = (min_x, min_y) when degenerate
     */
    PointDetection detect(const BoundingBox& bbox) const;

    /**
     * @brief A vertex list is a point when every vertex lies within tolerance
     *        of the first one on both axes
     *
     * Lists with fewer than two vertices are never points.
     */
    PointDetection detect(const Ring& vertices) const;

    /**
     * @brief Set is_point / point on a merged extent
     *
     * The hull is checked when present, the bbox otherwise.
     */
    void apply(MergedExtent& extent) const;

    double tolerance() const { return tolerance_; }

private:
    double tolerance_;
};

} // namespace gex
