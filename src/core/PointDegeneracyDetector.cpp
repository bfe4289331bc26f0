/**
 * @file PointDegeneracyDetector.cpp
 * @brief Point detection for boxes and hull vertex lists
 */

#include "PointDegeneracyDetector.hpp"
#include <cmath>

namespace gex {

PointDetection PointDegeneracyDetector::detect(const BoundingBox& bbox) const {
    PointDetection result;
    if (std::abs(bbox.min_x - bbox.max_x) <= tolerance_ &&
        std::abs(bbox.min_y - bbox.max_y) <= tolerance_) {
        result.is_point = true;
        result.point = Point2D(bbox.min_x, bbox.min_y);
    }
    return result;
}

PointDetection PointDegeneracyDetector::detect(const Ring& vertices) const {
    PointDetection result;
    if (vertices.size() < 2) {
        return result;
    }

    const Point2D& first = vertices.front();
    for (size_t i = 1; i < vertices.size(); ++i) {
        if (std::abs(vertices[i].x() - first.x()) > tolerance_ ||
            std::abs(vertices[i].y() - first.y()) > tolerance_) {
            return result;
        }
    }

    result.is_point = true;
    result.point = first;
    return result;
}

void PointDegeneracyDetector::apply(MergedExtent& extent) const {
    PointDetection detection;
    if (extent.hull.has_value()) {
        detection = detect(*extent.hull);
    } else if (extent.bbox.has_value()) {
        detection = detect(*extent.bbox);
    }
    extent.is_point = detection.is_point;
    extent.point = detection.point;
}

} // namespace gex
