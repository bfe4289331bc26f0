/**
 * @file StubPlanarGeometry.cpp
 * @brief Monotone chain hull and shift-only reprojection for tests
 */

#include "StubPlanarGeometry.hpp"
#include <algorithm>
#include <cmath>

namespace gex {
namespace test {

namespace {

double cross(const Point2D& o, const Point2D& a, const Point2D& b) {
    return (a.x() - o.x()) * (b.y() - o.y()) - (a.y() - o.y()) * (b.x() - o.x());
}

} // namespace

StubPlanarGeometry::StubPlanarGeometry() {
    shifts_["EPSG:4326"] = {0.0, 0.0};
}

void StubPlanarGeometry::add_shifted_reference(const std::string& code, double dx, double dy) {
    shifts_[code] = {dx, dy};
}

Ring StubPlanarGeometry::rectangle(const BoundingBox& box) const {
    return {
        Point2D(box.min_x, box.min_y),
        Point2D(box.max_x, box.min_y),
        Point2D(box.max_x, box.max_y),
        Point2D(box.min_x, box.max_y),
        Point2D(box.min_x, box.min_y)
    };
}

std::optional<BoundingBox> StubPlanarGeometry::envelope(const std::vector<Ring>& parts) const {
    std::optional<BoundingBox> result;
    for (const auto& part : parts) {
        auto box = envelope_of(part);
        if (!box) continue;
        if (result) {
            result->expand(*box);
        } else {
            result = box;
        }
    }
    return result;
}

std::optional<Ring> StubPlanarGeometry::convex_hull(const std::vector<Point2D>& points) const {
    ++hull_calls_;
    if (fail_hulls_) {
        return std::nullopt;
    }

    std::vector<Point2D> sorted = points;
    std::sort(sorted.begin(), sorted.end(), [](const Point2D& a, const Point2D& b) {
        return a.x() < b.x() || (a.x() == b.x() && a.y() < b.y());
    });
    sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());
    if (sorted.size() < 3) {
        return std::nullopt;
    }

    std::vector<Point2D> hull(2 * sorted.size());
    size_t k = 0;
    for (size_t i = 0; i < sorted.size(); ++i) {
        while (k >= 2 && cross(hull[k - 2], hull[k - 1], sorted[i]) <= 0) --k;
        hull[k++] = sorted[i];
    }
    for (size_t i = sorted.size() - 1, t = k + 1; i > 0; --i) {
        while (k >= t && cross(hull[k - 2], hull[k - 1], sorted[i - 1]) <= 0) --k;
        hull[k++] = sorted[i - 1];
    }
    hull.resize(k);  // closed: last == first

    if (hull.size() < 4) {
        return std::nullopt;  // collinear
    }
    return hull;
}

void StubPlanarGeometry::transform(std::vector<Point2D>& points,
                                   const std::string& source_crs,
                                   const std::string& target_crs) const {
    ++transform_calls_;
    auto source = shifts_.find(source_crs);
    auto target = shifts_.find(target_crs);
    if (source == shifts_.end()) {
        throw ReprojectionError("unknown reference " + source_crs);
    }
    if (target == shifts_.end()) {
        throw ReprojectionError("unknown reference " + target_crs);
    }

    for (auto& p : points) {
        p = Point2D(p.x() - source->second.first + target->second.first,
                    p.y() - source->second.second + target->second.second);
    }
}

} // namespace test
} // namespace gex
