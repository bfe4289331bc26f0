/**
 * @file CoordinateNormalizer.cpp
 * @brief Two-corner reprojection of extents
 */

#include "CoordinateNormalizer.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <iomanip>

namespace gex {

std::string canonical_crs(const std::string& code) {
    std::string trimmed = code;
    trimmed.erase(0, trimmed.find_first_not_of(" \t\n\r"));
    trimmed.erase(trimmed.find_last_not_of(" \t\n\r") + 1);

    std::string digits = trimmed;
    if (digits.size() > 5) {
        std::string prefix = digits.substr(0, 5);
        std::transform(prefix.begin(), prefix.end(), prefix.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        if (prefix == "EPSG:") {
            digits = digits.substr(5);
        }
    }

    bool numeric = !digits.empty() &&
        std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); });
    if (!numeric) {
        return trimmed;
    }

    digits.erase(0, std::min(digits.find_first_not_of('0'), digits.size() - 1));
    return "EPSG:" + digits;
}

bool same_crs(const std::string& a, const std::string& b) {
    return canonical_crs(a) == canonical_crs(b);
}

CoordinateNormalizer::CoordinateNormalizer(const PlanarGeometry& geometry)
    : geometry_(geometry), logger_("CoordinateNormalizer") {}

BoundingBox CoordinateNormalizer::normalize(const BoundingBox& bbox,
                                            const std::string& source_crs,
                                            const std::string& target_crs) const {
    if (same_crs(source_crs, target_crs)) {
        return bbox;
    }

    std::vector<Point2D> corners = {
        Point2D(bbox.min_x, bbox.min_y),
        Point2D(bbox.max_x, bbox.max_y)
    };
    geometry_.transform(corners, canonical_crs(source_crs), canonical_crs(target_crs));

    BoundingBox result(std::min(corners[0].x(), corners[1].x()),
                       std::min(corners[0].y(), corners[1].y()),
                       std::max(corners[0].x(), corners[1].x()),
                       std::max(corners[0].y(), corners[1].y()));

    if (logger_.shouldOutput(LogLevel::TRACE)) {
        std::ostringstream oss;
        oss << std::setprecision(12) << "Reprojected " << canonical_crs(source_crs) << " ["
            << bbox.min_x << ", " << bbox.min_y << ", " << bbox.max_x << ", " << bbox.max_y
            << "] -> [" << result.min_x << ", " << result.min_y << ", "
            << result.max_x << ", " << result.max_y << "]";
        logger_.trace(oss.str());
    }
    return result;
}

Ring CoordinateNormalizer::normalize_points(const Ring& points,
                                            const std::string& source_crs,
                                            const std::string& target_crs) const {
    if (same_crs(source_crs, target_crs)) {
        return points;
    }
    Ring transformed = points;
    geometry_.transform(transformed, canonical_crs(source_crs), canonical_crs(target_crs));
    return transformed;
}

bool CoordinateNormalizer::is_valid_wgs84(const BoundingBox& bbox) {
    auto lon_ok = [](double v) { return v >= -180.0 && v <= 180.0; };
    auto lat_ok = [](double v) { return v >= -90.0 && v <= 90.0; };
    return lon_ok(bbox.min_x) && lon_ok(bbox.max_x) && lat_ok(bbox.min_y) && lat_ok(bbox.max_y);
}

BoundingBox CoordinateNormalizer::repair_axis_order(const BoundingBox& bbox) const {
    if (is_valid_wgs84(bbox)) {
        return bbox;
    }

    BoundingBox flipped(bbox.min_y, bbox.min_x, bbox.max_y, bbox.max_x);
    if (is_valid_wgs84(flipped)) {
        logger_.warning("Longitude and latitude values flipped");
        return flipped;
    }

    throw InvalidGeometryError("coordinates fall outside WGS84 ranges in both axis orders");
}

} // namespace gex
