/**
 * @file SpatialMerger.cpp
 * @brief Bounding box union and convex hull merge of record extents
 */

#include "SpatialMerger.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace gex {

namespace {

std::string format_box(const BoundingBox& box) {
    std::ostringstream oss;
    oss << std::setprecision(12) << "[" << box.min_x << ", " << box.min_y << ", "
        << box.max_x << ", " << box.max_y << "]";
    return oss.str();
}

void check_vertices(const Ring& vertices) {
    if (vertices.empty()) {
        throw InvalidGeometryError("hull has no vertices");
    }
    for (const auto& p : vertices) {
        if (!std::isfinite(p.x()) || !std::isfinite(p.y())) {
            throw InvalidGeometryError("hull vertex is not a finite coordinate");
        }
    }
}

} // namespace

SpatialMergeOptions SpatialMergeOptions::from_config(const ExtentConfig& config) {
    SpatialMergeOptions options;
    options.degeneracy_tolerance = config.degeneracy_tolerance;
    options.rectangle_epsilon = config.rectangle_epsilon;
    options.assume_wgs84 = config.assume_wgs84;
    options.repair_axis_order = config.repair_axis_order;
    return options;
}

SpatialMerger::SpatialMerger(const PlanarGeometry& geometry, const SpatialMergeOptions& options)
    : geometry_(geometry),
      options_(options),
      normalizer_(geometry),
      detector_(options.degeneracy_tolerance),
      logger_("SpatialMerger") {}

MergedExtent SpatialMerger::merge(const std::vector<ExtentRecord>& records,
                                  MergeMode mode,
                                  const std::string& origin) const {
    if (mode == MergeMode::CONVEX_HULL) {
        return merge_convex_hull(records, origin);
    }
    return merge_bounding_boxes(records, origin);
}

// ============================================================================
// Bounding box union
// ============================================================================

MergedExtent SpatialMerger::merge_bounding_boxes(const std::vector<ExtentRecord>& records,
                                                 const std::string& origin) const {
    std::vector<BoundingBox> boxes;
    boxes.reserve(records.size());

    for (size_t i = 0; i < records.size(); ++i) {
        const ExtentRecord& record = records[i];
        try {
            auto box = normalized_box(record);
            if (!box) {
                logger_.debug(record_label(record, i) + " has no spatial extent");
                continue;
            }
            boxes.push_back(*box);
        } catch (const InvalidGeometryError& e) {
            logger_.warning("Skipping " + record_label(record, i) + ": " + e.what());
        } catch (const ReprojectionError& e) {
            logger_.warning("Skipping " + record_label(record, i) + ": " + e.what());
        }
    }

    return union_of(boxes, records.size(), origin);
}

MergedExtent SpatialMerger::union_of(const std::vector<BoundingBox>& boxes, size_t records,
                                     const std::string& origin) const {
    MergedExtent result;
    if (boxes.empty()) {
        logger_.info("No spatial extent found in " + origin);
        return result;
    }

    std::vector<Ring> parts;
    parts.reserve(boxes.size());
    for (const auto& box : boxes) {
        parts.push_back(geometry_.rectangle(box));
    }

    auto envelope = geometry_.envelope(parts);
    if (!envelope) {
        logger_.warning("Union of " + std::to_string(parts.size()) + " rectangles from " +
                        origin + " has no envelope");
        return result;
    }

    result.bbox = *envelope;
    result.crs = WGS84_CRS;
    result.contributors = boxes.size();
    detector_.apply(result);

    logger_.detailed("Merged " + std::to_string(boxes.size()) + " of " +
                     std::to_string(records) + " records from " + origin +
                     " into " + format_box(*result.bbox));
    return result;
}

// ============================================================================
// Convex hull
// ============================================================================

MergedExtent SpatialMerger::merge_convex_hull(const std::vector<ExtentRecord>& records,
                                              const std::string& origin) const {
    std::vector<Point2D> points;
    std::vector<BoundingBox> boxes;

    for (size_t i = 0; i < records.size(); ++i) {
        const ExtentRecord& record = records[i];
        try {
            auto contribution = hull_contribution(record);
            if (!contribution) {
                logger_.debug(record_label(record, i) + " has no spatial extent");
                continue;
            }
            points.insert(points.end(), contribution->vertices.begin(),
                          contribution->vertices.end());
            boxes.push_back(contribution->box);
        } catch (const InvalidGeometryError& e) {
            logger_.warning("Skipping " + record_label(record, i) + ": " + e.what());
        } catch (const ReprojectionError& e) {
            logger_.warning("Skipping " + record_label(record, i) + ": " + e.what());
        }
    }

    if (boxes.empty()) {
        logger_.info("No spatial extent found in " + origin);
        return MergedExtent();
    }

    auto hull = geometry_.convex_hull(points);
    if (!hull) {
        logger_.warning("Convex hull of " + std::to_string(points.size()) + " points from " +
                        origin + " is not a valid polygon, falling back to bounding box");
        return union_of(boxes, records.size(), origin);
    }

    MergedExtent result;
    result.bbox = envelope_of(*hull);
    result.hull = *hull;
    result.crs = WGS84_CRS;
    result.convex_hull = true;
    result.contributors = boxes.size();
    detector_.apply(result);

    logger_.detailed("Convex hull of " + std::to_string(boxes.size()) + " of " +
                     std::to_string(records.size()) + " records from " + origin +
                     " has " + std::to_string(hull->size()) + " vertices");
    return result;
}

std::optional<SpatialMerger::HullContribution>
SpatialMerger::hull_contribution(const ExtentRecord& record) const {
    if (record.hull) {
        // Prior hulls are taken vertex by vertex
        check_vertices(*record.hull);
        Ring vertices = normalizer_.normalize_points(*record.hull, record_crs(record));
        check_vertices(vertices);
        HullContribution contribution;
        contribution.box = *envelope_of(vertices);
        contribution.vertices = vertices.size() == 1
            ? geometry_.rectangle(widen_degenerate(contribution.box))
            : std::move(vertices);
        return contribution;
    }

    auto box = normalized_box(record);
    if (!box) {
        return std::nullopt;
    }
    HullContribution contribution;
    contribution.box = *box;
    contribution.vertices = geometry_.rectangle(widen_degenerate(*box));
    return contribution;
}

// ============================================================================
// Record helpers
// ============================================================================

std::string SpatialMerger::record_crs(const ExtentRecord& record) const {
    if (record.crs && record.crs->find_first_not_of(" \t") != std::string::npos) {
        return *record.crs;
    }
    if (options_.assume_wgs84) {
        return WGS84_CRS;
    }
    throw InvalidGeometryError("no coordinate reference");
}

std::optional<BoundingBox> SpatialMerger::normalized_box(const ExtentRecord& record) const {
    BoundingBox box;
    if (record.bbox) {
        box = *record.bbox;
        if (!box.is_valid()) {
            throw InvalidGeometryError("bbox " + format_box(box) +
                                       " is not four finite values with min <= max");
        }
    } else if (record.hull) {
        check_vertices(*record.hull);
        box = *envelope_of(*record.hull);
    } else {
        return std::nullopt;
    }

    BoundingBox normalized = normalizer_.normalize(box, record_crs(record), WGS84_CRS);
    if (options_.repair_axis_order) {
        normalized = normalizer_.repair_axis_order(normalized);
    }
    return normalized;
}

BoundingBox SpatialMerger::widen_degenerate(const BoundingBox& box) const {
    BoundingBox widened = box;
    const double eps = options_.rectangle_epsilon;
    if (box.width() == 0.0) {
        widened.min_x -= eps;
        widened.max_x += eps;
    }
    if (box.height() == 0.0) {
        widened.min_y -= eps;
        widened.max_y += eps;
    }
    return widened;
}

std::string SpatialMerger::record_label(const ExtentRecord& record, size_t index) {
    if (!record.name.empty()) {
        return record.name;
    }
    return "record " + std::to_string(index + 1);
}

} // namespace gex
