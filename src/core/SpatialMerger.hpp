/**
 * @file SpatialMerger.hpp
 * @brief Combines per-record spatial extents into one bounding box or convex hull
 */

#pragma once

#include "extent_engine.hpp"
#include "CoordinateNormalizer.hpp"
#include "PlanarGeometry.hpp"
#include "PointDegeneracyDetector.hpp"
#include "Logger.hpp"
#include <string>
#include <vector>

namespace gex {

/**
 * @brief Tunables of a spatial merge
 */
struct SpatialMergeOptions {
    double degeneracy_tolerance = PointDegeneracyDetector::DEFAULT_TOLERANCE;
    double rectangle_epsilon = 1e-10;
    bool assume_wgs84 = false;
    bool repair_axis_order = false;

    static SpatialMergeOptions from_config(const ExtentConfig& config);
};

/**
 * @brief Merges record extents into a single extent in EPSG:4326
 *
 * A malformed record (unparsable box, unusable reference) is skipped with a
 * warning and never aborts the batch. In convex hull mode, a point set that
 * does not yield a polygon makes the whole call fall back to the bounding
 * box union. merge() never throws for bad record data.
 */
class SpatialMerger {
public:
    SpatialMerger(const PlanarGeometry& geometry, const SpatialMergeOptions& options = {});

    /**
     * @brief Merge records with the given strategy
     * @param records Record batch (read only)
     * @param mode BOUNDING_BOX or CONVEX_HULL
     * @param origin Label of the batch for log messages (directory, repository)
     * @return Merged extent; bbox is null when no record contributed
     */
    MergedExtent merge(const std::vector<ExtentRecord>& records,
                       MergeMode mode,
                       const std::string& origin = "batch") const;

    /**
     * @brief Envelope of the union of all record rectangles
     */
    MergedExtent merge_bounding_boxes(const std::vector<ExtentRecord>& records,
                                      const std::string& origin = "batch") const;

    /**
     * @brief Convex hull of the vertices of every record geometry
     *
     * Prior hulls are used as is; other records contribute their rectangle.
     */
    MergedExtent merge_convex_hull(const std::vector<ExtentRecord>& records,
                                   const std::string& origin = "batch") const;

private:
    const PlanarGeometry& geometry_;
    SpatialMergeOptions options_;
    CoordinateNormalizer normalizer_;
    PointDegeneracyDetector detector_;
    Logger logger_;

    /**
     * @brief Reference of a record, or EPSG:4326 when allowed to assume it
     * @throws InvalidGeometryError when the record carries none
     */
    std::string record_crs(const ExtentRecord& record) const;

    /**
     * @brief Record box in output units; prior hull envelope when no bbox
     * @return nullopt when the record carries no spatial information
     * @throws InvalidGeometryError, ReprojectionError
     */
    std::optional<BoundingBox> normalized_box(const ExtentRecord& record) const;

    /**
     * @brief What a record adds in hull mode
     *
     * vertices feed the hull point set; box is the unwidened extent kept for
     * the bounding box fallback.
     */
    struct HullContribution {
        Ring vertices;
        BoundingBox box;
    };

    /**
     * @return nullopt when the record carries no spatial information
     * @throws InvalidGeometryError, ReprojectionError
     */
    std::optional<HullContribution> hull_contribution(const ExtentRecord& record) const;

    /**
     * @brief Envelope of the rectangles of all contributing boxes
     */
    MergedExtent union_of(const std::vector<BoundingBox>& boxes, size_t records,
                          const std::string& origin) const;

    /**
     * @brief Widen zero-width/zero-height boxes by rectangle_epsilon
     */
    BoundingBox widen_degenerate(const BoundingBox& box) const;

    static std::string record_label(const ExtentRecord& record, size_t index);
};

} // namespace gex
