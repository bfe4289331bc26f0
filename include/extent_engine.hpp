#pragma once

/**
 * @file extent_engine.hpp
 * @brief Main header for the extent aggregation and budgeted selection engine
 *
 * Value types shared by the spatial/temporal mergers and the download
 * budget selector. Collaborators (format extractors, repository clients)
 * produce these; the engine consumes them within a single call.
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace gex {

// ============================================================================
// Geometry Types
// ============================================================================

/**
 * @brief 2D point with x, y coordinates (x = longitude/easting)
 */
struct Point2D {
    double x_, y_;

    Point2D() : x_(0), y_(0) {}
    Point2D(double x, double y) : x_(x), y_(y) {}

    double x() const { return x_; }
    double y() const { return y_; }

    bool operator==(const Point2D& other) const {
        return x_ == other.x_ && y_ == other.y_;
    }
};

/**
 * @brief Ordered vertex list; closed (first == last) when produced by the engine
 */
using Ring = std::vector<Point2D>;

/**
 * @brief Axis-aligned bounding rectangle [minX, minY, maxX, maxY]
 */
struct BoundingBox {
    double min_x, min_y, max_x, max_y;

    BoundingBox() : min_x(0.0), min_y(0.0), max_x(0.0), max_y(0.0) {}
    BoundingBox(double minx, double miny, double maxx, double maxy)
        : min_x(minx), min_y(miny), max_x(maxx), max_y(maxy) {}

    double width() const { return max_x - min_x; }
    double height() const { return max_y - min_y; }

    /// All four values finite and min <= max on both axes
    bool is_valid() const;

    /// Expand to cover another box
    void expand(const BoundingBox& other);

    bool operator==(const BoundingBox& other) const {
        return min_x == other.min_x && min_y == other.min_y &&
               max_x == other.max_x && max_y == other.max_y;
    }
};

/**
 * @brief Envelope of a vertex list; nullopt for an empty list
 */
std::optional<BoundingBox> envelope_of(const Ring& points);

// ============================================================================
// Coordinate Reference Constants
// ============================================================================

/// Common output reference of every merged extent
inline constexpr const char* WGS84_CRS = "4326";

// ============================================================================
// Extent Types
// ============================================================================

/**
 * @brief Calendar-date range, both ends formatted YYYY-MM-DD
 */
struct TemporalExtent {
    std::string start;
    std::string end;

    bool operator==(const TemporalExtent& other) const {
        return start == other.start && end == other.end;
    }
};

/**
 * @brief Known extent of one file or one sub-aggregate
 *
 * Any member may be missing. Coordinates are expressed in @c crs.
 */
struct ExtentRecord {
    std::string name;                       ///< Label used in log messages
    std::optional<BoundingBox> bbox;
    std::optional<std::string> crs;
    std::optional<TemporalExtent> tbox;
    std::optional<Ring> hull;               ///< Prior convex hull vertices
};

/**
 * @brief Result of a spatial merge
 *
 * When @c is_point is set, bbox/hull still hold the degenerate geometry but
 * consumers should present @c point.
 */
struct MergedExtent {
    std::optional<BoundingBox> bbox;
    std::optional<std::string> crs;         ///< Always WGS84_CRS when non-null
    std::optional<Ring> hull;
    bool convex_hull = false;               ///< Hull mode produced the result
    bool is_point = false;
    std::optional<Point2D> point;
    size_t contributors = 0;                ///< Records that produced a geometry

    bool empty() const { return !bbox.has_value(); }
};

/**
 * @brief Spatial plus temporal aggregate of a record batch
 */
struct AggregateExtent {
    MergedExtent spatial;
    std::optional<TemporalExtent> temporal;
    size_t records_total = 0;
    size_t records_with_spatial = 0;
    size_t records_with_temporal = 0;
};

// ============================================================================
// Download Selection Types
// ============================================================================

/**
 * @brief One file discoverable at a remote source; size 0 means unknown
 */
struct CandidateFile {
    std::string name;
    std::string url;
    std::uint64_t size = 0;

    CandidateFile() = default;
    CandidateFile(std::string file_name, std::string file_url, std::uint64_t file_size)
        : name(std::move(file_name)), url(std::move(file_url)), size(file_size) {}

    bool operator==(const CandidateFile& other) const {
        return name == other.name && url == other.url && size == other.size;
    }
};

/**
 * @brief Outcome of a budgeted selection
 *
 * total_bytes counts only selected files with a known size.
 */
struct SelectionResult {
    std::vector<CandidateFile> selected;
    std::uint64_t total_bytes = 0;
    std::vector<CandidateFile> skipped;
};

/**
 * @brief Ordering applied before the greedy budget walk
 */
enum class SelectionPolicy {
    ORDERED,   ///< Input order
    RANDOM,    ///< Deterministic shuffle keyed by seed
    SMALLEST,  ///< Ascending unit size
    LARGEST    ///< Descending unit size
};

/**
 * @brief Spatial merge strategy
 */
enum class MergeMode {
    BOUNDING_BOX,
    CONVEX_HULL
};

// ============================================================================
// Errors
// ============================================================================

/**
 * @brief A coordinate reference could not be used for reprojection
 */
class ReprojectionError : public std::runtime_error {
public:
    explicit ReprojectionError(const std::string& message)
        : std::runtime_error("Reprojection error: " + message) {}
};

/**
 * @brief A record carries a bbox or hull that cannot be interpreted
 */
class InvalidGeometryError : public std::runtime_error {
public:
    explicit InvalidGeometryError(const std::string& message)
        : std::runtime_error("Invalid geometry: " + message) {}
};

/**
 * @brief Hard download limit breached
 *
 * estimated_bytes is the sum over every sized candidate, not only the
 * skipped ones.
 */
class DownloadSizeExceeded : public std::runtime_error {
public:
    DownloadSizeExceeded(std::uint64_t estimated_bytes, std::uint64_t limit_bytes,
                         const std::string& source_name);

    std::uint64_t estimated_bytes() const { return estimated_bytes_; }
    std::uint64_t limit_bytes() const { return limit_bytes_; }
    const std::string& source_name() const { return source_name_; }

private:
    std::uint64_t estimated_bytes_;
    std::uint64_t limit_bytes_;
    std::string source_name_;
};

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Configuration for extent aggregation and download selection
 */
struct ExtentConfig {
    // Spatial aggregation
    bool spatial = true;
    bool temporal = true;
    bool convex_hull = false;
    bool assume_wgs84 = false;          // Records without crs are taken as EPSG:4326
    bool repair_axis_order = false;     // Flip lat/lon boxes that fall outside WGS84 range
    double degeneracy_tolerance = 1e-6; // Output CRS units
    double rectangle_epsilon = 1e-10;   // Output CRS units

    // Download selection
    std::optional<std::uint64_t> max_download_bytes;
    SelectionPolicy selection_policy = SelectionPolicy::ORDERED;
    std::uint32_t seed = 42;
    bool hard_limit = false;
    std::vector<std::string> composite_extensions = default_composite_extensions();
    std::string source_name = "remote";

    // Logging options
    std::string log_level = "3";        // "N" or "N,Facility=M"
    std::optional<std::string> log_file;

    /// ESRI Shapefile component extensions
    static std::vector<std::string> default_composite_extensions() {
        return {".shp", ".shx", ".dbf", ".prj", ".sbn", ".sbx", ".cpg", ".shp.xml"};
    }
};

// ============================================================================
// Aggregation Facade
// ============================================================================

class PlanarGeometry;

/**
 * @brief Main interface: merges record extents and selects downloads
 *
 * Wires SpatialMerger, TemporalMerger and BudgetedSelector to one
 * ExtentConfig. Holds no state between calls besides the configuration.
 */
class ExtentAggregator {
public:
    /// Uses the GDAL/OGR geometry backend
    explicit ExtentAggregator(const ExtentConfig& config);

    /// Uses a caller-owned geometry backend that must outlive the aggregator
    ExtentAggregator(const ExtentConfig& config, const PlanarGeometry& geometry);

    ~ExtentAggregator();

    /**
     * @brief Spatial and temporal aggregate of a record batch
     * @param origin Label of the batch (directory, repository) for log messages
     */
    AggregateExtent aggregate(const std::vector<ExtentRecord>& records,
                              const std::string& origin = "batch") const;

    /**
     * @brief Budgeted selection of candidate files
     * @throws DownloadSizeExceeded in hard limit mode
     */
    SelectionResult select_downloads(const std::vector<CandidateFile>& files) const;

    // Configuration
    void update_config(const ExtentConfig& config);
    const ExtentConfig& get_config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Parse a policy name; unknown names fall back to ORDERED with a warning
 */
SelectionPolicy parse_selection_policy(const std::string& name);

/**
 * @brief Lowercase policy name
 */
std::string selection_policy_name(SelectionPolicy policy);

} // namespace gex
