/**
 * @file OgrPlanarGeometry.cpp
 * @brief GDAL/OGR geometry backend
 */

#include "OgrPlanarGeometry.hpp"
#include <cpl_error.h>
#include <ogr_geometry.h>
#include <ogr_spatialref.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <memory>

namespace gex {

namespace {

struct GeometryDeleter {
    void operator()(OGRGeometry* geometry) const {
        OGRGeometryFactory::destroyGeometry(geometry);
    }
};

struct TransformationDeleter {
    void operator()(OGRCoordinateTransformation* transformation) const {
        OGRCoordinateTransformation::DestroyCT(transformation);
    }
};

using GeometryPtr = std::unique_ptr<OGRGeometry, GeometryDeleter>;
using TransformationPtr = std::unique_ptr<OGRCoordinateTransformation, TransformationDeleter>;

/**
 * @brief Silences CPLError output for the lifetime of the object
 */
class QuietErrors {
public:
    QuietErrors() { CPLPushErrorHandler(CPLQuietErrorHandler); }
    ~QuietErrors() { CPLPopErrorHandler(); }
    QuietErrors(const QuietErrors&) = delete;
    QuietErrors& operator=(const QuietErrors&) = delete;
};

Ring ring_from_ogr(const OGRLinearRing& ring) {
    Ring out;
    out.reserve(static_cast<size_t>(ring.getNumPoints()));
    for (int i = 0; i < ring.getNumPoints(); ++i) {
        out.emplace_back(ring.getX(i), ring.getY(i));
    }
    return out;
}

bool all_digits(const std::string& text) {
    return !text.empty() &&
           std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); });
}

} // namespace

OgrPlanarGeometry::OgrPlanarGeometry() : logger_("OgrPlanarGeometry") {}

Ring OgrPlanarGeometry::rectangle(const BoundingBox& box) const {
    OGRLinearRing ring;
    ring.addPoint(box.min_x, box.min_y);
    ring.addPoint(box.max_x, box.min_y);
    ring.addPoint(box.max_x, box.max_y);
    ring.addPoint(box.min_x, box.max_y);
    ring.closeRings();
    return ring_from_ogr(ring);
}

std::optional<BoundingBox> OgrPlanarGeometry::envelope(const std::vector<Ring>& parts) const {
    OGRGeometryCollection collection;

    for (const auto& part : parts) {
        if (part.empty()) {
            continue;
        }
        auto ring = std::make_unique<OGRLinearRing>();
        for (const auto& p : part) {
            ring->addPoint(p.x(), p.y());
        }
        ring->closeRings();

        auto polygon = std::make_unique<OGRPolygon>();
        polygon->addRingDirectly(ring.release());
        collection.addGeometryDirectly(polygon.release());
    }

    if (collection.IsEmpty()) {
        return std::nullopt;
    }

    OGREnvelope env;
    collection.getEnvelope(&env);
    logger_.trace("Envelope of " + std::to_string(collection.getNumGeometries()) + " parts");
    return BoundingBox(env.MinX, env.MinY, env.MaxX, env.MaxY);
}

std::optional<Ring> OgrPlanarGeometry::convex_hull(const std::vector<Point2D>& points) const {
    if (points.size() < 3) {
        return std::nullopt;
    }

    OGRMultiPoint multipoint;
    for (const auto& p : points) {
        OGRPoint point(p.x(), p.y());
        multipoint.addGeometry(&point);
    }

    GeometryPtr hull;
    {
        QuietErrors quiet;
        hull.reset(multipoint.ConvexHull());
    }
    if (!hull) {
        logger_.debug("OGR convex hull returned no geometry (GEOS unavailable or failed)");
        return std::nullopt;
    }

    if (wkbFlatten(hull->getGeometryType()) != wkbPolygon) {
        logger_.debug(std::string("Convex hull collapsed to ") + hull->getGeometryName());
        return std::nullopt;
    }

    const auto* polygon = hull->toPolygon();
    const OGRLinearRing* exterior = polygon->getExteriorRing();
    if (!exterior || exterior->getNumPoints() < 4 || !(polygon->get_Area() > 0.0)) {
        return std::nullopt;
    }

    return ring_from_ogr(*exterior);
}

void OgrPlanarGeometry::import_reference(OGRSpatialReference& srs, const std::string& code) {
    OGRErr err;
    if (all_digits(code)) {
        err = srs.importFromEPSG(std::stoi(code));
    } else {
        err = srs.SetFromUserInput(code.c_str());
    }
    if (err != OGRERR_NONE) {
        throw ReprojectionError("unsupported coordinate reference '" + code + "'");
    }
    srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
}

void OgrPlanarGeometry::transform(std::vector<Point2D>& points,
                                  const std::string& source_crs,
                                  const std::string& target_crs) const {
    if (points.empty()) {
        return;
    }

    QuietErrors quiet;

    OGRSpatialReference source;
    OGRSpatialReference target;
    import_reference(source, source_crs);
    import_reference(target, target_crs);

    TransformationPtr transformation(OGRCreateCoordinateTransformation(&source, &target));
    if (!transformation) {
        throw ReprojectionError("no transformation from '" + source_crs +
                                "' to '" + target_crs + "'");
    }

    std::vector<double> xs;
    std::vector<double> ys;
    xs.reserve(points.size());
    ys.reserve(points.size());
    for (const auto& p : points) {
        xs.push_back(p.x());
        ys.push_back(p.y());
    }
    std::vector<int> success(points.size(), 0);

    if (!transformation->Transform(points.size(), xs.data(), ys.data(), nullptr, success.data())) {
        throw ReprojectionError("transformation from '" + source_crs + "' failed");
    }

    for (size_t i = 0; i < points.size(); ++i) {
        if (!success[i] || !std::isfinite(xs[i]) || !std::isfinite(ys[i])) {
            throw ReprojectionError("vertex " + std::to_string(i) + " could not be transformed from '" +
                                    source_crs + "'");
        }
        points[i] = Point2D(xs[i], ys[i]);
    }
}

} // namespace gex
