/**
 * @file OgrPlanarGeometryTest.cpp
 * @brief GDAL/OGR backend checks
 *
 * OGR builds hulls through GEOS. Without it every hull is absent and the
 * merger falls back to the bounding box, which the hull checks accept.
 */

#include <cppunit/TestFixture.h>
#include <cppunit/extensions/HelperMacros.h>

#include "OgrPlanarGeometry.hpp"
#include "SpatialMerger.hpp"
#include <ogr_geometry.h>

namespace gex {

class OgrPlanarGeometryTests : public CppUnit::TestFixture
{
    CPPUNIT_TEST_SUITE(OgrPlanarGeometryTests);
    CPPUNIT_TEST(testRectangleIsClosed);
    CPPUNIT_TEST(testEnvelopeOfParts);
    CPPUNIT_TEST(testEnvelopeOfNothing);
    CPPUNIT_TEST(testTransformToWebMercator);
    CPPUNIT_TEST(testTransformUnknownReference);
    CPPUNIT_TEST(testConvexHull);
    CPPUNIT_TEST(testCollinearHull);
    CPPUNIT_TEST(testMergeThroughOgr);
    CPPUNIT_TEST(testHullMergeOfPointRecord);
    CPPUNIT_TEST(testHullMergeOfCollinearHull);
    CPPUNIT_TEST(testHullMergeOfTwoBoxes);
    CPPUNIT_TEST_SUITE_END();

private:
    OgrPlanarGeometry geometry_;

    void testRectangleIsClosed()
    {
        Ring ring = geometry_.rectangle(BoundingBox(0, 1, 2, 3));
        CPPUNIT_ASSERT_EQUAL(size_t(5), ring.size());
        CPPUNIT_ASSERT(ring.front() == ring.back());
        CPPUNIT_ASSERT(ring[0] == Point2D(0, 1));
        CPPUNIT_ASSERT(ring[2] == Point2D(2, 3));
    }

    void testEnvelopeOfParts()
    {
        std::vector<Ring> parts = {
            geometry_.rectangle(BoundingBox(0, 0, 1, 1)),
            geometry_.rectangle(BoundingBox(-4, 2, -3, 9))
        };
        auto env = geometry_.envelope(parts);
        CPPUNIT_ASSERT(env.has_value());
        CPPUNIT_ASSERT(*env == BoundingBox(-4, 0, 1, 9));
    }

    void testEnvelopeOfNothing()
    {
        CPPUNIT_ASSERT(!geometry_.envelope({}).has_value());
        CPPUNIT_ASSERT(!geometry_.envelope({Ring()}).has_value());
    }

    void testTransformToWebMercator()
    {
        std::vector<Point2D> points = {Point2D(10, 0), Point2D(0, 0)};
        geometry_.transform(points, "EPSG:4326", "EPSG:3857");
        CPPUNIT_ASSERT_DOUBLES_EQUAL(1113194.9, points[0].x(), 1.0);
        CPPUNIT_ASSERT_DOUBLES_EQUAL(0.0, points[0].y(), 1e-6);
        CPPUNIT_ASSERT_DOUBLES_EQUAL(0.0, points[1].x(), 1e-6);

        geometry_.transform(points, "3857", "4326");
        CPPUNIT_ASSERT_DOUBLES_EQUAL(10.0, points[0].x(), 1e-9);
    }

    void testTransformUnknownReference()
    {
        std::vector<Point2D> points = {Point2D(1, 1)};
        CPPUNIT_ASSERT_THROW(geometry_.transform(points, "EPSG:99999999", "EPSG:4326"),
                             ReprojectionError);
        CPPUNIT_ASSERT_THROW(geometry_.transform(points, "not a reference", "EPSG:4326"),
                             ReprojectionError);
    }

    void testConvexHull()
    {
        auto hull = geometry_.convex_hull({Point2D(0, 0), Point2D(4, 0), Point2D(2, 1),
                                           Point2D(4, 4), Point2D(0, 4)});
        if (!OGRGeometryFactory::haveGEOS()) {
            CPPUNIT_ASSERT(!hull.has_value());
            return;
        }
        CPPUNIT_ASSERT(hull.has_value());
        CPPUNIT_ASSERT(hull->front() == hull->back());
        CPPUNIT_ASSERT_EQUAL(size_t(5), hull->size());
        CPPUNIT_ASSERT(*envelope_of(*hull) == BoundingBox(0, 0, 4, 4));
    }

    void testCollinearHull()
    {
        CPPUNIT_ASSERT(!geometry_.convex_hull({}).has_value());
        CPPUNIT_ASSERT(!geometry_.convex_hull({Point2D(0, 0), Point2D(1, 1)}).has_value());
        CPPUNIT_ASSERT(!geometry_.convex_hull({Point2D(0, 0), Point2D(1, 1), Point2D(2, 2)})
                            .has_value());
        CPPUNIT_ASSERT(!geometry_.convex_hull({Point2D(3, 3), Point2D(3, 3), Point2D(3, 3)})
                            .has_value());
    }

    void testMergeThroughOgr()
    {
        ExtentRecord utm;
        utm.bbox = BoundingBox(500000, 0, 500000, 0);
        utm.crs = "EPSG:32633";

        SpatialMerger merger(geometry_);
        MergedExtent result = merger.merge({utm}, MergeMode::BOUNDING_BOX);
        CPPUNIT_ASSERT(result.is_point);
        CPPUNIT_ASSERT_DOUBLES_EQUAL(15.0, result.point->x(), 1e-6);
        CPPUNIT_ASSERT_DOUBLES_EQUAL(0.0, result.point->y(), 1e-6);
    }

    void testHullMergeOfPointRecord()
    {
        ExtentRecord station;
        station.bbox = BoundingBox(5, 5, 5, 5);
        station.crs = "4326";

        SpatialMerger merger(geometry_);
        MergedExtent result;
        CPPUNIT_ASSERT_NO_THROW(result = merger.merge({station}, MergeMode::CONVEX_HULL));
        CPPUNIT_ASSERT(result.bbox.has_value());
        CPPUNIT_ASSERT_DOUBLES_EQUAL(5.0, result.bbox->min_x, 1e-6);
        CPPUNIT_ASSERT_DOUBLES_EQUAL(5.0, result.bbox->max_y, 1e-6);
        CPPUNIT_ASSERT(result.is_point);
        CPPUNIT_ASSERT(result.point.has_value());
        CPPUNIT_ASSERT_DOUBLES_EQUAL(5.0, result.point->x(), 1e-6);
        CPPUNIT_ASSERT_DOUBLES_EQUAL(5.0, result.point->y(), 1e-6);
        if (result.convex_hull) {
            CPPUNIT_ASSERT(result.hull.has_value());
            CPPUNIT_ASSERT(result.hull->front() == result.hull->back());
        } else {
            CPPUNIT_ASSERT(!result.hull.has_value());
        }
    }

    void testHullMergeOfCollinearHull()
    {
        ExtentRecord transect;
        transect.hull = Ring{Point2D(0, 0), Point2D(1, 1), Point2D(2, 2)};
        transect.crs = "EPSG:4326";

        SpatialMerger merger(geometry_);
        MergedExtent result;
        CPPUNIT_ASSERT_NO_THROW(result = merger.merge({transect}, MergeMode::CONVEX_HULL));
        CPPUNIT_ASSERT(!result.convex_hull);
        CPPUNIT_ASSERT(!result.hull.has_value());
        CPPUNIT_ASSERT(result.bbox.has_value());
        CPPUNIT_ASSERT(*result.bbox == BoundingBox(0, 0, 2, 2));
        CPPUNIT_ASSERT(!result.is_point);
    }

    void testHullMergeOfTwoBoxes()
    {
        ExtentRecord west;
        west.bbox = BoundingBox(0, 0, 1, 1);
        west.crs = "EPSG:4326";
        ExtentRecord east;
        east.bbox = BoundingBox(3, 2, 4, 5);
        east.crs = "EPSG:4326";

        SpatialMerger merger(geometry_);
        MergedExtent result = merger.merge({west, east}, MergeMode::CONVEX_HULL);
        CPPUNIT_ASSERT(result.bbox.has_value());
        CPPUNIT_ASSERT(*result.bbox == BoundingBox(0, 0, 4, 5));
        CPPUNIT_ASSERT_EQUAL(size_t(2), result.contributors);
        CPPUNIT_ASSERT_EQUAL(OGRGeometryFactory::haveGEOS() != 0, result.convex_hull);
        if (result.convex_hull) {
            CPPUNIT_ASSERT(result.hull.has_value());
            CPPUNIT_ASSERT(result.hull->front() == result.hull->back());
        }
    }
};

CPPUNIT_TEST_SUITE_REGISTRATION(OgrPlanarGeometryTests);

} // namespace gex
