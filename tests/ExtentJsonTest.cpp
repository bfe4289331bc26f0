/**
 * @file ExtentJsonTest.cpp
 */

#include <cppunit/TestFixture.h>
#include <cppunit/extensions/HelperMacros.h>

#include "ExtentJson.hpp"
#include <cmath>

using json = nlohmann::json;

namespace gex {

class ExtentJsonTests : public CppUnit::TestFixture
{
    CPPUNIT_TEST_SUITE(ExtentJsonTests);
    CPPUNIT_TEST(testRecordsDocument);
    CPPUNIT_TEST(testBareRecordArray);
    CPPUNIT_TEST(testMalformedBboxBecomesNaN);
    CPPUNIT_TEST(testMalformedHullVertex);
    CPPUNIT_TEST(testMalformedTboxDropped);
    CPPUNIT_TEST(testNotARecordsDocument);
    CPPUNIT_TEST(testCandidatesDocument);
    CPPUNIT_TEST(testCandidateWithoutName);
    CPPUNIT_TEST(testAggregateOutput);
    CPPUNIT_TEST(testSelectionOutput);
    CPPUNIT_TEST(testMissingFile);
    CPPUNIT_TEST_SUITE_END();

private:
    void testRecordsDocument()
    {
        json document = json::parse(R"({
            "records": [
                {"name": "a.tif", "bbox": [1, 2, 3, 4], "crs": "EPSG:32633",
                 "tbox": ["2019-01-01", "2019-12-31"]},
                {"name": "b.geojson", "hull": [[0, 0], [1, 0], [0, 1], [0, 0]], "crs": 4326},
                {"name": "c.csv"}
            ]
        })");

        std::vector<ExtentRecord> records = records_from_json(document);
        CPPUNIT_ASSERT_EQUAL(size_t(3), records.size());

        CPPUNIT_ASSERT_EQUAL(std::string("a.tif"), records[0].name);
        CPPUNIT_ASSERT(*records[0].bbox == BoundingBox(1, 2, 3, 4));
        CPPUNIT_ASSERT_EQUAL(std::string("EPSG:32633"), *records[0].crs);
        CPPUNIT_ASSERT(*records[0].tbox == (TemporalExtent{"2019-01-01", "2019-12-31"}));
        CPPUNIT_ASSERT(!records[0].hull.has_value());

        CPPUNIT_ASSERT_EQUAL(std::string("4326"), *records[1].crs);
        CPPUNIT_ASSERT_EQUAL(size_t(4), records[1].hull->size());
        CPPUNIT_ASSERT(!records[1].bbox.has_value());

        CPPUNIT_ASSERT(!records[2].bbox.has_value());
        CPPUNIT_ASSERT(!records[2].crs.has_value());
        CPPUNIT_ASSERT(!records[2].tbox.has_value());
    }

    void testBareRecordArray()
    {
        json document = json::parse(R"([{"bbox": [0, 0, 1, 1], "crs": "4326"}])");
        CPPUNIT_ASSERT_EQUAL(size_t(1), records_from_json(document).size());
    }

    void testMalformedBboxBecomesNaN()
    {
        json document = json::parse(R"([
            {"bbox": [0, "x", 1, 1], "crs": "4326"},
            {"bbox": [0, 1], "crs": "4326"}
        ])");
        std::vector<ExtentRecord> records = records_from_json(document);
        CPPUNIT_ASSERT(std::isnan(records[0].bbox->min_y));
        CPPUNIT_ASSERT(!records[0].bbox->is_valid());
        CPPUNIT_ASSERT(!records[1].bbox->is_valid());
    }

    void testMalformedHullVertex()
    {
        json document = json::parse(R"([{"hull": [[0, 0], [1], [2, 2]], "crs": "4326"}])");
        std::vector<ExtentRecord> records = records_from_json(document);
        CPPUNIT_ASSERT_EQUAL(size_t(3), records[0].hull->size());
        CPPUNIT_ASSERT(std::isnan((*records[0].hull)[1].x()));
    }

    void testMalformedTboxDropped()
    {
        json document = json::parse(R"([{"tbox": ["2020-01-01"]}, {"tbox": [1, 2]}])");
        std::vector<ExtentRecord> records = records_from_json(document);
        CPPUNIT_ASSERT(!records[0].tbox.has_value());
        CPPUNIT_ASSERT(!records[1].tbox.has_value());
    }

    void testNotARecordsDocument()
    {
        CPPUNIT_ASSERT_THROW(records_from_json(json::parse(R"({"files": []})")), InputFormatError);
        CPPUNIT_ASSERT_THROW(records_from_json(json::parse("42")), InputFormatError);
        CPPUNIT_ASSERT_THROW(records_from_json(json::parse("[1, 2]")), InputFormatError);
    }

    void testCandidatesDocument()
    {
        json document = json::parse(R"({
            "files": [
                {"name": "x.shp", "url": "https://example.org/x.shp", "size": 40},
                {"name": "x.dbf", "size": null},
                {"name": "y.nc", "size": -5},
                {"name": "z.tif", "size": "big"}
            ]
        })");
        std::vector<CandidateFile> files = candidates_from_json(document);
        CPPUNIT_ASSERT_EQUAL(size_t(4), files.size());
        CPPUNIT_ASSERT(files[0] == CandidateFile("x.shp", "https://example.org/x.shp", 40));
        CPPUNIT_ASSERT_EQUAL(std::string(""), files[1].url);
        CPPUNIT_ASSERT_EQUAL(std::uint64_t(0), files[1].size);
        CPPUNIT_ASSERT_EQUAL(std::uint64_t(0), files[2].size);
        CPPUNIT_ASSERT_EQUAL(std::uint64_t(0), files[3].size);
    }

    void testCandidateWithoutName()
    {
        CPPUNIT_ASSERT_THROW(candidates_from_json(json::parse(R"([{"size": 3}])")),
                             InputFormatError);
    }

    void testAggregateOutput()
    {
        AggregateExtent extent;
        extent.spatial.bbox = BoundingBox(5, 5, 5, 5);
        extent.spatial.crs = WGS84_CRS;
        extent.spatial.is_point = true;
        extent.spatial.point = Point2D(5, 5);
        extent.temporal = TemporalExtent{"2001-02-03", "2004-05-06"};
        extent.records_total = 3;
        extent.records_with_spatial = 2;
        extent.records_with_temporal = 1;

        json out = to_json(extent);
        CPPUNIT_ASSERT(out["bbox"] == json::array({5.0, 5.0, 5.0, 5.0}));
        CPPUNIT_ASSERT_EQUAL(std::string("4326"), out["crs"].get<std::string>());
        CPPUNIT_ASSERT(out["is_point"].get<bool>());
        CPPUNIT_ASSERT(out["point"] == json::array({5.0, 5.0}));
        CPPUNIT_ASSERT(!out["convex_hull"].get<bool>());
        CPPUNIT_ASSERT(!out.contains("hull"));
        CPPUNIT_ASSERT_EQUAL(std::string("2004-05-06"), out["tbox"][1].get<std::string>());
        CPPUNIT_ASSERT_EQUAL(2, out["records_with_spatial"].get<int>());

        json empty = to_json(AggregateExtent());
        CPPUNIT_ASSERT(empty["bbox"].is_null());
        CPPUNIT_ASSERT(empty["crs"].is_null());
        CPPUNIT_ASSERT(empty["tbox"].is_null());
        CPPUNIT_ASSERT(empty["point"].is_null());
    }

    void testSelectionOutput()
    {
        SelectionResult selection;
        selection.selected.push_back(CandidateFile("a", "u/a", 10));
        selection.skipped.push_back(CandidateFile("b", "u/b", 90));
        selection.total_bytes = 10;

        json out = to_json(selection);
        CPPUNIT_ASSERT_EQUAL(size_t(1), out["selected"].size());
        CPPUNIT_ASSERT_EQUAL(std::string("a"), out["selected"][0]["name"].get<std::string>());
        CPPUNIT_ASSERT_EQUAL(std::uint64_t(90), out["skipped"][0]["size"].get<std::uint64_t>());
        CPPUNIT_ASSERT_EQUAL(std::uint64_t(10), out["total_bytes"].get<std::uint64_t>());
    }

    void testMissingFile()
    {
        CPPUNIT_ASSERT_THROW(load_json_file("/nonexistent/extent_records.json"), InputFormatError);
    }
};

CPPUNIT_TEST_SUITE_REGISTRATION(ExtentJsonTests);

} // namespace gex
