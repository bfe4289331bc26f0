/**
 * @file LoggerTest.cpp
 * @brief Facility levels and the shared log file
 */

#include <cppunit/TestFixture.h>
#include <cppunit/extensions/HelperMacros.h>

#include "Logger.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

namespace gex {

class LoggerTests : public CppUnit::TestFixture
{
    CPPUNIT_TEST_SUITE(LoggerTests);
    CPPUNIT_TEST(testFacilityLevels);
    CPPUNIT_TEST(testSharedFileReceivesOutput);
    CPPUNIT_TEST(testConcurrentWritersKeepLinesWhole);
    CPPUNIT_TEST_SUITE_END();

public:
    void setUp()
    {
        path_ = (std::filesystem::temp_directory_path() / "extent_engine_logger_test.log").string();
        std::filesystem::remove(path_);
        Logger::clearFacilityLevels();
    }

    void tearDown()
    {
        Logger::setSharedLogFile(std::nullopt);
        Logger::clearFacilityLevels();
        Logger::parseLogConfig("3");
        std::filesystem::remove(path_);
    }

private:
    std::string path_;

    std::vector<std::string> read_lines() const
    {
        std::vector<std::string> lines;
        std::ifstream in(path_);
        std::string line;
        while (std::getline(in, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    void testFacilityLevels()
    {
        Logger::parseLogConfig("2,SpatialMerger=5");
        CPPUNIT_ASSERT(Logger::getFacilityLevel("SpatialMerger") == LogLevel::DEBUG);

        Logger merger("SpatialMerger");
        Logger selector("BudgetedSelector");
        CPPUNIT_ASSERT(merger.shouldOutput(LogLevel::DEBUG));
        CPPUNIT_ASSERT(!selector.shouldOutput(LogLevel::INFO));
        CPPUNIT_ASSERT(selector.shouldOutput(LogLevel::WARNING));
    }

    void testSharedFileReceivesOutput()
    {
        CPPUNIT_ASSERT(Logger::setSharedLogFile(path_));
        Logger::setFacilityLevel("FileGrouper", LogLevel::INFO);
        {
            Logger logger("FileGrouper");
            logger.info("grouped 3 files");
            logger.debug("not written");
            logger.flush();
        }
        Logger::setSharedLogFile(std::nullopt);

        auto lines = read_lines();
        CPPUNIT_ASSERT_EQUAL(size_t(1), lines.size());
        CPPUNIT_ASSERT(lines[0].find("INFO FileGrouper: grouped 3 files") != std::string::npos);
    }

    void testConcurrentWritersKeepLinesWhole()
    {
        const int per_thread = 200;
        CPPUNIT_ASSERT(Logger::setSharedLogFile(path_));
        Logger::setFacilityLevel("WriterA", LogLevel::INFO);
        Logger::setFacilityLevel("WriterB", LogLevel::INFO);

        auto write = [per_thread](const std::string& name) {
            Logger logger(name);
            for (int i = 0; i < per_thread; ++i) {
                logger.info("message " + std::to_string(i) + " from " + name);
            }
            logger.flush();
        };
        std::thread a(write, std::string("WriterA"));
        std::thread b(write, std::string("WriterB"));
        a.join();
        b.join();
        Logger::setSharedLogFile(std::nullopt);

        auto lines = read_lines();
        CPPUNIT_ASSERT_EQUAL(size_t(2 * per_thread), lines.size());
        int from_a = 0;
        int from_b = 0;
        for (const auto& line : lines) {
            CPPUNIT_ASSERT(!line.empty() && line.front() == '[');
            bool a_line = line.find("INFO WriterA: message ") != std::string::npos &&
                          line.size() >= 8 && line.compare(line.size() - 8, 8, " WriterA") == 0;
            bool b_line = line.find("INFO WriterB: message ") != std::string::npos &&
                          line.size() >= 8 && line.compare(line.size() - 8, 8, " WriterB") == 0;
            CPPUNIT_ASSERT(a_line != b_line);
            if (a_line) ++from_a;
            if (b_line) ++from_b;
        }
        CPPUNIT_ASSERT_EQUAL(per_thread, from_a);
        CPPUNIT_ASSERT_EQUAL(per_thread, from_b);
    }
};

CPPUNIT_TEST_SUITE_REGISTRATION(LoggerTests);

} // namespace gex
