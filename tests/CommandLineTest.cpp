/**
 * @file CommandLineTest.cpp
 * @brief Argument parsing of the extent tool
 */

#include <cppunit/TestFixture.h>
#include <cppunit/extensions/HelperMacros.h>

#include "CommandLineInterface.hpp"
#include "SimpleCommandLineParser.hpp"
#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

namespace gex {

namespace {

/**
 * @brief Owns argument strings and exposes them as argc/argv
 */
class Arguments {
public:
    Arguments(std::initializer_list<std::string> args) : storage_(args) {
        storage_.insert(storage_.begin(), "extent-tool");
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
        pointers_.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

SimpleCommandLineParser make_parser() {
    SimpleCommandLineParser parser("extent-tool", "test");
    parser.add_option("records", "r", "records document");
    parser.set_positional("records");
    parser.add_option("seed", "", "seed");
    parser.add_flag("convex-hull", "", "hull mode");
    return parser;
}

} // namespace

class CommandLineTests : public CppUnit::TestFixture
{
    CPPUNIT_TEST_SUITE(CommandLineTests);
    CPPUNIT_TEST(testBareRecordsPath);
    CPPUNIT_TEST(testSecondBarePathRejected);
    CPPUNIT_TEST(testBarePathWithRecordsOptionRejected);
    CPPUNIT_TEST(testBarePathWithoutTargetRejected);
    CPPUNIT_TEST(testInlineAndShortValues);
    CPPUNIT_TEST(testFlagWithValueRejected);
    CPPUNIT_TEST(testUnknownOptionRejected);
    CPPUNIT_TEST(testMissingValueRejected);
    CPPUNIT_TEST(testInterfaceTakesBarePath);
    CPPUNIT_TEST(testInterfaceRejectsExtraPath);
    CPPUNIT_TEST(testInterfaceSeedRange);
    CPPUNIT_TEST(testInterfaceNothingToDo);
    CPPUNIT_TEST_SUITE_END();

private:
    void testBareRecordsPath()
    {
        auto parser = make_parser();
        Arguments args{"--convex-hull", "extents.json"};
        CPPUNIT_ASSERT(parser.parse(args.argc(), args.argv()) ==
                       SimpleCommandLineParser::Outcome::RUN);
        CPPUNIT_ASSERT_EQUAL(std::string("extents.json"), parser.get("records").value());
        CPPUNIT_ASSERT(parser.get_flag("convex-hull"));
    }

    void testSecondBarePathRejected()
    {
        auto parser = make_parser();
        Arguments args{"a.json", "b.json"};
        CPPUNIT_ASSERT(parser.parse(args.argc(), args.argv()) ==
                       SimpleCommandLineParser::Outcome::USAGE_ERROR);
    }

    void testBarePathWithRecordsOptionRejected()
    {
        auto parser = make_parser();
        Arguments args{"--records", "a.json", "b.json"};
        CPPUNIT_ASSERT(parser.parse(args.argc(), args.argv()) ==
                       SimpleCommandLineParser::Outcome::USAGE_ERROR);
    }

    void testBarePathWithoutTargetRejected()
    {
        SimpleCommandLineParser parser("extent-tool", "test");
        parser.add_option("candidates", "f", "candidates document");
        Arguments args{"--candidates", "files.json", "stray"};
        CPPUNIT_ASSERT(parser.parse(args.argc(), args.argv()) ==
                       SimpleCommandLineParser::Outcome::USAGE_ERROR);
    }

    void testInlineAndShortValues()
    {
        auto parser = make_parser();
        Arguments args{"--seed=7", "-r", "extents.json"};
        CPPUNIT_ASSERT(parser.parse(args.argc(), args.argv()) ==
                       SimpleCommandLineParser::Outcome::RUN);
        CPPUNIT_ASSERT_EQUAL(std::string("7"), parser.get("seed").value());
        CPPUNIT_ASSERT_EQUAL(std::string("extents.json"), parser.get("records").value());
        CPPUNIT_ASSERT(!parser.get_flag("convex-hull"));
    }

    void testFlagWithValueRejected()
    {
        auto parser = make_parser();
        Arguments args{"--convex-hull=yes"};
        CPPUNIT_ASSERT(parser.parse(args.argc(), args.argv()) ==
                       SimpleCommandLineParser::Outcome::USAGE_ERROR);
    }

    void testUnknownOptionRejected()
    {
        auto parser = make_parser();
        Arguments long_form{"--bogus", "1"};
        CPPUNIT_ASSERT(parser.parse(long_form.argc(), long_form.argv()) ==
                       SimpleCommandLineParser::Outcome::USAGE_ERROR);
        Arguments short_form{"-q"};
        CPPUNIT_ASSERT(parser.parse(short_form.argc(), short_form.argv()) ==
                       SimpleCommandLineParser::Outcome::USAGE_ERROR);
    }

    void testMissingValueRejected()
    {
        auto parser = make_parser();
        Arguments args{"--seed"};
        CPPUNIT_ASSERT(parser.parse(args.argc(), args.argv()) ==
                       SimpleCommandLineParser::Outcome::USAGE_ERROR);
    }

    void testInterfaceTakesBarePath()
    {
        CommandLineInterface cli;
        Arguments args{"--convex-hull", "--seed", "4294967295", "extents.json"};
        CPPUNIT_ASSERT(cli.parse_arguments(args.argc(), args.argv()));
        CPPUNIT_ASSERT_EQUAL(std::string("extents.json"), cli.records_path().value());
        CPPUNIT_ASSERT(!cli.candidates_path().has_value());
        CPPUNIT_ASSERT(cli.get_config().convex_hull);
        CPPUNIT_ASSERT_EQUAL(std::uint32_t(4294967295u), cli.get_config().seed);
    }

    void testInterfaceRejectsExtraPath()
    {
        CommandLineInterface cli;
        Arguments args{"extents.json", "more.json"};
        CPPUNIT_ASSERT(!cli.parse_arguments(args.argc(), args.argv()));
        CPPUNIT_ASSERT_EQUAL(1, cli.exit_code());
        CPPUNIT_ASSERT(!cli.records_path().has_value());
    }

    void testInterfaceSeedRange()
    {
        CommandLineInterface too_large;
        Arguments large{"--records", "extents.json", "--seed", "4294967296"};
        CPPUNIT_ASSERT(!too_large.parse_arguments(large.argc(), large.argv()));
        CPPUNIT_ASSERT_EQUAL(1, too_large.exit_code());

        CommandLineInterface negative;
        Arguments minus{"--records", "extents.json", "--seed=-1"};
        CPPUNIT_ASSERT(!negative.parse_arguments(minus.argc(), minus.argv()));
        CPPUNIT_ASSERT_EQUAL(1, negative.exit_code());
    }

    void testInterfaceNothingToDo()
    {
        CommandLineInterface cli;
        Arguments args{"--convex-hull"};
        CPPUNIT_ASSERT(!cli.parse_arguments(args.argc(), args.argv()));
        CPPUNIT_ASSERT_EQUAL(1, cli.exit_code());
    }
};

CPPUNIT_TEST_SUITE_REGISTRATION(CommandLineTests);

} // namespace gex
