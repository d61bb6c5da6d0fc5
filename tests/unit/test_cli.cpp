#include <gtest/gtest.h>
#include "cli/cli.hpp"
#include <stdexcept>

using namespace prov;

class CliParseTest : public ::testing::Test {
protected:
    Command cmd;

    void SetUp() override {
        cmd.name = "layout";
        cmd.description = "Run the force layout";
        cmd.args = {
            {"input", "i", "Graph JSON file", "", true, false},
            {"title", "t", "Title", "Provenance Network", false, false},
            {"width", "W", "Canvas width", "", false, false, true},
            {"ticks", "n", "Maximum number of ticks", "", false, false, true},
            {"verbose", "v", "Log layout lifecycle", "", false, true}
        };
        cmd.handler = [](const Args&) { return 0; };
    }

    Args parse(std::vector<std::string> tokens) {
        std::vector<char*> argv;
        for (auto& token : tokens) {
            argv.push_back(token.data());
        }
        return CLI::parse_args(static_cast<int>(argv.size()), argv.data(), cmd);
    }
};

TEST_F(CliParseTest, ParsesLongShortAndInlineForms) {
    Args args = parse({"--input", "graph.json", "-n", "250", "--width=1024", "-v"});

    EXPECT_EQ(args.require("input"), "graph.json");
    EXPECT_EQ(args.get("ticks").as_int(), 250);
    EXPECT_DOUBLE_EQ(args.get("width").as_double(), 1024.0);
    EXPECT_TRUE(args.has("verbose"));
}

TEST_F(CliParseTest, DefaultsApplyWhenAbsent) {
    Args args = parse({"-i", "graph.json"});

    EXPECT_EQ(args.get("title").value, "Provenance Network");
    EXPECT_FALSE(args.has("ticks"));
    EXPECT_EQ(args.get("ticks").as_int(1000), 1000);
    EXPECT_DOUBLE_EQ(args.get("width").as_double(800.0), 800.0);
    EXPECT_FALSE(args.has("verbose"));
}

TEST_F(CliParseTest, NegativeNumbersAreValues) {
    Args args = parse({"-i", "graph.json", "--width", "-5"});
    EXPECT_DOUBLE_EQ(args.get("width").as_double(), -5.0);
}

TEST_F(CliParseTest, IntegerOptionsReadWholeValue) {
    EXPECT_EQ(parse({"-i", "graph.json", "--ticks", "1e3"}).get("ticks").as_int(), 1000);
    EXPECT_EQ(parse({"-i", "graph.json", "--ticks", "300.0"}).get("ticks").as_int(), 300);

    EXPECT_THROW(parse({"-i", "graph.json", "--ticks", "2.5"}).get("ticks").as_int(),
                 std::invalid_argument);
    EXPECT_THROW(parse({"-i", "graph.json", "--ticks", "1e12"}).get("ticks").as_int(),
                 std::invalid_argument);
}

TEST_F(CliParseTest, RejectsBadInput) {
    EXPECT_THROW(parse({}), std::runtime_error);
    EXPECT_THROW(parse({"-i", "graph.json", "--bogus", "1"}), std::runtime_error);
    EXPECT_THROW(parse({"-i", "graph.json", "--ticks", "many"}), std::runtime_error);
    EXPECT_THROW(parse({"-i", "graph.json", "--width", "12px"}), std::runtime_error);
    EXPECT_THROW(parse({"-i"}), std::runtime_error);
}

TEST_F(CliParseTest, PositionalArgumentsAreKept) {
    Args args = parse({"case.json", "-i", "graph.json"});
    ASSERT_EQ(args.positional.size(), 1);
    EXPECT_EQ(args.positional[0], "case.json");
}

TEST(CliRunTest, DispatchesAndReportsErrors) {
    CLI cli("provgraph", "1.0.0");
    int calls = 0;
    cli.register_command({
        "stats",
        "Print statistics",
        {{"input", "i", "Graph JSON file", "", true, false}},
        [&](const Args& args) {
            calls++;
            if (args.require("input") == "broken.json") {
                throw std::runtime_error("Failed to open file for reading: broken.json");
            }
            return 0;
        }
    });

    std::string prog = "provgraph", stats = "stats", flag = "-i", good = "graph.json", bad = "broken.json",
                unknown = "explode";

    char* ok_argv[] = {prog.data(), stats.data(), flag.data(), good.data()};
    EXPECT_EQ(cli.run(4, ok_argv), 0);

    char* bad_argv[] = {prog.data(), stats.data(), flag.data(), bad.data()};
    EXPECT_EQ(cli.run(4, bad_argv), 1);
    EXPECT_EQ(calls, 2);

    char* unknown_argv[] = {prog.data(), unknown.data()};
    EXPECT_EQ(cli.run(2, unknown_argv), 1);
}
