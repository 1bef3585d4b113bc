#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

#include "argot/parser.hpp"

using argot::Parser;
using UInts = std::vector<std::uint64_t>;

TEST(List, RepeatedOccurrencesAccumulate) {
    Parser parser;
    const auto baz = parser.add<UInts>(argot::tag::longName("baz"));
    const auto args = parser.parseCli({"bin", "--baz", "1,2,3", "--baz", "7,8,9"});
    ASSERT_TRUE(args.ok());
    EXPECT_EQ(baz.get(args), (UInts{1, 2, 3, 7, 8, 9}));
    EXPECT_EQ(args.remainder(), (std::vector<std::string>{"bin"}));
}

TEST(List, MixedFormsAccumulateInOrder) {
    Parser parser;
    const auto tags = parser.add<std::vector<std::string>>(argot::tag::both('t', "tag"));
    const auto args = parser.parseCli({"bin", "-t", "a", "--tag=b,c", "x", "-t=d"});
    EXPECT_EQ(tags.get(args), (std::vector<std::string>{"a", "b", "c", "d"}));
    EXPECT_EQ(args.positionals(), (std::vector<std::string>{"x"}));
}

TEST(List, DefaultOnlyWhenNothingSupplied) {
    Parser parser;
    const auto ids = parser.add<UInts>(argot::tag::longName("ids").withEnv("IDS"), "1,2,3");

    EXPECT_EQ(ids.get(parser.parseCli({"bin"})), (UInts{1, 2, 3}));
    EXPECT_EQ(ids.get(parser.parseCli({"bin", "--ids", "5"})), (UInts{5}));
    EXPECT_EQ(ids.get(parser.parseEnv({{"IDS", "9,8"}})), (UInts{9, 8}));
}

TEST(List, CliListReplacesEnvironmentList) {
    Parser parser;
    const auto ids = parser.add<UInts>(argot::tag::longName("ids").withEnv("IDS"));
    const auto args = parser.parse({"bin", "--ids=4", "--ids=5"}, {{"IDS", "1,2"}});
    EXPECT_EQ(ids.get(args), (UInts{4, 5}));
}

TEST(List, OneBadElementFailsTheList) {
    Parser parser;
    const auto ids = parser.add<UInts>(argot::tag::longName("ids"));
    const auto args = parser.parseCli({"bin", "--ids", "1,2", "--ids", "x,4"});
    ASSERT_TRUE(args.ok());
    const auto r = ids.result(args);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->error(), argot::ConversionError("x", "an unsigned integer"));
    EXPECT_FALSE(ids.ok(args));
    EXPECT_THROW(ids.get(args), argot::ValueError);
}

TEST(List, EmptyPiecesAreKeptForText) {
    Parser parser;
    const auto parts = parser.add<std::vector<std::string>>(argot::tag::longName("parts"));
    EXPECT_EQ(parts.get(parser.parseCli({"bin", "--parts=a,,b"})), (std::vector<std::string>{"a", "", "b"}));
}

TEST(List, TrailingOccurrenceWithoutValueAddsNothing) {
    Parser parser;
    const auto ids = parser.add<UInts>(argot::tag::longName("ids"));
    EXPECT_EQ(ids.get(parser.parseCli({"bin", "--ids", "1", "--ids"})), (UInts{1}));
}

TEST(List, FloatElements) {
    Parser parser;
    const auto weights = parser.add<std::vector<double>>(argot::tag::shortName('w'));
    EXPECT_EQ(weights.get(parser.parseCli({"bin", "-w", "0.5,1e2", "-w", "-3"})), (std::vector<double>{0.5, 100.0, -3.0}));
}
