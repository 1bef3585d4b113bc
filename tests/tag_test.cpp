#include <gtest/gtest.h>

#include "argot/error.hpp"
#include "argot/tag.hpp"

TEST(Tag, Builders) {
    const auto s = argot::tag::shortName('s');
    EXPECT_EQ(s.shortName(), std::optional<char>('s'));
    EXPECT_FALSE(s.longName());
    EXPECT_FALSE(s.envName());
    EXPECT_TRUE(s.hasCli());
    EXPECT_FALSE(s.hasEnv());

    const auto b = argot::tag::both('b', "baz");
    EXPECT_TRUE(b.matchesShort('b'));
    EXPECT_TRUE(b.matchesLong("baz"));
    EXPECT_FALSE(b.matchesLong("Baz"));

    const auto e = argot::tag::env("ENV_VAR");
    EXPECT_FALSE(e.hasCli());
    EXPECT_TRUE(e.matchesEnv("ENV_VAR"));
    EXPECT_FALSE(e.matchesEnv("env_var"));
}

TEST(Tag, Chaining) {
    const auto t = argot::tag::longName("list").withShort('l').withEnv("LIST");
    EXPECT_EQ(t, argot::Tag('l', std::string("list"), std::string("LIST")));
    EXPECT_EQ(t.str(), "-l / --list / $LIST");
    EXPECT_EQ(argot::tag::env("X").withLong("x").str(), "--x / $X");
}

TEST(Tag, RejectsEmpty) {
    EXPECT_THROW((void)argot::Tag(std::nullopt, std::nullopt, std::nullopt), argot::TagError);
    EXPECT_THROW(argot::tag::longName(""), argot::TagError);
    EXPECT_THROW(argot::tag::env(""), argot::TagError);
}

TEST(Tag, RejectsMalformed) {
    EXPECT_THROW(argot::tag::shortName('-'), argot::TagError);
    EXPECT_THROW(argot::tag::shortName('='), argot::TagError);
    EXPECT_THROW(argot::tag::shortName(' '), argot::TagError);
    EXPECT_THROW(argot::tag::longName("--name"), argot::TagError);
    EXPECT_THROW(argot::tag::longName("a=b"), argot::TagError);
    EXPECT_THROW(argot::tag::env("A=B"), argot::TagError);
}

TEST(Tag, Collisions) {
    EXPECT_TRUE(argot::tag::both('a', "alpha").collidesWith(argot::tag::shortName('a')));
    EXPECT_TRUE(argot::tag::both('a', "alpha").collidesWith(argot::tag::longName("alpha")));
    EXPECT_TRUE(argot::tag::env("A").collidesWith(argot::tag::longName("a").withEnv("A")));
    EXPECT_FALSE(argot::tag::shortName('a').collidesWith(argot::tag::longName("a")));
    EXPECT_FALSE(argot::tag::longName("A").collidesWith(argot::tag::env("A")));
}
