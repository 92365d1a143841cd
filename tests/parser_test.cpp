#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

#include "cmdtree/parser.hpp"

using cmdtree::ArgSpec;
using cmdtree::ArgType;
using cmdtree::OptionSpec;
using cmdtree::OptionValue;
using cmdtree::Parser;
using Tokens = std::vector<std::string>;

namespace {

std::vector<OptionSpec> sampleSpecs() {
    return {
        OptionSpec("verbose", 'v', "verbose", "Verbose output"),
        OptionSpec("all", 'a', "all", "Everything"),
        OptionSpec("output", 'o', "output", ArgSpec{ArgType::String, OptionValue{std::string("table")}}, "Format"),
        OptionSpec("retries", 'r', "retries", ArgSpec{ArgType::Integer, OptionValue{std::int64_t{3}}}, "Retries"),
        OptionSpec("ratio", '\0', "ratio", ArgSpec{ArgType::Float, std::nullopt}, "Ratio"),
        OptionSpec("color", 'c', "color", ArgSpec{ArgType::Boolean, std::nullopt}, "Colorize"),
    };
}

} // namespace

TEST(Parser, EmptyInputFillsDefaults) {
    Parser p(sampleSpecs(), {});
    ASSERT_TRUE(p.ok()) << p.error();
    EXPECT_EQ(p.options().get<std::string>("output"), "table");
    EXPECT_EQ(p.options().get<int>("retries"), 3);
    EXPECT_FALSE(p.options().has("verbose"));
    EXPECT_FALSE(p.options().has("ratio"));
    EXPECT_TRUE(p.extras().empty());
}

TEST(Parser, LongForms) {
    Parser p(sampleSpecs(), {"--verbose", "--output=json", "--retries", "5", "--ratio=0.25"});
    ASSERT_TRUE(p.ok()) << p.error();
    EXPECT_TRUE(p.options().isSet("verbose"));
    EXPECT_EQ(p.options().get<std::string>("output"), "json");
    EXPECT_EQ(p.options().get<std::int64_t>("retries"), 5);
    EXPECT_DOUBLE_EQ(p.options().get<double>("ratio"), 0.25);
}

TEST(Parser, ShortForms) {
    Parser p(sampleSpecs(), {"-o", "yaml", "-r7"});
    ASSERT_TRUE(p.ok()) << p.error();
    EXPECT_EQ(p.options().get<std::string>("output"), "yaml");
    EXPECT_EQ(p.options().get<int>("retries"), 7);

    Parser eq(sampleSpecs(), {"-o=csv"});
    ASSERT_TRUE(eq.ok()) << eq.error();
    EXPECT_EQ(eq.options().get<std::string>("output"), "csv");
}

TEST(Parser, GroupedShortFlags) {
    Parser p(sampleSpecs(), {"-va"});
    ASSERT_TRUE(p.ok()) << p.error();
    EXPECT_TRUE(p.options().isSet("verbose"));
    EXPECT_TRUE(p.options().isSet("all"));

    // A value-taking flag ends the group and takes the rest of the token.
    Parser tail(sampleSpecs(), {"-vojson"});
    ASSERT_TRUE(tail.ok()) << tail.error();
    EXPECT_TRUE(tail.options().isSet("verbose"));
    EXPECT_EQ(tail.options().get<std::string>("output"), "json");
}

TEST(Parser, UnknownFlagInsideGroup) {
    Parser p(sampleSpecs(), {"-vxa"});
    ASSERT_FALSE(p.ok());
    EXPECT_EQ(p.error().rfind("unknown flag: -x", 0), 0u);
}

TEST(Parser, BooleanOptionTakesOptionalLiteral) {
    Parser bare(sampleSpecs(), {"--color", "file.txt"});
    ASSERT_TRUE(bare.ok()) << bare.error();
    EXPECT_TRUE(bare.options().isSet("color"));
    EXPECT_EQ(bare.extras(), Tokens{"file.txt"});

    Parser off(sampleSpecs(), {"--color", "false"});
    ASSERT_TRUE(off.ok()) << off.error();
    EXPECT_TRUE(off.options().has("color"));
    EXPECT_FALSE(off.options().isSet("color"));
    EXPECT_TRUE(off.extras().empty());

    Parser presence(sampleSpecs(), {"--verbose=false"});
    ASSERT_TRUE(presence.ok()) << presence.error();
    EXPECT_FALSE(presence.options().isSet("verbose"));
}

TEST(Parser, LastOccurrenceWins) {
    Parser p(sampleSpecs(), {"-o", "a", "--output", "b"});
    ASSERT_TRUE(p.ok()) << p.error();
    EXPECT_EQ(p.options().get<std::string>("output"), "b");
    EXPECT_EQ(p.options().size(), 2u); // output + retries default
}

TEST(Parser, DoubleDashEndsFlags) {
    Parser p(sampleSpecs(), {"-v", "--", "-a", "--bogus"});
    ASSERT_TRUE(p.ok()) << p.error();
    EXPECT_TRUE(p.options().isSet("verbose"));
    EXPECT_FALSE(p.options().has("all"));
    EXPECT_EQ(p.extras(), (Tokens{"-a", "--bogus"}));
}

TEST(Parser, LoneDashIsPositional) {
    Parser p(sampleSpecs(), {"-"});
    ASSERT_TRUE(p.ok()) << p.error();
    EXPECT_EQ(p.extras(), Tokens{"-"});
}

TEST(Parser, UnknownFlagWithSuggestion) {
    Parser p(sampleSpecs(), {"--verbos"});
    ASSERT_FALSE(p.ok());
    EXPECT_EQ(p.error(), "unknown flag: --verbos\n\nDid you mean this?\n  --verbose\n");
}

TEST(Parser, UnknownFlagWithoutSuggestion) {
    Parser p(sampleSpecs(), {"--zzzzzzzz"});
    ASSERT_FALSE(p.ok());
    EXPECT_EQ(p.error(), "unknown flag: --zzzzzzzz");

    Parser none({}, {"--verbos"});
    ASSERT_FALSE(none.ok());
    EXPECT_EQ(none.error(), "unknown flag: --verbos");
}

TEST(Parser, MissingArgument) {
    Parser p(sampleSpecs(), {"--output"});
    ASSERT_FALSE(p.ok());
    EXPECT_EQ(p.error(), "flag needs an argument: --output");

    Parser s(sampleSpecs(), {"-r"});
    ASSERT_FALSE(s.ok());
    EXPECT_EQ(s.error(), "flag needs an argument: -r");
}

TEST(Parser, InvalidArgument) {
    Parser p(sampleSpecs(), {"--retries", "many"});
    ASSERT_FALSE(p.ok());
    EXPECT_EQ(p.error(), "invalid argument \"many\" for \"--retries\"");
}

TEST(Parser, FirstErrorStopsParsingAndSkipsDefaults) {
    Parser p(sampleSpecs(), {"--bogus", "--retries", "x"});
    ASSERT_FALSE(p.ok());
    EXPECT_EQ(p.error().rfind("unknown flag: --bogus", 0), 0u);
    EXPECT_TRUE(p.options().empty());
}

TEST(Parser, IsFlagToken) {
    EXPECT_TRUE(Parser::isFlagToken("-x"));
    EXPECT_TRUE(Parser::isFlagToken("--long"));
    EXPECT_FALSE(Parser::isFlagToken("-"));
    EXPECT_FALSE(Parser::isFlagToken("x"));
    EXPECT_FALSE(Parser::isFlagToken(""));
}
