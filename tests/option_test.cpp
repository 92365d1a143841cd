#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>

#include "cmdtree/option.hpp"
#include "cmdtree/parsed_options.hpp"
#include "cmdtree/terminal.hpp"

using cmdtree::ArgSpec;
using cmdtree::ArgType;
using cmdtree::OptionSpec;
using cmdtree::OptionValue;
using cmdtree::ParsedOptions;

TEST(OptionSpec, RequiresAFlagSpelling) {
    EXPECT_THROW(OptionSpec("x", '\0', "", "help"), std::invalid_argument);
    EXPECT_THROW(OptionSpec("", 'x', "", "help"), std::invalid_argument);
    EXPECT_THROW(OptionSpec("x", '\0', "--x", "help"), std::invalid_argument);
    EXPECT_NO_THROW(OptionSpec("x", 'x', "", "help"));
    EXPECT_NO_THROW(OptionSpec("x", '\0', "ex", "help"));
}

TEST(OptionSpec, Spellings) {
    const OptionSpec both("out", 'o', "output", ArgSpec{ArgType::String, std::string("table")}, "Format");
    EXPECT_EQ(both.shortFlag(), "-o");
    EXPECT_EQ(both.longFlag(), "--output");
    EXPECT_TRUE(both.takesValue());
    ASSERT_TRUE(both.defaultValue().has_value());
    EXPECT_EQ(std::get<std::string>(*both.defaultValue()), "table");

    const OptionSpec flag("quiet", 'q', "", "Quiet");
    EXPECT_EQ(flag.longFlag(), "");
    EXPECT_FALSE(flag.takesValue());
    EXPECT_FALSE(flag.defaultValue().has_value());
}

TEST(OptionSpec, Convert) {
    EXPECT_EQ(OptionSpec::convert(ArgType::Integer, "42"), OptionValue{std::int64_t{42}});
    EXPECT_EQ(OptionSpec::convert(ArgType::Float, "0.5"), OptionValue{0.5});
    EXPECT_EQ(OptionSpec::convert(ArgType::Boolean, "off"), OptionValue{false});
    EXPECT_EQ(OptionSpec::convert(ArgType::String, " x "), OptionValue{std::string(" x ")});
    EXPECT_THROW(OptionSpec::convert(ArgType::Integer, "4x"), std::invalid_argument);
    EXPECT_FALSE(OptionSpec::tryConvert(ArgType::Boolean, "maybe").has_value());
}

TEST(OptionSpec, ToString) {
    EXPECT_EQ(cmdtree::toString(OptionValue{true}), "true");
    EXPECT_EQ(cmdtree::toString(OptionValue{std::int64_t{-7}}), "-7");
    EXPECT_EQ(cmdtree::toString(OptionValue{2.0}), "2.0");
    EXPECT_EQ(cmdtree::toString(OptionValue{0.1}), "0.1");
    EXPECT_EQ(cmdtree::toString(OptionValue{10.0}), "10.0");
    EXPECT_EQ(cmdtree::toString(OptionValue{-250.0}), "-250.0");
    EXPECT_EQ(cmdtree::toString(OptionValue{1e20}), "1e+20");
    EXPECT_EQ(cmdtree::toString(OptionValue{std::string("a b")}), "a b");
}

TEST(ParsedOptions, SetReplacesInPlace) {
    ParsedOptions opts;
    opts.set("a", std::int64_t{1});
    opts.set("b", true);
    opts.set("a", std::int64_t{2});
    ASSERT_EQ(opts.size(), 2u);
    EXPECT_EQ(opts.entries()[0].first, "a");
    EXPECT_EQ(opts.get<int>("a"), 2);
    EXPECT_FALSE(opts.setDefault("a", std::int64_t{9}));
    EXPECT_EQ(opts.get<int>("a"), 2);
}

TEST(ParsedOptions, OverlayIsLastWriterWins) {
    ParsedOptions opts;
    opts.set("verbose", true);
    opts.overlay({{"verbose", false}, {"output", std::string("table")}});

    EXPECT_FALSE(opts.get<bool>("verbose", true));
    EXPECT_EQ(opts.get<std::string>("output"), "table");
    ASSERT_EQ(opts.size(), 2u);
    EXPECT_EQ(opts.entries()[0].first, "verbose");
    EXPECT_EQ(opts.entries()[1].first, "output");
}

TEST(ParsedOptions, TypedLookup) {
    ParsedOptions opts;
    opts.set("n", std::int64_t{3});
    opts.set("flag", true);
    EXPECT_DOUBLE_EQ(opts.get<double>("n"), 3.0);
    EXPECT_EQ(opts.get<std::string>("n"), "3");
    EXPECT_EQ(opts.get<bool>("n", true), true);
    EXPECT_EQ(opts.get<int>("missing", 5), 5);
    EXPECT_TRUE(opts.isSet("flag"));
    EXPECT_FALSE(opts.isSet("n"));
}

TEST(ParsedOptions, OutOfRangeIntegerFallsBackToDefault) {
    ParsedOptions opts;
    opts.set("big", std::int64_t{5000000000});
    opts.set("neg", std::int64_t{-1});

    EXPECT_EQ(opts.get<int>("big", -1), -1);
    EXPECT_EQ(opts.get<std::int64_t>("big"), 5000000000);
    EXPECT_EQ(opts.get<unsigned>("neg", 7u), 7u);
    EXPECT_EQ(opts.get<int>("neg"), -1);
    EXPECT_EQ(opts.get<std::uint8_t>("big", std::uint8_t{9}), 9);
    EXPECT_DOUBLE_EQ(opts.get<double>("big"), 5e9);
}

TEST(Terminal, LineLength) {
    using cmdtree::terminal::lineLength;
    EXPECT_EQ(lineLength(std::nullopt), 75u);
    EXPECT_EQ(lineLength(std::optional<std::size_t>(10)), 75u);
    EXPECT_EQ(lineLength(std::optional<std::size_t>(40)), 39u);
    EXPECT_EQ(lineLength(std::optional<std::size_t>(74)), 73u);
    EXPECT_EQ(lineLength(std::optional<std::size_t>(75)), 75u);
    EXPECT_EQ(lineLength(std::optional<std::size_t>(200)), 75u);
}

TEST(Terminal, ColumnsFallBackToEnvironment) {
    using cmdtree::terminal::Stream;
    const char* saved = std::getenv("COLUMNS");
    const std::string previous = saved ? saved : "";

    EXPECT_FALSE(cmdtree::terminal::isTty(Stream::Other));

    ::setenv("COLUMNS", "120", 1);
    EXPECT_EQ(cmdtree::terminal::columns(Stream::Other), std::optional<std::size_t>(120));
    EXPECT_EQ(cmdtree::terminal::lineLength(Stream::Other), 75u);

    ::setenv("COLUMNS", "50", 1);
    EXPECT_EQ(cmdtree::terminal::lineLength(Stream::Other), 49u);

    ::setenv("COLUMNS", "wide", 1);
    EXPECT_FALSE(cmdtree::terminal::columns(Stream::Other).has_value());

    ::unsetenv("COLUMNS");
    EXPECT_FALSE(cmdtree::terminal::columns(Stream::Other).has_value());
    EXPECT_EQ(cmdtree::terminal::lineLength(Stream::Other), 75u);

    if (saved) ::setenv("COLUMNS", previous.c_str(), 1);
}
