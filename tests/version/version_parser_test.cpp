#include "vsync/version/parser.hpp"
#include "vsync/version/version.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

using vsync::ErrorKind;
using vsync::version::VersionParser;
using vsync::version::VersionSpec;

namespace {

VersionSpec parse_or_die(const std::string& text) {
    VersionParser parser;
    auto result = parser.parse(text);
    EXPECT_TRUE(result.is_ok()) << text << ": " << (result.is_error() ? result.error().message : "");
    return result.is_ok() ? result.value() : VersionSpec();
}

} // namespace

TEST(VersionParserTest, ParsesThreeComponents) {
    const auto v = parse_or_die("1.2.3");
    ASSERT_EQ(v.components().size(), 3u);
    EXPECT_EQ(v.component(0), 1u);
    EXPECT_EQ(v.component(1), 2u);
    EXPECT_EQ(v.component(2), 3u);
    EXPECT_FALSE(v.has_label());
    EXPECT_EQ(v.to_string(), "1.2.3");
}

TEST(VersionParserTest, KeepsLeadingZerosButComparesNumerically) {
    const auto v = parse_or_die("1.02.7");
    EXPECT_EQ(v.to_string(), "1.02.7");
    EXPECT_EQ(v.component(1), 2u);
    EXPECT_EQ(v, parse_or_die("1.2.7"));
}

TEST(VersionParserTest, AcceptsLeadingV) {
    const auto v = parse_or_die("v2.0.0");
    EXPECT_EQ(v.prefix(), "v");
    EXPECT_EQ(v.to_string(), "v2.0.0");
    EXPECT_EQ(v, parse_or_die("2.0.0"));
}

TEST(VersionParserTest, TrimsSurroundingWhitespace) {
    EXPECT_EQ(parse_or_die("  1.4.2\n").to_string(), "1.4.2");
}

TEST(VersionParserTest, CapturesSuffixVerbatim) {
    const auto pre = parse_or_die("1.2.3-rc.1");
    EXPECT_EQ(pre.label(), "-rc.1");
    EXPECT_EQ(pre.to_string(), "1.2.3-rc.1");

    const auto build = parse_or_die("1.2.3+build.7");
    EXPECT_EQ(build.label(), "+build.7");
}

TEST(VersionParserTest, RejectsMalformedInput) {
    VersionParser parser;
    for (const std::string text : {"", "1.2", "abc", "1.2.3 extra", "v", "1..2.3"}) {
        auto result = parser.parse(text);
        ASSERT_TRUE(result.is_error()) << "'" << text << "' should not parse";
        EXPECT_TRUE(result.error().is(ErrorKind::Parse));
    }
}

TEST(VersionParserTest, RejectsOverflowingComponent) {
    VersionParser parser;
    auto result = parser.parse("99999999999999999999.0.0");
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(result.error().is(ErrorKind::Parse));
}

TEST(VersionParserTest, FormatRoundTrips) {
    VersionParser parser;
    for (const std::string text : {"0.0.1", "1.02.7", "v3.4.5", "10.20.30-alpha.1", "1.0.0+20240101"}) {
        const auto first = parse_or_die(text);
        auto again = parser.parse(vsync::version::format(first));
        ASSERT_TRUE(again.is_ok()) << text;
        EXPECT_EQ(again.value(), first);
        EXPECT_EQ(again.value().to_string(), text);
    }
}

TEST(VersionOrderingTest, ExampleChain) {
    EXPECT_LT(parse_or_die("1.2.3-rc.1"), parse_or_die("1.2.3"));
    EXPECT_LT(parse_or_die("1.2.3"), parse_or_die("1.2.4"));
    EXPECT_LT(parse_or_die("1.2.4"), parse_or_die("1.10.0"));
    EXPECT_GT(parse_or_die("2.0.0"), parse_or_die("1.99.99"));
}

TEST(VersionOrderingTest, MissingTrailingComponentsAreZero) {
    EXPECT_EQ(VersionSpec::from_numbers({1, 2}), VersionSpec::from_numbers({1, 2, 0}));
    EXPECT_LT(VersionSpec::from_numbers({1, 2}), VersionSpec::from_numbers({1, 2, 1}));
}

TEST(VersionOrderingTest, LabelsBreakTies) {
    EXPECT_LT(parse_or_die("1.0.0-alpha"), parse_or_die("1.0.0-beta"));
    EXPECT_EQ(parse_or_die("1.0.0-beta").compare(parse_or_die("1.0.0-beta")), 0);
}

TEST(VersionOrderingTest, TotalAndTransitive) {
    std::vector<VersionSpec> versions;
    for (const std::string text : {"1.10.0", "1.2.3", "0.9.9", "1.2.3-rc.2", "1.2.3-rc.1", "2.0.0", "1.2.10", "v1.2.4"}) {
        versions.push_back(parse_or_die(text));
    }
    std::sort(versions.begin(), versions.end());
    ASSERT_TRUE(std::is_sorted(versions.begin(), versions.end()));

    for (std::size_t i = 0; i < versions.size(); ++i) {
        for (std::size_t j = 0; j < versions.size(); ++j) {
            const int forward = versions[i].compare(versions[j]);
            const int backward = versions[j].compare(versions[i]);
            EXPECT_EQ(forward, -backward);
            if (i < j) {
                EXPECT_LE(forward, 0);
            }
        }
    }

    EXPECT_EQ(versions.front().to_string(), "0.9.9");
    EXPECT_EQ(versions.back().to_string(), "2.0.0");
}

TEST(VersionFindTest, ReportsOffsetAndLength) {
    VersionParser parser;
    auto found = parser.find("version = \"1.4.2\"\n");
    ASSERT_TRUE(found.is_ok());
    EXPECT_EQ(found.value().raw, "1.4.2");
    EXPECT_EQ(found.value().offset, 11u);
    EXPECT_EQ(found.value().length, 5u);
}

TEST(VersionFindTest, FirstOccurrenceWins) {
    VersionParser parser;
    auto found = parser.find("from 1.0.0 to 2.0.0");
    ASSERT_TRUE(found.is_ok());
    EXPECT_EQ(found.value().spec, parse_or_die("1.0.0"));
}

TEST(VersionFindTest, StartSkipsEarlierOccurrences) {
    VersionParser parser;
    auto found = parser.find("from 1.0.0 to 2.0.0", 6);
    ASSERT_TRUE(found.is_ok());
    EXPECT_EQ(found.value().raw, "2.0.0");
    EXPECT_EQ(found.value().offset, 14u);
}

TEST(VersionFindTest, NoVersionIsParseError) {
    VersionParser parser;
    auto found = parser.find("nothing to see here");
    ASSERT_TRUE(found.is_error());
    EXPECT_TRUE(found.error().is(ErrorKind::Parse));
}

TEST(VersionFindTest, MatchAtRequiresVersionAtPosition) {
    VersionParser parser;
    const std::string text = "x=1.2.3;";
    auto hit = parser.match_at(text, 2);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->raw, "1.2.3");
    EXPECT_EQ(hit->offset, 2u);
    EXPECT_FALSE(parser.match_at(text, 0).has_value());
    EXPECT_FALSE(parser.match_at(text, 100).has_value());
}

TEST(VersionParserCreateTest, InvalidPatternIsConfigError) {
    auto parser = VersionParser::create("([0-9]+");
    ASSERT_TRUE(parser.is_error());
    EXPECT_TRUE(parser.error().is(ErrorKind::Config));
}

TEST(VersionParserCreateTest, PermissivePatternDropsTrailingDot) {
    auto parser = VersionParser::create(R"(([0-9]+\.?){3})");
    ASSERT_TRUE(parser.is_ok());

    auto found = parser.value().find("Released 1.2.3.");
    ASSERT_TRUE(found.is_ok());
    EXPECT_EQ(found.value().raw, "1.2.3");

    auto parsed = parser.value().parse("4.5.6");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value(), VersionSpec::from_numbers({4, 5, 6}));
}

TEST(VersionParserCreateTest, ContextPatternYieldsEmbeddedVersion) {
    auto parser = VersionParser::create(R"(version.: \d\.\d\.\d)");
    ASSERT_TRUE(parser.is_ok());

    const std::string text = "info:\n  version: 1.2.3\n";
    auto found = parser.value().find(text);
    ASSERT_TRUE(found.is_ok()) << found.error().message;
    EXPECT_EQ(found.value().raw, "1.2.3");
    EXPECT_EQ(found.value().offset, text.find("1.2.3"));
    EXPECT_EQ(found.value().length, 5u);
}

TEST(VersionParserCreateTest, CaptureGroupSelectsVersion) {
    auto parser = VersionParser::create(R"(appVersion: "?([0-9]+\.[0-9]+)\b)");
    ASSERT_TRUE(parser.is_ok());

    const std::string text = "name: web\nappVersion: \"1.5\"\n";
    auto found = parser.value().find(text);
    ASSERT_TRUE(found.is_ok());
    EXPECT_EQ(found.value().raw, "1.5");
    EXPECT_EQ(found.value().offset, text.find("1.5"));
    EXPECT_EQ(found.value().spec, VersionSpec::from_numbers({1, 5}));
}

TEST(VersionParserCreateTest, ContextPatternPrefersDottedRun) {
    auto parser = VersionParser::create(R"(python3 runtime [0-9.]+)");
    ASSERT_TRUE(parser.is_ok());

    auto found = parser.value().find("requires python3 runtime 3.11.2\n");
    ASSERT_TRUE(found.is_ok());
    EXPECT_EQ(found.value().raw, "3.11.2");
}

TEST(VersionFindTest, LongLabelIsScannedWithoutRegex) {
    VersionParser parser;
    const std::string label(60000, 'a');

    auto found = parser.find("version = 1.2.3-" + label + "\n");
    ASSERT_TRUE(found.is_ok());
    EXPECT_EQ(found.value().offset, 10u);
    EXPECT_EQ(found.value().length, 6u + label.size());
    EXPECT_EQ(found.value().spec.label(), "-" + label);

    auto parsed = parser.parse("1.2.3+" + label);
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().label(), "+" + label);

    auto at = parser.match_at("x=1.2.3-" + label, 2);
    ASSERT_TRUE(at.has_value());
    EXPECT_EQ(at->length, 6u + label.size());
}

TEST(VersionFindTest, SentenceDotAfterLabelIsDropped) {
    VersionParser parser;
    auto found = parser.find("Shipped 2.0.0-rc.1.");
    ASSERT_TRUE(found.is_ok());
    EXPECT_EQ(found.value().raw, "2.0.0-rc.1");
}
