/*
 * Copyright (C) 2025 The debhost developers
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch_all.hpp>

#include <filesystem>
#include <string>
#include <vector>

#include "logging.h"
#include "utils.h"
#include "errors.h"
#include "debian/tagfile.h"
#include "debian/debfile.h"
#include "debian/debutils.h"

using namespace DebHost;
namespace fs = std::filesystem;

static struct TestSetup {
    TestSetup()
    {
        setVerbose(true);
    }
} testSetup;

static std::vector<std::uint8_t> readSample(const std::string &name)
{
    return Utils::getFileContents(Utils::getTestSamplesDir() / "debian" / name);
}

TEST_CASE("ControlStanza: parse and render", "[debian][tagfile]")
{
    const std::string text =
        "Package: libfoo1\n"
        "Version: 2.1-1\n"
        "Architecture: amd64\n"
        "Depends: libc6 (>= 2.34)\n"
        "Description: Foo library\n"
        " The foo library provides foo.\n"
        " .\n"
        " It is quite useful.\n";

    const auto stanza = parseControlStanza(text);
    REQUIRE(stanza.size() == 5);
    REQUIRE(stanza.fields()[0].first == "Package");
    REQUIRE(stanza.fields()[3].first == "Depends");
    REQUIRE(stanza.readField("Depends") == "libc6 (>= 2.34)");
    REQUIRE(stanza.readField("Description") == "Foo library\n The foo library provides foo.\n .\n It is quite useful.");

    // rendering preserves every value and the field order
    REQUIRE(stanza.render() == text);
}

TEST_CASE("ControlStanza: field access and modification", "[debian][tagfile]")
{
    auto stanza = parseControlStanza("Package: mytool\nMD5sum: 0000\nVersion: 1.0\n");

    REQUIRE(stanza.hasField("package"));
    REQUIRE(stanza.readField("PACKAGE") == "mytool");
    REQUIRE_FALSE(stanza.field("Filename").has_value());
    REQUIRE(stanza.readField("Filename", "none") == "none");

    REQUIRE(stanza.remove("md5SUM"));
    REQUIRE_FALSE(stanza.remove("MD5sum"));
    REQUIRE_THROWS_AS(stanza.append("package", "other"), ParseError);

    stanza.append("Filename", "pool/ab/ab.deb");
    REQUIRE(stanza.render() == "Package: mytool\nVersion: 1.0\nFilename: pool/ab/ab.deb\n");
}

TEST_CASE("TagFile: control syntax", "[debian][tagfile]")
{
    SECTION("CRLF line endings and comments")
    {
        const auto stanza = parseControlStanza("# generated\r\nPackage: a0\r\nDescription: x\r\n y\r\n");
        REQUIRE(stanza.size() == 2);
        REQUIRE(stanza.readField("Description") == "x\n y");
    }

    SECTION("missing trailing newline")
    {
        const auto stanza = parseControlStanza("Package: a0\nVersion: 1");
        REQUIRE(stanza.readField("Version") == "1");
    }

    SECTION("empty first line of a multi-line value")
    {
        const auto stanza = parseControlStanza("Package: a0\nConffiles:\n /etc/a0.conf 1234\n");
        REQUIRE(stanza.readField("Conffiles") == "\n /etc/a0.conf 1234");
        REQUIRE(stanza.render() == "Package: a0\nConffiles:\n /etc/a0.conf 1234\n");
    }

    SECTION("malformed data")
    {
        REQUIRE_THROWS_AS(parseControlStanza(" leading continuation\n"), ParseError);
        REQUIRE_THROWS_AS(parseControlStanza("Package: a0\nno separator here\n"), ParseError);
        REQUIRE_THROWS_AS(parseControlStanza("Package: a0\n: empty name\n"), ParseError);
        REQUIRE_THROWS_AS(parseControlStanza("Package: a0\nBad Name: x\n"), ParseError);
        REQUIRE_THROWS_AS(parseControlStanza("Package: a0\npackage: a1\n"), ParseError);
        REQUIRE_THROWS_AS(parseControlStanza("Package: a0\n\nPackage: a1\n"), ParseError);
        REQUIRE_THROWS_AS(parseControlStanza("\n\n"), ParseError);
    }
}

TEST_CASE("TagFile: iterating stanzas", "[debian][tagfile]")
{
    TagFile tf;
    tf.load("Package: one\nVersion: 1\n\n\nPackage: two\nVersion: 2\n \nPackage: three\nVersion: 3\n\n");

    std::vector<std::string> names;
    do {
        names.push_back(tf.readField("Package"));
    } while (tf.nextSection());

    REQUIRE(names == std::vector<std::string>{"one", "two", "three"});
    REQUIRE(tf.eof());
}

TEST_CASE("DebFile: reading control information", "[debian][debfile]")
{
    SECTION("gzip-compressed members")
    {
        const auto data = readSample("mytool_1.0.0_amd64.deb");
        DebFile deb(data);
        const auto stanza = deb.readControlInformation();

        REQUIRE(deb.controlMemberName() == "control.tar.gz");
        REQUIRE(deb.dataMemberName() == "data.tar.gz");
        REQUIRE(stanza.readField("Package") == "mytool");
        REQUIRE(stanza.readField("Version") == "1.0.0");
        REQUIRE(stanza.readField("Architecture") == "amd64");
        REQUIRE(stanza.readField("Section") == "utils");
        REQUIRE(stanza.readField("Description") == "A tool\n for testing");
        REQUIRE(
            stanza.render()
            == "Package: mytool\n"
               "Version: 1.0.0\n"
               "Architecture: amd64\n"
               "Maintainer: Test Maintainer <test@example.org>\n"
               "Section: utils\n"
               "Priority: optional\n"
               "Description: A tool\n"
               " for testing\n");
    }

    SECTION("xz-compressed members")
    {
        const auto data = readSample("libfoo1_2.1-1_amd64.deb");
        DebFile deb(data);
        const auto stanza = deb.readControlInformation();

        REQUIRE(deb.controlMemberName() == "control.tar.xz");
        REQUIRE(deb.dataMemberName() == "data.tar.xz");
        REQUIRE(stanza.readField("Package") == "libfoo1");
        REQUIRE(stanza.readField("Multi-Arch") == "same");
        REQUIRE(
            stanza.readField("Description")
            == "Foo library\n The foo library provides foo.\n .\n It is quite useful.");
    }

    SECTION("the raw control text is preserved")
    {
        const auto data = readSample("overrider_3.0_all.deb");
        DebFile deb(data);
        const auto text = deb.readControlText();
        REQUIRE(text.find("Filename: pool/evil/overrider.deb\n") != std::string::npos);
        REQUIRE(deb.readControlInformation().readField("Architecture") == "all");
    }
}

TEST_CASE("DebFile: invalid packages", "[debian][debfile]")
{
    SECTION("missing Description")
    {
        const auto data = readSample("nodesc_0.1_amd64.deb");
        DebFile deb(data);
        REQUIRE_THROWS_AS(deb.readControlInformation(), ParseError);
    }

    SECTION("missing data member")
    {
        const auto data = readSample("nodata_1.0.0_amd64.deb");
        DebFile deb(data);
        REQUIRE_THROWS_AS(deb.open(), ParseError);
    }

    SECTION("truncated container")
    {
        const auto data = readSample("truncated.deb");
        DebFile deb(data);
        REQUIRE_THROWS_AS(deb.readControlInformation(), ParseError);
    }

    SECTION("control file linking to itself")
    {
        const auto data = readSample("selflink_1.0_amd64.deb");
        DebFile deb(data);
        REQUIRE_THROWS_AS(deb.readControlInformation(), ParseError);
    }

    SECTION("control file in a link cycle")
    {
        const auto data = readSample("linkcycle_1.0_amd64.deb");
        DebFile deb(data);
        REQUIRE_THROWS_AS(deb.readControlInformation(), ParseError);
    }

    SECTION("not an archive")
    {
        const auto data = readSample("garbage.deb");
        DebFile deb(data);
        REQUIRE_THROWS_AS(deb.readControlInformation(), ParseError);
    }

    SECTION("empty input")
    {
        const std::vector<std::uint8_t> data;
        DebFile deb(data);
        REQUIRE_THROWS_AS(deb.readControlInformation(), ParseError);
    }
}

TEST_CASE("Debian version comparison", "[debian][debutils]")
{
    REQUIRE(compareVersions("1.0.0", "1.0.0") == 0);
    REQUIRE(compareVersions("1.0.0", "1.1.0") < 0);
    REQUIRE(compareVersions("1.10", "1.9") > 0);
    REQUIRE(compareVersions("1.0.0~rc1", "1.0.0") < 0);
    REQUIRE(compareVersions("1.0~~", "1.0~") < 0);
    REQUIRE(compareVersions("1.0+b1", "1.0") > 0);
    REQUIRE(compareVersions("1:0.1", "2.0") > 0);
    REQUIRE(compareVersions("2.1-1", "2.1-10") < 0);
    REQUIRE(compareVersions("2.1-1", "2.1") > 0);
    REQUIRE(compareVersions("1.0a", "1.0") > 0);
    REQUIRE(compareVersions("1.0", "1.0-0") == 0);
    REQUIRE(compareVersions("0:1.0", "1.0") == 0);
}

TEST_CASE("Debian names and versions", "[debian][debutils]")
{
    REQUIRE(isValidPackageName("mytool"));
    REQUIRE(isValidPackageName("libstdc++6"));
    REQUIRE(isValidPackageName("0ad"));
    REQUIRE_FALSE(isValidPackageName("a"));
    REQUIRE_FALSE(isValidPackageName("MyTool"));
    REQUIRE_FALSE(isValidPackageName("-tool"));
    REQUIRE_FALSE(isValidPackageName("my_tool"));

    REQUIRE(isValidVersion("1.0.0"));
    REQUIRE(isValidVersion("1:2.1-1+b1"));
    REQUIRE(isValidVersion("1.0.0~rc1"));
    REQUIRE_FALSE(isValidVersion(""));
    REQUIRE_FALSE(isValidVersion("1.0 beta"));
    REQUIRE_FALSE(isValidVersion("a1.0"));
}
