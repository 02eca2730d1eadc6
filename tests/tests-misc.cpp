/*
 * Copyright (C) 2025 The debhost developers
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch_all.hpp>

#include <fstream>
#include <filesystem>
#include <format>
#include <memory>
#include <thread>

#include "logging.h"
#include "utils.h"
#include "errors.h"
#include "zarchive.h"
#include "digests.h"
#include "config.h"
#include "atomicfile.h"
#include "artifactstore.h"
#include "downloader.h"

using namespace DebHost;
using namespace DebHost::Utils;

static struct TestSetup {
    TestSetup()
    {
        // Enable verbose logging for tests
        setVerbose(true);
    }
} testSetup;

static fs::path createTempDir()
{
    auto dir = fs::temp_directory_path() / std::format("debhost-test-{}", randomString(8));
    fs::create_directories(dir);
    return dir;
}

static std::string readFile(const fs::path &path)
{
    std::ifstream f(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

TEST_CASE("Compressed empty file decompresses to empty string", "[zarchive]")
{
    // gzip-compressed empty file
    std::vector<uint8_t> emptyGz = {
        0x1f, 0x8b, 0x08, 0x08, 0x00, 0x00, 0x00, 0x00, 0x00, 0x03, 0x65, 0x6d, 0x70,
        0x74, 0x79, 0x00, 0x03, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    };
    REQUIRE(decompressData(emptyGz) == "");
}

TEST_CASE("Compressing index data in memory", "[zarchive]")
{
    const std::string text = "Package: mytool\nVersion: 1.0.0\nArchitecture: amd64\n\n";

    SECTION("gzip output is deterministic and decompresses to the input")
    {
        const auto gz1 = compressData(text, ArchiveType::GZIP);
        const auto gz2 = compressData(text, ArchiveType::GZIP);
        REQUIRE(gz1.size() > 10);
        REQUIRE(gz1[0] == 0x1f);
        REQUIRE(gz1[1] == 0x8b);
        REQUIRE(gz1 == gz2);
        REQUIRE(decompressData(gz1) == text);
    }

    SECTION("xz output decompresses to the input")
    {
        const auto xz = compressData(text, ArchiveType::XZ);
        REQUIRE(xz.size() > 6);
        REQUIRE(xz[0] == 0xfd);
        REQUIRE(decompressData(xz) == text);
    }

    SECTION("empty input yields a valid empty stream")
    {
        const auto gz = compressData("", ArchiveType::GZIP);
        REQUIRE_FALSE(gz.empty());
        REQUIRE(decompressData(gz).empty());
    }
}

TEST_CASE("Reading members of a Debian package container", "[zarchive]")
{
    const auto data = getFileContents(getTestSamplesDir() / "debian" / "mytool_1.0.0_amd64.deb");

    ArchiveDecompressor ad;
    ad.openData(data, ArchiveFormat::Ar);
    REQUIRE(ad.isOpen());

    const auto members = ad.readContents();
    REQUIRE(members == std::vector<std::string>{"debian-binary", "control.tar.gz", "data.tar.gz"});

    const auto version = ad.readData("debian-binary");
    REQUIRE(std::string(version.begin(), version.end()) == "2.0\n");

    REQUIRE_THROWS_AS(ad.readData("no-such-member"), std::runtime_error);

    // xz compressed members
    const auto xzData = getFileContents(getTestSamplesDir() / "debian" / "libfoo1_2.1-1_amd64.deb");
    ArchiveDecompressor xzAd;
    xzAd.openData(xzData, ArchiveFormat::Ar);
    REQUIRE(xzAd.readContents() == std::vector<std::string>{"debian-binary", "control.tar.xz", "data.tar.xz"});
    xzAd.close();
    REQUIRE_FALSE(xzAd.isOpen());
    REQUIRE_THROWS_AS(xzAd.readContents(), std::runtime_error);
}

TEST_CASE("Links inside an archive are followed a bounded number of times", "[zarchive]")
{
    const auto debData = getFileContents(getTestSamplesDir() / "debian" / "selflink_1.0_amd64.deb");
    ArchiveDecompressor ad;
    ad.openData(debData, ArchiveFormat::Ar);
    const auto controlTar = ad.readData("control.tar.gz");

    ArchiveDecompressor ca;
    ca.openData(controlTar, ArchiveFormat::Tar);
    REQUIRE(ca.readContents() == std::vector<std::string>{"./control"});
    REQUIRE_THROWS_WITH(ca.readData("./control"), Catch::Matchers::ContainsSubstring("Too many levels of links"));
}

TEST_CASE("Utils: string helpers", "[utils]")
{
    REQUIRE(bytesToHex({0x00, 0x0f, 0xab, 0xff}) == "000fabff");
    REQUIRE(bytesToHex({}).empty());

    REQUIRE(toLower("SHA256") == "sha256");
    REQUIRE(equalsIgnoreCase("MD5sum", "md5SUM"));
    REQUIRE_FALSE(equalsIgnoreCase("MD5sum", "MD5"));

    REQUIRE(trimString("  Value \t") == "Value");
    REQUIRE(rtrimString("  Value \t") == "  Value");

    REQUIRE(splitString("a b c", ' ') == std::vector<std::string>{"a", "b", "c"});
    REQUIRE(joinStrings({"amd64", "arm64"}, " ") == "amd64 arm64");

    REQUIRE(randomString(12).size() == 12);
    REQUIRE(randomString(12) != randomString(12));
}

TEST_CASE("Utils: remote URIs", "[utils]")
{
    REQUIRE(isRemote("https://example.org/pool/a.deb"));
    REQUIRE(isRemote("http://example.org/a.deb"));
    REQUIRE(isRemote("ftp://example.org/a.deb"));
    REQUIRE_FALSE(isRemote("/srv/uploads/a.deb"));
    REQUIRE_FALSE(isRemote("file:///srv/uploads/a.deb"));

    REQUIRE(filenameFromURI("https://example.org/pool/mytool_1.0.0_amd64.deb") == "mytool_1.0.0_amd64.deb");
}

TEST_CASE("Utils: getFileContents reads file data", "[utils]")
{
    const auto tmpDir = createTempDir();
    auto cleanup = [&tmpDir](void *) {
        fs::remove_all(tmpDir);
    };
    std::unique_ptr<void, decltype(cleanup)> guard((void *)1, cleanup);

    const auto fname = tmpDir / "data.bin";
    {
        std::ofstream f(fname, std::ios::binary);
        f << "line1\nline2\n";
    }
    REQUIRE(getFileContents(fname.string()).size() == 12);
    REQUIRE_THROWS_AS(getFileContents((tmpDir / "missing").string()), std::runtime_error);
    REQUIRE_THROWS_AS(getFileContents(tmpDir.string()), std::runtime_error);
}

TEST_CASE("Digests of artifact data", "[digests]")
{
    SECTION("empty input")
    {
        const auto d = computeDigests(std::string_view());
        REQUIRE(d.size == 0);
        REQUIRE(d.md5Hex() == "d41d8cd98f00b204e9800998ecf8427e");
        REQUIRE(d.sha1Hex() == "da39a3ee5e6b4b0d3255bfef95601890afd80709");
        REQUIRE(d.sha256Hex() == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    }

    SECTION("short input")
    {
        const auto d = computeDigests(std::string_view("abc"));
        REQUIRE(d.size == 3);
        REQUIRE(d.md5.size() == 16);
        REQUIRE(d.sha1.size() == 20);
        REQUIRE(d.sha256.size() == 32);
        REQUIRE(d.md5Hex() == "900150983cd24fb0d6963f7d28e17f72");
        REQUIRE(d.sha1Hex() == "a9993e364706816aba3e25717850c26c9cd0d89d");
        REQUIRE(d.sha256Hex() == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    }

    SECTION("package file")
    {
        const auto data = getFileContents(getTestSamplesDir() / "debian" / "mytool_1.0.0_amd64.deb");
        const auto d = computeDigests(data);
        REQUIRE(d.size == 644);
        REQUIRE(d.md5Hex() == "6466befed43cdebef76ecf5d6e9ba9af");
        REQUIRE(d.sha1Hex() == "869b11c3bf3f7bfef555d75147243f03fc98bc77");
        REQUIRE(d.sha256Hex() == "43241ad69e7da9cdc36f8c19e36076653f9e38994111b40cc890ca7e94f5fa53");
    }
}

TEST_CASE("Digest of a package description", "[digests]")
{
    const auto expected = "b364aa2c25c98b26f853c151fda54b74";
    REQUIRE(bytesToHex(computeDescriptionMd5("A tool\n for testing")) == expected);

    // line endings are normalized before hashing
    REQUIRE(bytesToHex(computeDescriptionMd5("A tool\r\n for testing")) == expected);

    REQUIRE(bytesToHex(computeDescriptionMd5("A tool")) != expected);
}

TEST_CASE("Configuration loading", "[config]")
{
    const fs::path baseDir = "/srv/debhost";

    SECTION("defaults")
    {
        Config conf;
        conf.loadFromString(R"({"RepositoryRoot": "public"})", baseDir);

        REQUIRE(conf.isValid());
        REQUIRE(conf.repositoryRoot == baseDir / "public");
        REQUIRE(conf.workspaceDir() == baseDir);
        REQUIRE(conf.databasePath() == baseDir / "db" / "catalog.db");
        REQUIRE(conf.release.suite == "stable");
        REQUIRE(conf.codename() == "stable");
        REQUIRE(conf.component == "main");
        REQUIRE(conf.architectures.empty());
        REQUIRE(conf.storageRetries == 3);
        REQUIRE(conf.validForSeconds == 0);
        REQUIRE(conf.feature.compressIndices);
        REQUIRE_FALSE(conf.signingEnabled());
    }

    SECTION("all settings")
    {
        Config conf;
        conf.loadFromString(
            R"({
                "RepositoryRoot": "/var/www/apt",
                "WorkspaceDir": "state",
                "DatabasePath": "/var/lib/debhost/packages.db",
                "Release": {
                    "Origin": "Example",
                    "Label": "Example Tools",
                    "Suite": "unstable",
                    "Codename": "sid",
                    "Version": "1.0",
                    "Description": "Example tools repository"
                },
                "Component": "tools",
                "Architectures": ["amd64", "arm64"],
                "SignWith": "ABCDEF0123456789",
                "ValidFor": 604800,
                "StorageRetries": 5,
                "Features": {
                    "compressIndices": false,
                    "signRelease": true
                }
            })",
            baseDir);

        REQUIRE(conf.repositoryRoot == "/var/www/apt");
        REQUIRE(conf.workspaceDir() == baseDir / "state");
        REQUIRE(conf.databasePath() == "/var/lib/debhost/packages.db");
        REQUIRE(conf.release.origin == "Example");
        REQUIRE(conf.release.label == "Example Tools");
        REQUIRE(conf.release.suite == "unstable");
        REQUIRE(conf.codename() == "sid");
        REQUIRE(conf.release.version == "1.0");
        REQUIRE(conf.component == "tools");
        REQUIRE(conf.architectures == std::vector<std::string>{"amd64", "arm64"});
        REQUIRE(conf.validForSeconds == 604800);
        REQUIRE(conf.storageRetries == 5);
        REQUIRE_FALSE(conf.feature.compressIndices);
        REQUIRE(conf.signingEnabled());
    }

    SECTION("invalid settings are rejected")
    {
        Config conf;
        REQUIRE_THROWS(conf.loadFromString(R"({"Component": "main"})", baseDir));
        REQUIRE_THROWS(conf.loadFromString(R"({"RepositoryRoot": "r", "Release": {"Suite": "../x"}})", baseDir));
        REQUIRE_THROWS(conf.loadFromString(R"({"RepositoryRoot": "r", "Architectures": ["amd 64"]})", baseDir));
        REQUIRE_THROWS(conf.loadFromString(R"({"RepositoryRoot": "r", "StorageRetries": 99})", baseDir));
        REQUIRE_THROWS(conf.loadFromString(R"({"RepositoryRoot": "r", "ValidFor": -1})", baseDir));
        REQUIRE_THROWS(conf.loadFromString("[1, 2]", baseDir));
    }
}

TEST_CASE("Atomic file replacement", "[atomicfile]")
{
    const auto tmpDir = createTempDir();
    auto cleanup = [&tmpDir](void *) {
        fs::remove_all(tmpDir);
    };
    std::unique_ptr<void, decltype(cleanup)> guard((void *)1, cleanup);

    const auto target = tmpDir / "Packages";

    SECTION("committed data replaces the target")
    {
        writeFileAtomically(target, std::string_view("old\n"));
        REQUIRE(readFile(target) == "old\n");

        AtomicFile af(target);
        af.write(std::string_view("new "));
        af.write(std::string_view("data\n"));

        // nothing is visible before the commit
        REQUIRE(readFile(target) == "old\n");
        REQUIRE(fs::exists(af.tmpPath()));

        af.commit();
        REQUIRE(readFile(target) == "new data\n");
        REQUIRE_FALSE(fs::exists(af.tmpPath()));
    }

    SECTION("uncommitted data is discarded")
    {
        fs::path tmpPath;
        {
            AtomicFile af(target);
            af.write(std::string_view("partial"));
            tmpPath = af.tmpPath();
        }
        REQUIRE_FALSE(fs::exists(target));
        REQUIRE_FALSE(fs::exists(tmpPath));
        REQUIRE(fs::is_empty(tmpDir));
    }

    SECTION("a missing target directory is an error")
    {
        REQUIRE_THROWS(writeFileAtomically(tmpDir / "missing" / "file", std::string_view("x")));
    }
}

TEST_CASE("Content-addressed artifact storage", "[artifactstore]")
{
    const auto tmpDir = createTempDir();
    auto cleanup = [&tmpDir](void *) {
        fs::remove_all(tmpDir);
    };
    std::unique_ptr<void, decltype(cleanup)> guard((void *)1, cleanup);

    const auto data = getFileContents(getTestSamplesDir() / "debian" / "mytool_1.0.0_amd64.deb");
    const auto digests = computeDigests(data);

    ArtifactStore store(tmpDir, 2);
    store.setRetryDelay(std::chrono::milliseconds(1));

    REQUIRE(
        ArtifactStore::poolPathFor(digests.sha256Hex())
        == "pool/43/43241ad69e7da9cdc36f8c19e36076653f9e38994111b40cc890ca7e94f5fa53.deb");
    REQUIRE_THROWS_AS(ArtifactStore::poolPathFor("../etc/passwd"), StorageError);
    REQUIRE_THROWS_AS(ArtifactStore::poolPathFor(std::string(64, 'A')), StorageError);

    const auto relPath = store.store(data, digests);
    REQUIRE(relPath == ArtifactStore::poolPathFor(digests.sha256Hex()));
    REQUIRE(store.exists(relPath));
    REQUIRE(fs::file_size(store.absolutePath(relPath)) == data.size());
    REQUIRE(getFileContents(store.absolutePath(relPath).string()) == data);

    // storing identical bytes again is a no-op
    const auto mtime = fs::last_write_time(store.absolutePath(relPath));
    REQUIRE(store.store(data, digests) == relPath);
    REQUIRE(fs::last_write_time(store.absolutePath(relPath)) == mtime);

    // digests that do not describe the data are refused
    auto wrongDigests = digests;
    wrongDigests.size = 1;
    REQUIRE_THROWS_AS(store.store(data, wrongDigests), StorageError);
}

TEST_CASE("Downloader: failed transfers are retried and reported", "[downloader]")
{
    Downloader downloader("");
    downloader.setRetryDelay(std::chrono::milliseconds(1));

    REQUIRE_THROWS_AS(downloader.download("http://127.0.0.1:1/dists/stable/Release", 2), DownloadException);
    REQUIRE_THROWS_AS(getFileContents("http://127.0.0.1:1/pool/a.deb", 1, &downloader), DownloadException);
}

TEST_CASE("Downloader: each thread has its own shared instance", "[downloader]")
{
    Downloader *mainInstance = &Downloader::get();
    REQUIRE(&Downloader::get() == mainInstance);

    Downloader *first = nullptr;
    Downloader *second = nullptr;
    std::thread t1([&first]() {
        first = &Downloader::get();
    });
    std::thread t2([&second]() {
        second = &Downloader::get();
    });
    t1.join();
    t2.join();

    REQUIRE(first != nullptr);
    REQUIRE(second != nullptr);
    REQUIRE(first != mainInstance);
    REQUIRE(second != mainInstance);
}
