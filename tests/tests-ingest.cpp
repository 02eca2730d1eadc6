/*
 * Copyright (C) 2025 The debhost developers
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch_all.hpp>

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <thread>

#include "logging.h"
#include "utils.h"
#include "errors.h"
#include "config.h"
#include "catalog.h"
#include "digests.h"
#include "artifactstore.h"
#include "ingestor.h"
#include "downloader.h"
#include "engine.h"

using namespace DebHost;

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

static std::string samplePath(const std::string &name)
{
    return (Utils::getTestSamplesDir() / "debian" / name).string();
}

static std::size_t countPoolFiles(const fs::path &root)
{
    if (!fs::exists(root / "pool"))
        return 0;

    std::size_t count = 0;
    for (const auto &entry : fs::recursive_directory_iterator(root / "pool")) {
        if (entry.is_regular_file())
            count++;
    }
    return count;
}

/**
 * Temporary repository root and catalog for ingestion tests.
 */
class IngestFixture
{
public:
    IngestFixture()
        : dir(fs::temp_directory_path() / std::format("debhost-ingest-{}", Utils::randomString(8))),
          repoRoot(dir / "public"),
          dbPath(dir / "db" / "catalog.db"),
          store(repoRoot)
    {
        catalog.open(dbPath);
        store.setRetryDelay(std::chrono::milliseconds(1));
    }

    ~IngestFixture()
    {
        catalog.close();
        fs::remove_all(dir);
    }

    fs::path dir;
    fs::path repoRoot;
    fs::path dbPath;
    Catalog catalog;
    ArtifactStore store;
};

TEST_CASE("Ingestor: adding a package", "[ingest]")
{
    IngestFixture fx;
    Ingestor ingestor(fx.catalog, fx.store);

    const auto data = readSample("mytool_1.0.0_amd64.deb");
    const auto result = ingestor.ingest(data, "upload");
    REQUIRE(result.status == IngestStatus::Added);

    const auto &rec = result.record;
    REQUIRE(rec.id() == "mytool/1.0.0/amd64");
    REQUIRE(rec.size == 644);
    REQUIRE(rec.filepath == "pool/43/43241ad69e7da9cdc36f8c19e36076653f9e38994111b40cc890ca7e94f5fa53.deb");
    REQUIRE(Utils::bytesToHex(rec.md5) == "6466befed43cdebef76ecf5d6e9ba9af");
    REQUIRE(Utils::bytesToHex(rec.sha1) == "869b11c3bf3f7bfef555d75147243f03fc98bc77");
    REQUIRE(Utils::bytesToHex(rec.descriptionMd5) == "b364aa2c25c98b26f853c151fda54b74");
    REQUIRE(rec.control.find("Description: A tool\n for testing\n") != std::string::npos);

    // the artifact is stored with exactly the uploaded bytes
    REQUIRE(Utils::getFileContents((fx.repoRoot / rec.filepath).string()) == data);

    const auto stored = fx.catalog.getPackage("mytool", "1.0.0", "amd64");
    REQUIRE(stored.has_value());
    REQUIRE(stored->sha256 == rec.sha256);
    REQUIRE(stored->control == rec.control);
}

TEST_CASE("Ingestor: a rebuilt package with a known version is rejected", "[ingest]")
{
    IngestFixture fx;
    Ingestor ingestor(fx.catalog, fx.store);

    const auto original = ingestor.ingestFile(samplePath("mytool_1.0.0_amd64.deb"));
    REQUIRE_THROWS_AS(ingestor.ingestFile(samplePath("mytool_1.0.0_amd64-rebuilt.deb")), DuplicatePackage);

    // catalog row and stored artifact of the first upload are unchanged
    REQUIRE(fx.catalog.count() == 1);
    const auto stored = fx.catalog.getPackage("mytool", "1.0.0", "amd64");
    REQUIRE(stored->sha256 == original.record.sha256);
    REQUIRE(stored->size == 644);
    REQUIRE(fs::file_size(fx.repoRoot / original.record.filepath) == 644);
    REQUIRE(
        Utils::getFileContents((fx.repoRoot / original.record.filepath).string())
        == readSample("mytool_1.0.0_amd64.deb"));

    // the rejected artifact stays in the pool under its own content address
    const auto rebuilt = computeDigests(readSample("mytool_1.0.0_amd64-rebuilt.deb"));
    REQUIRE(fx.store.exists(ArtifactStore::poolPathFor(rebuilt.sha256Hex())));
}

TEST_CASE("Ingestor: uploading identical bytes twice", "[ingest]")
{
    IngestFixture fx;
    Ingestor ingestor(fx.catalog, fx.store);
    const auto data = readSample("libfoo1_2.1-1_amd64.deb");

    const auto first = ingestor.ingest(data, "first");
    REQUIRE_THROWS_AS(ingestor.ingest(data, "second"), DuplicatePackage);
    REQUIRE(countPoolFiles(fx.repoRoot) == 1);

    SECTION("existing packages can be ignored")
    {
        ingestor.setIgnoreExisting(true);
        REQUIRE(ingestor.ignoreExisting());

        const auto again = ingestor.ingest(data, "third");
        REQUIRE(again.status == IngestStatus::AlreadyPresent);
        REQUIRE(again.record.sha256 == first.record.sha256);

        // an existing package with different bytes is reported with the cataloged data
        ingestor.ingestFile(samplePath("mytool_1.0.0_amd64.deb"));
        const auto rebuilt = ingestor.ingestFile(samplePath("mytool_1.0.0_amd64-rebuilt.deb"));
        REQUIRE(rebuilt.status == IngestStatus::AlreadyPresent);
        REQUIRE(rebuilt.record.size == 644);
        REQUIRE(fx.catalog.count() == 2);
    }
}

TEST_CASE("Ingestor: invalid packages leave no trace", "[ingest]")
{
    IngestFixture fx;
    Ingestor ingestor(fx.catalog, fx.store);

    const auto sample = GENERATE(
        "nodesc_0.1_amd64.deb",
        "nodata_1.0.0_amd64.deb",
        "truncated.deb",
        "garbage.deb",
        "selflink_1.0_amd64.deb",
        "linkcycle_1.0_amd64.deb");
    INFO(sample);

    REQUIRE_THROWS_AS(ingestor.ingestFile(samplePath(sample)), ParseError);
    REQUIRE(fx.catalog.count() == 0);
    REQUIRE(countPoolFiles(fx.repoRoot) == 0);
}

TEST_CASE("Ingestor: ingesting a directory tree", "[ingest]")
{
    IngestFixture fx;
    Ingestor ingestor(fx.catalog, fx.store);

    const auto uploads = fx.dir / "uploads";
    fs::create_directories(uploads / "b" / "c");
    fs::create_directories(uploads / "a");
    fs::create_directories(uploads / "empty");
    fs::copy_file(samplePath("libfoo1_2.1-1_amd64.deb"), uploads / "b" / "c" / "libfoo1_2.1-1_amd64.deb");
    fs::copy_file(samplePath("mytool_1.0.0_amd64.deb"), uploads / "a" / "mytool_1.0.0_amd64.deb");
    {
        std::ofstream f(uploads / "a" / "README");
        f << "not a package";
    }

    const auto results = ingestor.ingestPath(uploads.string());
    REQUIRE(results.size() == 2);
    REQUIRE(results[0].record.id() == "mytool/1.0.0/amd64");
    REQUIRE(results[1].record.id() == "libfoo1/2.1-1/amd64");
    REQUIRE(fx.catalog.count() == 2);

    REQUIRE(ingestor.ingestPath((uploads / "empty").string()).empty());

    // a single file path still works
    REQUIRE(ingestor.ingestPath(samplePath("mytool_1.0.0_arm64.deb")).size() == 1);
    REQUIRE(fx.catalog.count() == 3);

    // a directory is never read as a package file
    REQUIRE_THROWS_AS(ingestor.ingestFile(uploads.string()), StorageError);
    REQUIRE_THROWS_AS(ingestor.ingestDirectory((fx.dir / "no-such-dir").string()), StorageError);

    // a broken package stops the walk with the error of that package
    fs::copy_file(samplePath("garbage.deb"), uploads / "b" / "garbage.deb");
    ingestor.setIgnoreExisting(true);
    REQUIRE_THROWS_AS(ingestor.ingestDirectory(uploads.string()), ParseError);
}

TEST_CASE("Ingestor: expected architecture", "[ingest]")
{
    IngestFixture fx;
    Ingestor ingestor(fx.catalog, fx.store);
    ingestor.setExpectedArchitecture("arm64");

    REQUIRE_THROWS_AS(ingestor.ingestFile(samplePath("mytool_1.0.0_amd64.deb")), ParseError);
    REQUIRE(fx.catalog.count() == 0);
    REQUIRE(countPoolFiles(fx.repoRoot) == 0);

    REQUIRE(ingestor.ingestFile(samplePath("mytool_1.0.0_arm64.deb")).status == IngestStatus::Added);
    REQUIRE(ingestor.ingestFile(samplePath("overrider_3.0_all.deb")).status == IngestStatus::Added);
    REQUIRE(fx.catalog.architectures() == std::vector<std::string>{"all", "arm64"});
}

TEST_CASE("Ingestor: storage failures", "[ingest]")
{
    IngestFixture fx;

    SECTION("unreadable input")
    {
        Ingestor ingestor(fx.catalog, fx.store);
        REQUIRE_THROWS_AS(ingestor.ingestFile((fx.dir / "missing.deb").string()), StorageError);
    }

    SECTION("unreachable remote source")
    {
        Downloader downloader("");
        downloader.setRetryDelay(std::chrono::milliseconds(1));
        Ingestor ingestor(fx.catalog, fx.store);
        ingestor.setDownloader(&downloader);

        // nothing listens on port 1 of the loopback interface
        REQUIRE_THROWS_AS(ingestor.ingestFile("http://127.0.0.1:1/pool/mytool_1.0.0_amd64.deb"), StorageError);
        REQUIRE(fx.catalog.count() == 0);
    }

    SECTION("unwritable pool")
    {
        // a regular file where the pool directory should be
        fs::create_directories(fx.repoRoot);
        {
            std::ofstream f(fx.repoRoot / "pool");
            f << "not a directory";
        }

        ArtifactStore store(fx.repoRoot, 1);
        store.setRetryDelay(std::chrono::milliseconds(1));
        Ingestor ingestor(fx.catalog, store);

        REQUIRE_THROWS_AS(ingestor.ingestFile(samplePath("mytool_1.0.0_amd64.deb")), StorageError);
        REQUIRE(fx.catalog.count() == 0);
    }
}

TEST_CASE("Ingestor: concurrent uploads of the same package", "[ingest]")
{
    IngestFixture fx;
    const auto data = readSample("mytool_1.0.0_amd64.deb");

    constexpr int uploadCount = 2;
    std::atomic_int added = 0;
    std::atomic_int duplicates = 0;
    std::atomic_int failures = 0;

    std::vector<std::thread> threads;
    for (int i = 0; i < uploadCount; ++i) {
        threads.emplace_back([&] {
            // every upload has its own catalog connection, as separate requests would
            Catalog catalog;
            catalog.open(fx.dbPath);
            ArtifactStore store(fx.repoRoot);
            Ingestor ingestor(catalog, store);

            try {
                ingestor.ingest(data, "concurrent upload");
                added++;
            } catch (const DuplicatePackage &) {
                duplicates++;
            } catch (const RepoError &e) {
                logError("Unexpected ingestion failure: {}", e.what());
                failures++;
            }
        });
    }
    for (auto &t : threads)
        t.join();

    REQUIRE(added == 1);
    REQUIRE(duplicates == uploadCount - 1);
    REQUIRE(failures == 0);
    REQUIRE(fx.catalog.count() == 1);
    REQUIRE(countPoolFiles(fx.repoRoot) == 1);
}

TEST_CASE("Engine: processing a single package file", "[ingest][engine]")
{
    IngestFixture fx;
    Config conf;
    conf.repositoryRoot = fx.dir / "repo";
    conf.setWorkspaceDir(fx.dir / "workspace");
    conf.architectures = {"amd64", "arm64"};

    Engine engine(conf);
    const auto result = engine.processFile("amd64", samplePath("mytool_1.0.0_amd64.deb"));
    REQUIRE(result.status == IngestStatus::Added);

    const auto suiteDir = conf.repositoryRoot / "dists" / "stable";
    REQUIRE(fs::is_symlink(suiteDir));
    REQUIRE(fs::file_size(suiteDir / "main" / "binary-amd64" / "Packages") > 0);
    REQUIRE(fs::file_size(suiteDir / "main" / "binary-arm64" / "Packages") == 0);
    REQUIRE(fs::exists(conf.repositoryRoot / result.record.filepath));

    REQUIRE_THROWS_AS(engine.processFile("arm64", samplePath("libfoo1_2.1-1_amd64.deb")), ParseError);
    REQUIRE_THROWS_AS(engine.processFile("amd64", samplePath("mytool_1.0.0_amd64-rebuilt.deb")), DuplicatePackage);

    engine.setIgnoreExisting(true);
    REQUIRE(
        engine.processFile("amd64", samplePath("mytool_1.0.0_amd64-rebuilt.deb")).status
        == IngestStatus::AlreadyPresent);

    const auto results = engine.ingest({samplePath("libfoo1_2.1-1_amd64.deb"), samplePath("mytool_1.0.0_arm64.deb")});
    REQUIRE(results.size() == 2);
    REQUIRE(engine.catalog().count() == 3);

    const auto generated = engine.regenerate();
    REQUIRE(generated.packageCount == 3);

    // directories are searched for packages
    const auto uploads = fx.dir / "uploads";
    fs::create_directories(uploads / "nested");
    fs::copy_file(samplePath("mytool_1.1.0_amd64.deb"), uploads / "nested" / "mytool_1.1.0_amd64.deb");
    const auto dirResults = engine.ingest({uploads.string()});
    REQUIRE(dirResults.size() == 1);
    REQUIRE(dirResults[0].record.id() == "mytool/1.1.0/amd64");
    REQUIRE(engine.catalog().count() == 4);
}

TEST_CASE("Engine: reproducible generation timestamps", "[engine]")
{
    setenv("SOURCE_DATE_EPOCH", "1700000000", 1);
    REQUIRE(Engine::generationTimestamp() == std::chrono::system_clock::time_point(std::chrono::seconds(1700000000)));

    setenv("SOURCE_DATE_EPOCH", "soon", 1);
    const auto before = std::chrono::system_clock::now();
    REQUIRE(Engine::generationTimestamp() >= before);

    unsetenv("SOURCE_DATE_EPOCH");
}
