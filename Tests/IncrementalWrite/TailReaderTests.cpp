#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "VFSTestHelpers.h"
#include "IncrementalWrite/TailReader.h"

using namespace Inkwell::Core::IO;
using inkwell::test_helpers::FaultInjectingBackend;
using inkwell::test_helpers::ScopedTempDir;
using inkwell::test_helpers::ScopedTestLogger;
using inkwell::test_helpers::writeAllBytes;

namespace {

// Lowercase filler that never contains 'Q'
std::string filler(size_t n) {
    std::string s(n, 'a');
    for (size_t i = 0; i < n; ++i) s[i] = static_cast<char>('a' + (i * 7) % 26);
    return s;
}

WriteConfig chunkedConfig() {
    WriteConfig cfg;
    cfg.fullReadCeilingBytes = 0;   // force chunked mode for anything larger than the small-content threshold
    return cfg;
}

} // namespace

TEST(TailReader, SmallFileComparedWhole) {
    ScopedTempDir tmp;
    ScopedTestLogger log;
    LocalFileSystemBackend backend;
    WriteConfig cfg;
    TailReader reader(backend, cfg, log.logger());

    auto p = tmp.join("small.txt");
    writeAllBytes(p, "hello world");

    TailScanResult r;
    auto h = reader.scan(p.string(), 11, "world peace", cfg.initialChunkSize, r);
    ASSERT_EQ(h.status(), FileOpStatus::Complete) << h.errorInfo().message;
    EXPECT_EQ(r.overlap, 5u);
    EXPECT_EQ(r.mode, TailScanMode::WholeWindow);
    ASSERT_EQ(r.windows.size(), 1u);
    EXPECT_EQ(r.windows[0], 11u);
    EXPECT_FALSE(r.fellBack);
}

TEST(TailReader, HashedWindowHonoursConfiguredMinimumLength) {
    ScopedTempDir tmp;
    ScopedTestLogger log;
    LocalFileSystemBackend backend;

    auto p = tmp.join("short-overlap.txt");
    const std::string existing = filler(100) + "xy";
    writeAllBytes(p, existing);

    // Chunk 8 gives a 32-byte small threshold, so the 102-byte window goes through hashOverlap
    for (size_t minHash : {size_t{1}, size_t{4}, size_t{64}, size_t{500}}) {
        WriteConfig cfg;
        cfg.minHashOverlap = minHash;
        TailReader reader(backend, cfg, log.logger());

        TailScanResult r;
        auto h = reader.scan(p.string(), existing.size(), "xyQQQQ", 8, r);
        ASSERT_EQ(h.status(), FileOpStatus::Complete) << h.errorInfo().message;
        EXPECT_EQ(r.mode, TailScanMode::WholeWindow);
        EXPECT_EQ(r.overlap, 2u) << "minHashOverlap " << minHash;
    }
}

TEST(TailReader, LargeFileWithSmallContentReadsOnlyContentLength) {
    ScopedTempDir tmp;
    ScopedTestLogger log;
    FaultInjectingBackend backend;
    WriteConfig cfg;
    cfg.fullReadCeilingBytes = 100;
    TailReader reader(backend, cfg, log.logger());

    auto p = tmp.join("big.txt");
    const std::string existing = filler(1000) + "hello world";
    writeAllBytes(p, existing);

    TailScanResult r;
    auto h = reader.scan(p.string(), existing.size(), "world peace", cfg.initialChunkSize, r);
    ASSERT_EQ(h.status(), FileOpStatus::Complete);
    EXPECT_EQ(r.overlap, 5u);
    EXPECT_EQ(r.mode, TailScanMode::WholeWindow);
    ASSERT_EQ(backend.reads().size(), 1u);
    EXPECT_EQ(backend.reads()[0].offset, existing.size() - 11);
    ASSERT_TRUE(backend.reads()[0].length.has_value());
    EXPECT_EQ(*backend.reads()[0].length, 11u);
}

TEST(TailReader, ChunkedWindowDoublesUntilOverlapFound) {
    ScopedTempDir tmp;
    ScopedTestLogger log;
    LocalFileSystemBackend backend;
    WriteConfig cfg = chunkedConfig();
    TailReader reader(backend, cfg, log.logger());

    // The only 'Q' in the file starts the shared run, so the overlap is exactly its length
    const std::string shared = "Q" + filler(299);
    const std::string existing = filler(2000) + shared;
    const std::string content = shared + "Q continues here";
    auto p = tmp.join("grow.txt");
    writeAllBytes(p, existing);

    TailScanResult r;
    auto h = reader.scan(p.string(), existing.size(), content, 16, r);
    ASSERT_EQ(h.status(), FileOpStatus::Complete);
    EXPECT_EQ(r.mode, TailScanMode::Chunked);
    EXPECT_EQ(r.overlap, shared.size());
    EXPECT_EQ(r.windows, (std::vector<size_t>{16, 32, 64, 128, 256, 512}));
}

TEST(TailReader, ChunkedGrowthIsCappedAtMaxChunkSize) {
    ScopedTempDir tmp;
    ScopedTestLogger log;
    LocalFileSystemBackend backend;
    WriteConfig cfg = chunkedConfig();
    cfg.maxChunkSize = 200;
    TailReader reader(backend, cfg, log.logger());

    const std::string existing = filler(5000);
    const std::string content = "Q" + filler(100);
    auto p = tmp.join("cap.txt");
    writeAllBytes(p, existing);

    TailScanResult r;
    auto h = reader.scan(p.string(), existing.size(), content, 16, r);
    ASSERT_EQ(h.status(), FileOpStatus::Complete);
    EXPECT_EQ(r.overlap, 0u);
    EXPECT_EQ(r.windows, (std::vector<size_t>{16, 32, 64, 128, 200}));
}

TEST(TailReader, ChunkedGrowthStopsAfterMaxIterations) {
    ScopedTempDir tmp;
    ScopedTestLogger log;
    LocalFileSystemBackend backend;
    WriteConfig cfg = chunkedConfig();
    cfg.maxGrowthIterations = 2;
    TailReader reader(backend, cfg, log.logger());

    const std::string existing = filler(5000);
    const std::string content = "Q" + filler(100);
    auto p = tmp.join("iters.txt");
    writeAllBytes(p, existing);

    TailScanResult r;
    ASSERT_EQ(reader.scan(p.string(), existing.size(), content, 16, r).status(), FileOpStatus::Complete);
    EXPECT_EQ(r.overlap, 0u);
    EXPECT_EQ(r.windows, (std::vector<size_t>{16, 32, 64}));
}

TEST(TailReader, WindowGrowthIsMonotonicDoubling) {
    ScopedTempDir tmp;
    ScopedTestLogger log;
    LocalFileSystemBackend backend;
    WriteConfig cfg = chunkedConfig();
    cfg.maxChunkSize = 3000;
    TailReader reader(backend, cfg, log.logger());

    const std::string existing = filler(100000);
    const std::string content = "Q" + filler(500);
    auto p = tmp.join("mono.txt");
    writeAllBytes(p, existing);

    TailScanResult r;
    ASSERT_EQ(reader.scan(p.string(), existing.size(), content, 24, r).status(), FileOpStatus::Complete);
    ASSERT_FALSE(r.windows.empty());
    EXPECT_LE(r.windows.size() - 1, cfg.maxGrowthIterations);
    for (size_t i = 1; i < r.windows.size(); ++i) {
        EXPECT_EQ(r.windows[i], std::min<size_t>(r.windows[i - 1] * 2, cfg.maxChunkSize));
    }
}

TEST(TailReader, StopsGrowingOnceWindowCoversFile) {
    ScopedTempDir tmp;
    ScopedTestLogger log;
    LocalFileSystemBackend backend;
    WriteConfig cfg = chunkedConfig();
    TailReader reader(backend, cfg, log.logger());

    const std::string existing = filler(100);
    const std::string content = "Q" + filler(199);
    auto p = tmp.join("covered.txt");
    writeAllBytes(p, existing);

    TailScanResult r;
    ASSERT_EQ(reader.scan(p.string(), existing.size(), content, 16, r).status(), FileOpStatus::Complete);
    EXPECT_EQ(r.overlap, 0u);
    EXPECT_EQ(r.windows, (std::vector<size_t>{16, 32, 64, 128}));
}

TEST(TailReader, WholeReadFailureFallsBackToChunked) {
    ScopedTempDir tmp;
    ScopedTestLogger log;
    FaultInjectingBackend backend;
    backend.failWholeReads = true;
    WriteConfig cfg;
    TailReader reader(backend, cfg, log.logger());

    auto p = tmp.join("fallback.txt");
    writeAllBytes(p, "hello world");

    TailScanResult r;
    auto h = reader.scan(p.string(), 11, "world peace", cfg.initialChunkSize, r);
    ASSERT_EQ(h.status(), FileOpStatus::Complete) << h.errorInfo().message;
    EXPECT_TRUE(r.fellBack);
    EXPECT_EQ(r.mode, TailScanMode::Chunked);
    EXPECT_EQ(r.overlap, 5u);
    EXPECT_GE(log.sink().count(Inkwell::Core::Logging::LogLevel::Warning), 1u);
    EXPECT_TRUE(log.sink().contains("switching to chunked reads"));
}

TEST(TailReader, ChunkedReadFailurePropagates) {
    ScopedTempDir tmp;
    ScopedTestLogger log;
    FaultInjectingBackend backend;
    backend.failReadsAfter = 0;
    WriteConfig cfg = chunkedConfig();
    TailReader reader(backend, cfg, log.logger());

    const std::string existing = filler(4000);
    auto p = tmp.join("broken.txt");
    writeAllBytes(p, existing);

    TailScanResult r;
    auto h = reader.scan(p.string(), existing.size(), filler(500), 16, r);
    ASSERT_EQ(h.status(), FileOpStatus::Failed);
    EXPECT_EQ(h.errorInfo().code, FileError::IOError);
}

TEST(TailReader, ZeroChunkSizeIsRejected) {
    ScopedTestLogger log;
    FaultInjectingBackend backend;
    WriteConfig cfg;
    TailReader reader(backend, cfg, log.logger());

    TailScanResult r;
    auto h = reader.scan("/nonexistent/file", 10, "abc", 0, r);
    ASSERT_EQ(h.status(), FileOpStatus::Failed);
    EXPECT_EQ(h.errorInfo().code, FileError::InvalidArgument);
    EXPECT_TRUE(backend.reads().empty());
}
