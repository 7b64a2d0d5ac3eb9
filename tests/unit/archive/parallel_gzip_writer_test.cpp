#include <gtest/gtest.h>
#include <dockhand/archive/archive_options.h>
#include <dockhand/archive/gzip_compressor.h>
#include <dockhand/archive/parallel_gzip_writer.h>
#include <dockhand/core/failure.h>

#include <atomic>
#include <chrono>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>

using namespace dockhand;
using namespace dockhand::archive;

namespace {
std::string mixedData(std::size_t size) {
    std::mt19937 gen(42);
    std::uniform_int_distribution<int> dis(0, 15);
    std::string out;
    out.reserve(size);
    while (out.size() < size) {
        // Short random runs keep the data compressible but not trivial.
        out.append(static_cast<std::size_t>(dis(gen)) + 1, static_cast<char>('a' + dis(gen)));
    }
    out.resize(size);
    return out;
}
} // namespace

TEST(ParallelGzipWriterTest, OutputDecodesToInput) {
    const auto data = mixedData(1024 * 1024 + 123);
    ParallelGzipWriter writer(4, 64 * 1024, 6);
    auto out = writer.compress(data);
    ASSERT_TRUE(out) << out.error().message;

    auto back = GzipCompressor::decompress(out.value());
    ASSERT_TRUE(back) << back.error().message;
    EXPECT_EQ(back.value(), data);
}

TEST(ParallelGzipWriterTest, EmptyInputIsOneMember) {
    ParallelGzipWriter writer(2, 4096, 9);
    auto out = writer.compress("");
    ASSERT_TRUE(out);
    EXPECT_EQ(out.value(), GzipCompressor(9).compress("").value());
}

TEST(ParallelGzipWriterTest, MembersAppearInIndexOrder) {
    // Later chunks finish first; the output must still follow the input order.
    ChunkCompressor slowEarly = [](std::string_view chunk, std::size_t index) {
        std::this_thread::sleep_for(std::chrono::milliseconds(index < 4 ? 40 - 10 * index : 0));
        return Result<std::string>(std::string("[") + std::to_string(index) + ":" +
                                   std::string(chunk.substr(0, 1)) + "]");
    };
    std::string data;
    for (char c = 'a'; c < 'a' + 10; ++c) {
        data.append(MIN_ARCHIVE_CHUNK_SIZE, c);
    }

    ParallelGzipWriter writer(4, MIN_ARCHIVE_CHUNK_SIZE, slowEarly);
    auto out = writer.compress(data);
    ASSERT_TRUE(out);
    EXPECT_EQ(out.value(), "[0:a][1:b][2:c][3:d][4:e][5:f][6:g][7:h][8:i][9:j]");
}

TEST(ParallelGzipWriterTest, RandomCompletionOrderKeepsOutputOrder) {
    const auto data = mixedData(MIN_ARCHIVE_CHUNK_SIZE * 40 + 17);
    GzipCompressor gz(6);
    for (unsigned round = 0; round < 3; ++round) {
        ChunkCompressor jittery = [&gz, round](std::string_view chunk, std::size_t index) {
            std::mt19937 gen(static_cast<unsigned>(index * 31 + round));
            std::uniform_int_distribution<int> delay(0, 5);
            std::this_thread::sleep_for(std::chrono::milliseconds(delay(gen)));
            return gz.compress(chunk);
        };
        ParallelGzipWriter writer(8, MIN_ARCHIVE_CHUNK_SIZE, jittery);
        auto out = writer.compress(data);
        ASSERT_TRUE(out) << out.error().message;
        auto back = GzipCompressor::decompress(out.value());
        ASSERT_TRUE(back);
        EXPECT_EQ(back.value(), data) << "round " << round;
    }
}

TEST(ParallelGzipWriterTest, ParallelMatchesSerialPerChunk) {
    const auto data = mixedData(300000);
    GzipCompressor gz(5);
    ParallelGzipWriter writer(3, 100000, 5);
    auto out = writer.compress(data);
    ASSERT_TRUE(out);

    std::string expected;
    for (std::size_t off = 0; off < data.size(); off += 100000) {
        expected += gz.compress(std::string_view(data).substr(off, 100000)).value();
    }
    EXPECT_EQ(out.value(), expected);
}

TEST(ParallelGzipWriterTest, FirstFailingChunkIsReported) {
    std::atomic<int> calls{0};
    ChunkCompressor failing = [&calls](std::string_view chunk,
                                       std::size_t index) -> Result<std::string> {
        ++calls;
        if (index == 2 || index == 5) {
            return Error{ErrorCode::ArchiveError, "chunk " + std::to_string(index) + " failed"};
        }
        return std::string(chunk);
    };
    std::string data(MIN_ARCHIVE_CHUNK_SIZE * 8, 'x');

    ParallelGzipWriter writer(2, MIN_ARCHIVE_CHUNK_SIZE, failing);
    auto out = writer.compress(data);
    ASSERT_FALSE(out);
    EXPECT_EQ(out.error().code, ErrorCode::ArchiveError);
    EXPECT_EQ(out.error().message, "chunk 2 failed");
    EXPECT_GE(calls.load(), 3);
}

TEST(ParallelGzipWriterTest, ThrowingCompressorBecomesChunkError) {
    ChunkCompressor throwing = [](std::string_view chunk,
                                  std::size_t index) -> Result<std::string> {
        if (index == 3) {
            throw std::runtime_error("deflate state corrupted");
        }
        return std::string(chunk);
    };
    std::string data(MIN_ARCHIVE_CHUNK_SIZE * 6, 'z');

    ParallelGzipWriter writer(3, MIN_ARCHIVE_CHUNK_SIZE, throwing);
    auto out = writer.compress(data);
    ASSERT_FALSE(out);
    EXPECT_EQ(out.error().code, ErrorCode::ArchiveError);
    EXPECT_EQ(failureKindOf(out.error()), FailureKind::ArchiveIo);
    EXPECT_NE(out.error().message.find("chunk 3"), std::string::npos) << out.error().message;
    EXPECT_EQ(out.error().cause, "deflate state corrupted");
}

TEST(ParallelGzipWriterTest, SettingsAreClamped) {
    ParallelGzipWriter tiny(0, 1, 6);
    EXPECT_EQ(tiny.workers(), 1u);
    EXPECT_EQ(tiny.chunkSize(), MIN_ARCHIVE_CHUNK_SIZE);

    ParallelGzipWriter huge(100000, 1 << 20, 6);
    EXPECT_EQ(huge.workers(), kMaxCompressionWorkers);
    EXPECT_EQ(huge.chunkSize(), std::size_t{1} << 20);

    ArchiveOptions opts;
    opts.workers = 0;
    EXPECT_GE(opts.effectiveWorkers(), 1u);
    opts.chunkSize = 10;
    EXPECT_EQ(opts.effectiveChunkSize(), MIN_ARCHIVE_CHUNK_SIZE);
}
