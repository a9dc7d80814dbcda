/**
 * @file chunking_integration_test.cpp
 * @brief End-to-end chunking flows
 *
 * Covers:
 * - File read, chunk, validate and write-back
 * - Boundary stability after a local insertion
 * - Concurrent iterators over a shared chunker
 * - Configuration files driving the chunker
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <set>
#include <thread>
#include <vector>

#include "ChunkValidator.h"
#include "ChunkingStats.h"
#include "Config.h"
#include "DataGenerator.h"
#include "FileUtils.h"
#include "Logger.h"
#include "SeqChunker.h"

using namespace SeqCDC;
namespace fs = std::filesystem;

class ChunkingIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setConsoleOutput(false);
        testDir_ = fs::temp_directory_path() /
                   ("seqcdc_integration_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(testDir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(testDir_, ec);
        Logger::instance().setConsoleOutput(true);
    }

    fs::path testDir_;
};

TEST_F(ChunkingIntegrationTest, FileRoundTrip) {
    auto source = (testDir_ / "source.bin").string();
    auto rebuilt = (testDir_ / "rebuilt.bin").string();
    auto original = DataGenerator::pseudoRandom(1 << 20, 2024);
    ASSERT_TRUE(FileUtils::writeFile(source, original).isOk());

    auto data = FileUtils::readFileBuffered(source);
    ASSERT_TRUE(data.isOk());

    SeqChunker chunker;
    auto chunks = chunker.chunkAllVec(data.value());
    ASSERT_TRUE(ChunkValidator::validateCoverage(data.value().size(), chunks).isOk());
    ASSERT_TRUE(ChunkValidator::validateSizeBounds(chunks, chunker.config()).isOk());

    ASSERT_TRUE(FileUtils::writeChunksToFile(rebuilt, chunks).isOk());
    auto back = FileUtils::readFile(rebuilt);
    ASSERT_TRUE(back.isOk());
    EXPECT_EQ(back.value(), original);

    auto stats = ChunkingStats::fromChunks(chunks, data.value().size());
    EXPECT_EQ(stats.totalSize, original.size());
    EXPECT_EQ(stats.chunkCount, chunks.size());
}

TEST_F(ChunkingIntegrationTest, BoundariesResyncAfterInsertion) {
    const size_t editOffset = 500000;
    const size_t inserted = 10;

    auto before = DataGenerator::pseudoRandom(1 << 20, 12345);
    std::vector<uint8_t> after(before.begin(), before.begin() + editOffset);
    for (size_t i = 0; i < inserted; ++i) {
        after.push_back(static_cast<uint8_t>(i));
    }
    after.insert(after.end(), before.begin() + editOffset, before.end());

    SeqChunker chunker;
    auto chunksBefore = chunker.chunkAllVec(before);
    auto chunksAfter = chunker.chunkAllVec(after);
    EXPECT_EQ(chunksBefore.size(), 151u);
    EXPECT_EQ(chunksAfter.size(), 150u);

    // Chunks ending ahead of the edit are untouched
    size_t unchanged = 0;
    while (unchanged < chunksBefore.size() && chunksBefore[unchanged].end() < editOffset) {
        ASSERT_LT(unchanged, chunksAfter.size());
        EXPECT_EQ(chunksAfter[unchanged].start, chunksBefore[unchanged].start);
        EXPECT_EQ(chunksAfter[unchanged].len, chunksBefore[unchanged].len);
        ++unchanged;
    }
    EXPECT_EQ(unchanged, 76u);

    std::set<size_t> shiftedEnds;
    for (const auto& chunk : chunksBefore) {
        if (chunk.end() >= editOffset) {
            shiftedEnds.insert(chunk.end() + inserted);
        }
    }

    auto firstSync = std::find_if(chunksAfter.begin() + unchanged, chunksAfter.end(),
                                  [&](const Chunk& chunk) { return shiftedEnds.count(chunk.end()) > 0; });
    ASSERT_NE(firstSync, chunksAfter.end());
    EXPECT_LE(firstSync - (chunksAfter.begin() + unchanged), 4);

    // Once realigned, every later boundary matches the shifted original
    for (auto it = firstSync; it != chunksAfter.end(); ++it) {
        EXPECT_EQ(shiftedEnds.count(it->end()), 1u) << "chunk ending at " << it->end();
    }
    EXPECT_EQ(chunksAfter.back().len, chunksBefore.back().len);
}

TEST_F(ChunkingIntegrationTest, ConcurrentIterators) {
    SeqChunker chunker;
    auto data = DataGenerator::pseudoRandom(2 << 20, 31);
    const auto expected = chunker.chunkAllVec(data);

    std::atomic<int> mismatches{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&]() {
            for (int round = 0; round < 3; ++round) {
                std::vector<Chunk> local;
                for (const auto& chunk : chunker.chunkAll(data)) {
                    local.push_back(chunk);
                }
                if (local != expected) {
                    ++mismatches;
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(mismatches.load(), 0);
}

TEST_F(ChunkingIntegrationTest, ConfigFileDrivesChunking) {
    auto configPath = (testDir_ / "seqcdc.conf").string();
    {
        std::ofstream out(configPath);
        out << "# tuned for planted runs\n"
            << "seq_threshold=10\n"
            << "jump_trigger=100\n"
            << "min_block_size=2048\n"
            << "max_block_size=32768\n"
            << "op_mode=decreasing\n";
    }

    Config settings;
    ASSERT_TRUE(settings.loadFromFile(configPath));
    auto config = ChunkingConfig::fromConfig(settings);
    ASSERT_TRUE(config.isOk()) << config.error().toString();

    SeqChunker chunker(config.value());
    auto data = DataGenerator::decreasingSequences(50000, 15, 10);
    auto chunks = chunker.chunkAllVec(data);

    ASSERT_EQ(chunks.size(), 10u);
    EXPECT_EQ(chunks.front().len, 5010u);
    EXPECT_EQ(chunks.back().len, 4990u);
    EXPECT_TRUE(ChunkValidator::verifyChunks(data, chunks));
}

TEST_F(ChunkingIntegrationTest, InvalidConfigFileRejected) {
    auto configPath = (testDir_ / "broken.conf").string();
    {
        std::ofstream out(configPath);
        out << "min_block_size=8192\n"
            << "max_block_size=4096\n";
    }

    Config settings;
    ASSERT_TRUE(settings.loadFromFile(configPath));
    auto config = ChunkingConfig::fromConfig(settings);
    ASSERT_TRUE(config.isError());
    EXPECT_EQ(config.error().message, "max_block_size must be >= min_block_size");
}
