#include <gtest/gtest.h>

#include <chrono>
#include <vector>

#include "DataGenerator.h"
#include "PerfUtils.h"
#include "SeqChunker.h"

using namespace SeqCDC;

TEST(PerfUtilsTest, MeasureTimeReturnsResult) {
    auto [value, elapsed] = PerfUtils::measureTime([] { return 6 * 7; });
    EXPECT_EQ(value, 42);
    EXPECT_GE(elapsed.count(), 0);
}

TEST(PerfUtilsTest, MeasureChunking) {
    SeqChunker chunker;
    auto data = DataGenerator::pseudoRandom(100000, 4);

    auto [chunks, elapsed] = PerfUtils::measureTime([&] { return chunker.chunkAllVec(data); });
    EXPECT_EQ(chunks, chunker.chunkAllVec(data));
    EXPECT_GE(PerfUtils::throughputMBps(data.size(), elapsed), 0.0);
}

TEST(PerfUtilsTest, Throughput) {
    using namespace std::chrono;

    EXPECT_DOUBLE_EQ(PerfUtils::throughputMBps(2000000, seconds(2)), 1.0);
    EXPECT_DOUBLE_EQ(PerfUtils::throughputBytesPerSec(5000, milliseconds(500)), 10000.0);
    EXPECT_DOUBLE_EQ(PerfUtils::throughputMBps(1000, PerfUtils::Duration::zero()), 0.0);
    EXPECT_DOUBLE_EQ(PerfUtils::throughputBytesPerSec(1000, PerfUtils::Duration::zero()), 0.0);
}
