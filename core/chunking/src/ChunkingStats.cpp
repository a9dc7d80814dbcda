#include "ChunkingStats.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <numeric>
#include <sstream>

namespace SeqCDC {

    ChunkingStats ChunkingStats::fromChunks(const std::vector<Chunk>& chunks, size_t totalSize) {
        std::vector<size_t> sizes;
        sizes.reserve(chunks.size());
        for (const auto& chunk : chunks) {
            sizes.push_back(chunk.len);
        }
        return fromSizes(sizes, totalSize);
    }

    ChunkingStats ChunkingStats::fromSizes(const std::vector<size_t>& sizes, size_t totalSize) {
        ChunkingStats stats;
        stats.totalSize = totalSize;
        if (sizes.empty()) {
            return stats;
        }

        stats.chunkCount = sizes.size();
        const double count = static_cast<double>(sizes.size());
        const double sum = std::accumulate(sizes.begin(), sizes.end(), 0.0,
                                           [](double acc, size_t size) { return acc + static_cast<double>(size); });
        stats.avgChunkSize = sum / count;

        auto [minIt, maxIt] = std::minmax_element(sizes.begin(), sizes.end());
        stats.minChunkSize = *minIt;
        stats.maxChunkSize = *maxIt;

        double variance = 0.0;
        for (size_t size : sizes) {
            double diff = static_cast<double>(size) - stats.avgChunkSize;
            variance += diff * diff;
        }
        stats.chunkSizeStddev = std::sqrt(variance / count);

        return stats;
    }

    std::string ChunkingStats::toString() const {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1)
            << "chunks=" << chunkCount
            << " total=" << totalSize
            << " avg=" << avgChunkSize
            << " min=" << minChunkSize
            << " max=" << maxChunkSize
            << " stddev=" << chunkSizeStddev;
        return oss.str();
    }

}
