#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "Chunk.h"

namespace SeqCDC {

    /**
     * @brief Size statistics over a materialized chunk sequence.
     *
     * totalSize is the input length handed in, not the sum of chunk
     * lengths. For an empty sequence every size-derived field is zero.
     */
    struct ChunkingStats {
        size_t chunkCount{0};
        size_t totalSize{0};
        double avgChunkSize{0.0};
        size_t minChunkSize{0};
        size_t maxChunkSize{0};
        double chunkSizeStddev{0.0}; // population standard deviation

        static ChunkingStats fromChunks(const std::vector<Chunk>& chunks, size_t totalSize);
        static ChunkingStats fromSizes(const std::vector<size_t>& sizes, size_t totalSize);

        std::string toString() const;
    };

}
