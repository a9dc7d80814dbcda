#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "Chunk.h"
#include "ChunkingConfig.h"
#include "Result.h"

namespace SeqCDC {

    /**
     * @brief Checks a materialized chunk sequence against its source.
     */
    class ChunkValidator {
    public:
        /// True when concatenating the chunk views reproduces original
        static bool verifyChunks(const uint8_t* original, size_t length, const std::vector<Chunk>& chunks);
        static bool verifyChunks(const std::vector<uint8_t>& original, const std::vector<Chunk>& chunks);

        /**
         * @brief Contiguity check: chunk 0 starts at 0, each chunk starts
         * where the previous ended, none is empty, the last ends at dataLen.
         * An empty sequence is valid only for empty data.
         */
        static VoidResult validateCoverage(size_t dataLen, const std::vector<Chunk>& chunks);

        /// Every chunk except the last must lie within [min, max] block size
        static VoidResult validateSizeBounds(const std::vector<Chunk>& chunks, const ChunkingConfig& config);
    };

}
