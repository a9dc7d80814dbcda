#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace SeqCDC {

    /**
     * @brief Synthetic byte patterns for tests and benchmarks.
     */
    class DataGenerator {
    public:
        /**
         * @brief Zero-filled buffer with seqCount runs 0,1,2,... of
         *        seqLength bytes, spaced size / max(seqCount, 1) apart.
         */
        static std::vector<uint8_t> increasingSequences(size_t size, size_t seqLength, size_t seqCount);

        /// 0xFF-filled buffer with runs 255,254,253,... laid out as above
        static std::vector<uint8_t> decreasingSequences(size_t size, size_t seqLength, size_t seqCount);

        /// Repeating mix of rising, falling and scrambled bytes
        static std::vector<uint8_t> mixedPatterns(size_t size);

        /// Deterministic LCG noise; the same seed always yields the same bytes
        static std::vector<uint8_t> pseudoRandom(size_t size, uint64_t seed);
    };

}
