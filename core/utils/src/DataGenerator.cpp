#include "DataGenerator.h"

#include <algorithm>

namespace SeqCDC {

    namespace {
        std::vector<uint8_t> withRuns(size_t size, size_t seqLength, size_t seqCount,
                                      uint8_t fill, bool rising) {
            std::vector<uint8_t> data(size, fill);
            const size_t spacing = size / std::max<size_t>(seqCount, 1);

            for (size_t seq = 0; seq < seqCount; ++seq) {
                const size_t start = seq * spacing;
                if (start >= size) break;
                const size_t end = std::min(start + seqLength, size);

                for (size_t pos = start; pos < end; ++pos) {
                    const auto step = static_cast<uint8_t>((pos - start) % 256);
                    data[pos] = rising ? step : static_cast<uint8_t>(255 - step);
                }
            }
            return data;
        }
    }

    std::vector<uint8_t> DataGenerator::increasingSequences(size_t size, size_t seqLength, size_t seqCount) {
        return withRuns(size, seqLength, seqCount, 0x00, true);
    }

    std::vector<uint8_t> DataGenerator::decreasingSequences(size_t size, size_t seqLength, size_t seqCount) {
        return withRuns(size, seqLength, seqCount, 0xFF, false);
    }

    std::vector<uint8_t> DataGenerator::mixedPatterns(size_t size) {
        std::vector<uint8_t> data;
        data.reserve(size);

        for (size_t i = 0; i < size; ++i) {
            const size_t bucket = i % 10;
            if (bucket <= 4) {
                data.push_back(static_cast<uint8_t>(i % 256));
            } else if (bucket <= 7) {
                data.push_back(static_cast<uint8_t>(255 - (i % 256)));
            } else {
                data.push_back(static_cast<uint8_t>((i * 7) % 256));
            }
        }
        return data;
    }

    std::vector<uint8_t> DataGenerator::pseudoRandom(size_t size, uint64_t seed) {
        std::vector<uint8_t> data;
        data.reserve(size);

        uint64_t state = seed;
        for (size_t i = 0; i < size; ++i) {
            state = state * 1103515245ULL + 12345ULL;
            data.push_back(static_cast<uint8_t>(state >> 16));
        }
        return data;
    }

}
