#include "SeqChunker.h"
#include "LoggerMacros.h"

#include <algorithm>

namespace SeqCDC {

    size_t findCutpoint(const uint8_t* buff, size_t buffLen, size_t size, const ChunkingConfig& config) {
        const size_t minSize = static_cast<size_t>(config.minBlockSize());
        if (size < minSize) {
            return size;
        }

        const size_t limit = static_cast<size_t>(std::min<std::uint64_t>(size, config.maxBlockSize()));
        const bool increasing = config.opMode() == SeqOpMode::Increasing;

        std::uint64_t opposingSlopeCount = 0;
        std::uint64_t seqLength = 0;
        size_t pos = minSize;

        while (pos < limit && pos < buffLen) {
            const int diff = static_cast<int>(buff[pos]) - static_cast<int>(buff[pos - 1]);

            // Equal bytes neither extend nor break a run
            if (diff == 0) {
                ++pos;
                continue;
            }

            const bool reinforcing = increasing ? diff > 0 : diff < 0;
            if (reinforcing) {
                ++seqLength;
            } else {
                ++opposingSlopeCount;
                seqLength = 0;
            }

            if (seqLength >= config.seqThreshold()) {
                return pos;
            }

            if (opposingSlopeCount >= config.jumpTrigger()) {
                // A jump past the horizon caps the chunk at limit
                if (config.jumpSize() >= limit - pos) {
                    break;
                }
                pos += static_cast<size_t>(config.jumpSize());
                opposingSlopeCount = 0;
                seqLength = 0;
            } else {
                ++pos;
            }
        }

        return limit;
    }

    // ---------------------------------------------------------------------
    // ChunkIterator
    // ---------------------------------------------------------------------

    ChunkIterator::ChunkIterator(const uint8_t* data, size_t length, const ChunkingConfig& config)
        : data_(data), length_(length), config_(config) {}

    std::optional<Chunk> ChunkIterator::next() {
        if (done_) {
            return std::nullopt;
        }
        if (position_ >= length_) {
            finish();
            return std::nullopt;
        }

        const uint8_t* remaining = data_ + position_;
        const size_t remainingLen = length_ - position_;

        // The finder may report a size larger than what is physically left
        size_t chunkSize = std::min(findCutpoint(remaining, remainingLen, remainingLen, config_), remainingLen);
        if (chunkSize == 0) {
            LOG_WARN_COMP("Cutpoint of zero length at offset " + std::to_string(position_) +
                          ", stopping", "ChunkIterator");
            finish();
            return std::nullopt;
        }

        Chunk chunk{remaining, position_, chunkSize};
        position_ += chunkSize;
        ++emitted_;
        return chunk;
    }

    std::vector<Chunk> ChunkIterator::collect() {
        std::vector<Chunk> chunks;
        if (config_.avgBlockSize() > 0 && length_ > position_) {
            chunks.reserve((length_ - position_) / static_cast<size_t>(config_.avgBlockSize()) + 1);
        }
        while (auto chunk = next()) {
            chunks.push_back(*chunk);
        }
        return chunks;
    }

    void ChunkIterator::finish() {
        done_ = true;
        LOG_DEBUG_COMP_IF("Emitted " + std::to_string(emitted_) + " chunks over " +
                          std::to_string(position_) + " bytes", "ChunkIterator");
    }

    // ---------------------------------------------------------------------
    // SeqChunker
    // ---------------------------------------------------------------------

    SeqChunker::SeqChunker() : config_(ChunkingConfig::defaults()) {}

    SeqChunker::SeqChunker(const ChunkingConfig& config) : config_(config) {}

    Result<SeqChunker> SeqChunker::create(const ChunkingParams& params) {
        return ChunkingConfig::create(params).andThen([](const ChunkingConfig& config) {
            return Result<SeqChunker>(SeqChunker(config));
        });
    }

    size_t SeqChunker::findCutpoint(const uint8_t* buff, size_t buffLen, size_t size) const {
        return SeqCDC::findCutpoint(buff, buffLen, size, config_);
    }

    ChunkIterator SeqChunker::chunkAll(const uint8_t* data, size_t length) const {
        return ChunkIterator(data, length, config_);
    }

    ChunkIterator SeqChunker::chunkAll(const std::vector<uint8_t>& data) const {
        return chunkAll(data.data(), data.size());
    }

    std::vector<Chunk> SeqChunker::chunkAllVec(const uint8_t* data, size_t length) const {
        return chunkAll(data, length).collect();
    }

    std::vector<Chunk> SeqChunker::chunkAllVec(const std::vector<uint8_t>& data) const {
        return chunkAllVec(data.data(), data.size());
    }

    std::optional<Chunk> SeqChunker::chunkFirst(const uint8_t* data, size_t length) const {
        return chunkAll(data, length).next();
    }

    std::optional<Chunk> SeqChunker::chunkFirst(const std::vector<uint8_t>& data) const {
        return chunkFirst(data.data(), data.size());
    }

    ChunkingStats SeqChunker::stats(const uint8_t* data, size_t length) const {
        return ChunkingStats::fromChunks(chunkAllVec(data, length), length);
    }

    ChunkingStats SeqChunker::stats(const std::vector<uint8_t>& data) const {
        return stats(data.data(), data.size());
    }

}
