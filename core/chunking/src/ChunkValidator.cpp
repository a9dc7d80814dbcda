#include "ChunkValidator.h"
#include "ErrorCodes.h"

#include <cstring>
#include <string>

namespace SeqCDC {

    namespace {
        const char* COMPONENT = "ChunkValidator";

        Error processingError(const std::string& message) {
            return makeError(Core::ErrorCode::PROCESSING_ERROR, message, COMPONENT);
        }
    }

    bool ChunkValidator::verifyChunks(const uint8_t* original, size_t length, const std::vector<Chunk>& chunks) {
        size_t offset = 0;
        for (const auto& chunk : chunks) {
            if (chunk.len > length - offset) {
                return false;
            }
            if (chunk.len > 0 && std::memcmp(original + offset, chunk.data, chunk.len) != 0) {
                return false;
            }
            offset += chunk.len;
        }
        return offset == length;
    }

    bool ChunkValidator::verifyChunks(const std::vector<uint8_t>& original, const std::vector<Chunk>& chunks) {
        return verifyChunks(original.data(), original.size(), chunks);
    }

    VoidResult ChunkValidator::validateCoverage(size_t dataLen, const std::vector<Chunk>& chunks) {
        if (chunks.empty()) {
            if (dataLen == 0) {
                return Ok();
            }
            return processingError("No chunks found for non-empty data");
        }

        size_t expectedStart = 0;
        for (size_t i = 0; i < chunks.size(); ++i) {
            const auto& chunk = chunks[i];
            if (chunk.start != expectedStart) {
                return processingError("Chunk " + std::to_string(i) + " starts at " +
                                       std::to_string(chunk.start) + " but expected " +
                                       std::to_string(expectedStart));
            }
            if (chunk.empty()) {
                return processingError("Chunk " + std::to_string(i) + " is empty");
            }
            expectedStart = chunk.end();
        }

        if (expectedStart != dataLen) {
            return processingError("Chunks end at " + std::to_string(expectedStart) +
                                   " but data length is " + std::to_string(dataLen));
        }
        return Ok();
    }

    VoidResult ChunkValidator::validateSizeBounds(const std::vector<Chunk>& chunks, const ChunkingConfig& config) {
        for (size_t i = 0; i + 1 < chunks.size(); ++i) {
            const auto len = static_cast<std::uint64_t>(chunks[i].len);
            if (len < config.minBlockSize() || len > config.maxBlockSize()) {
                return processingError("Chunk " + std::to_string(i) + " has length " + std::to_string(len) +
                                       " outside [" + std::to_string(config.minBlockSize()) + ", " +
                                       std::to_string(config.maxBlockSize()) + "]");
            }
        }
        if (!chunks.empty() && chunks.back().len > config.maxBlockSize()) {
            return processingError("Final chunk has length " + std::to_string(chunks.back().len) +
                                   " above max_block_size " + std::to_string(config.maxBlockSize()));
        }
        return Ok();
    }

}
