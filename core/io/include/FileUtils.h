#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "Chunk.h"
#include "Result.h"

namespace SeqCDC {

    /**
     * @brief Whole-file helpers that feed buffers to the chunker and
     *        write chunk sequences back out.
     *
     * Failures are returned as Result errors carrying IO_ERROR (or
     * FILE_NOT_FOUND) with the failing operation in the message.
     */
    class FileUtils {
    public:
        static Result<std::vector<uint8_t>> readFile(const std::string& path);

        /// Read in fixed READ_BUFFER_SIZE slices instead of one bulk read
        static Result<std::vector<uint8_t>> readFileBuffered(const std::string& path);

        static VoidResult writeFile(const std::string& path, const std::vector<uint8_t>& data);

        /// Concatenate chunk views into path, reconstructing the source
        static VoidResult writeChunksToFile(const std::string& path, const std::vector<Chunk>& chunks);
    };

}
