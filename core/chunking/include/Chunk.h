#pragma once

#include <cstddef>
#include <cstdint>

namespace SeqCDC {

    /**
     * @brief Non-owning view of one chunk of a caller-owned buffer.
     *
     * `data` points at buffer[start]; the view is valid only while the
     * caller keeps the buffer alive and unmodified.
     */
    struct Chunk {
        const uint8_t* data = nullptr;
        size_t start = 0;
        size_t len = 0;

        size_t end() const { return start + len; }
        bool empty() const { return len == 0; }

        bool operator==(const Chunk& other) const {
            return data == other.data && start == other.start && len == other.len;
        }
        bool operator!=(const Chunk& other) const { return !(*this == other); }
    };

}
