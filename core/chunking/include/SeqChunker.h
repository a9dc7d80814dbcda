#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

#include "Chunk.h"
#include "ChunkingConfig.h"
#include "ChunkingStats.h"
#include "Result.h"

namespace SeqCDC {

    /**
     * @brief Locate the end of the next chunk.
     *
     * Scans buff from minBlockSize onwards comparing each byte with its
     * predecessor. Equal bytes are skipped without touching any counter.
     * A run of seqThreshold reinforcing comparisons cuts at the current
     * position; jumpTrigger opposing comparisons skip jumpSize bytes ahead
     * and clear both counters.
     *
     * @param buff    Unconsumed suffix of the source
     * @param buffLen Bytes physically readable from buff
     * @param size    Bytes eligible for this chunk
     * @return Offset relative to buff, in [1, size] when size > 0. Returns
     *         size unchanged when size < minBlockSize, otherwise at most
     *         min(size, maxBlockSize).
     */
    size_t findCutpoint(const uint8_t* buff, size_t buffLen, size_t size, const ChunkingConfig& config);

    /**
     * @brief Forward-only cursor producing the chunks of one buffer.
     *
     * Borrows both the buffer and the configuration; neither may be
     * destroyed while the iterator is in use. Once exhausted it stays
     * exhausted, so rescanning requires a new iterator.
     */
    class ChunkIterator {
    public:
        ChunkIterator(const uint8_t* data, size_t length, const ChunkingConfig& config);

        std::optional<Chunk> next();

        size_t position() const { return position_; }
        bool finished() const { return done_; }

        /// Drain every remaining chunk
        std::vector<Chunk> collect();

        // Input-iterator facade so the cursor works in range-for
        class Cursor {
        public:
            using iterator_category = std::input_iterator_tag;
            using value_type = Chunk;
            using difference_type = std::ptrdiff_t;
            using pointer = const Chunk*;
            using reference = const Chunk&;

            Cursor() = default;
            explicit Cursor(ChunkIterator* owner) : owner_(owner) { current_ = owner_->next(); }

            reference operator*() const { return *current_; }
            pointer operator->() const { return &*current_; }

            Cursor& operator++() {
                current_ = owner_->next();
                return *this;
            }

            // Exhausted cursors all equal end(); live ones must share an owner
            bool operator==(const Cursor& other) const {
                if (!current_ || !other.current_) {
                    return !current_ && !other.current_;
                }
                return owner_ == other.owner_ && *current_ == *other.current_;
            }
            bool operator!=(const Cursor& other) const { return !(*this == other); }

        private:
            ChunkIterator* owner_ = nullptr;
            std::optional<Chunk> current_;
        };

        Cursor begin() { return Cursor(this); }
        Cursor end() { return Cursor(); }

    private:
        const uint8_t* data_;
        size_t length_;
        const ChunkingConfig& config_;
        size_t position_ = 0;
        size_t emitted_ = 0;
        bool done_ = false;

        void finish();
    };

    /**
     * @brief Sequence-based content-defined chunker.
     *
     * Stateless apart from its configuration; one instance can serve any
     * number of iterators, including concurrently.
     */
    class SeqChunker {
    public:
        SeqChunker();
        explicit SeqChunker(const ChunkingConfig& config);

        /// Validate params and build a chunker, failing closed
        static Result<SeqChunker> create(const ChunkingParams& params);

        const std::string& techniqueName() const { return techniqueName_; }
        const ChunkingConfig& config() const { return config_; }
        std::uint64_t minBlockSize() const { return config_.minBlockSize(); }
        std::uint64_t maxBlockSize() const { return config_.maxBlockSize(); }

        size_t findCutpoint(const uint8_t* buff, size_t buffLen, size_t size) const;

        // The returned iterator borrows this chunker and data. Chunks point
        // into data, so temporaries are rejected at compile time.
        ChunkIterator chunkAll(const uint8_t* data, size_t length) const;
        ChunkIterator chunkAll(const std::vector<uint8_t>& data) const;
        ChunkIterator chunkAll(std::vector<uint8_t>&&) const = delete;

        std::vector<Chunk> chunkAllVec(const uint8_t* data, size_t length) const;
        std::vector<Chunk> chunkAllVec(const std::vector<uint8_t>& data) const;
        std::vector<Chunk> chunkAllVec(std::vector<uint8_t>&&) const = delete;

        std::optional<Chunk> chunkFirst(const uint8_t* data, size_t length) const;
        std::optional<Chunk> chunkFirst(const std::vector<uint8_t>& data) const;
        std::optional<Chunk> chunkFirst(std::vector<uint8_t>&&) const = delete;

        ChunkingStats stats(const uint8_t* data, size_t length) const;
        ChunkingStats stats(const std::vector<uint8_t>& data) const;

    private:
        ChunkingConfig config_;
        std::string techniqueName_ = "Seq Chunking";
    };

}
