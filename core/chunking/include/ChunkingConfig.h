#pragma once

#include <cstdint>
#include <string>

#include "Constants.h"
#include "Result.h"

namespace SeqCDC {

    class Config;

    /**
     * @brief Which sign of byte-to-byte difference extends a run.
     *
     * Increasing: buff[i] > buff[i-1] reinforces, buff[i] < buff[i-1] opposes.
     * Decreasing: the roles are swapped.
     */
    enum class SeqOpMode {
        Increasing,
        Decreasing
    };

    std::string toString(SeqOpMode mode);
    Result<SeqOpMode> parseOpMode(const std::string& name);

    /**
     * @brief Plain, unvalidated chunking parameters.
     */
    struct ChunkingParams {
        std::uint64_t seqThreshold = defaults::SEQ_THRESHOLD;
        std::uint64_t jumpTrigger = defaults::JUMP_TRIGGER;
        std::uint64_t jumpSize = defaults::JUMP_SIZE;
        SeqOpMode opMode = SeqOpMode::Increasing;
        std::uint64_t minBlockSize = defaults::MIN_BLOCK_SIZE;
        std::uint64_t avgBlockSize = defaults::AVG_BLOCK_SIZE;
        std::uint64_t maxBlockSize = defaults::MAX_BLOCK_SIZE;
    };

    /**
     * @brief Validated, immutable chunking configuration.
     *
     * Only obtainable through create()/fromConfig()/defaults(), so holding
     * one means every invariant already passed:
     *   seqThreshold > 0, minBlockSize > 0, maxBlockSize >= minBlockSize,
     *   jumpSize > 0.
     */
    class ChunkingConfig {
    public:
        static Result<ChunkingConfig> create(const ChunkingParams& params);

        /**
         * @brief Build from key=value settings.
         *
         * Recognised keys: seq_threshold, jump_trigger, jump_size, op_mode,
         * min_block_size, avg_block_size, max_block_size. Missing keys take
         * their defaults.
         */
        static Result<ChunkingConfig> fromConfig(const Config& config);

        static ChunkingConfig defaults();

        /// Check params without constructing; reports the first rule broken
        static VoidResult validate(const ChunkingParams& params);

        std::uint64_t seqThreshold() const { return params_.seqThreshold; }
        std::uint64_t jumpTrigger() const { return params_.jumpTrigger; }
        std::uint64_t jumpSize() const { return params_.jumpSize; }
        SeqOpMode opMode() const { return params_.opMode; }
        std::uint64_t minBlockSize() const { return params_.minBlockSize; }
        std::uint64_t avgBlockSize() const { return params_.avgBlockSize; }
        std::uint64_t maxBlockSize() const { return params_.maxBlockSize; }

        const ChunkingParams& params() const { return params_; }

        std::string toString() const;

    private:
        explicit ChunkingConfig(const ChunkingParams& params) : params_(params) {}

        ChunkingParams params_;
    };

}
