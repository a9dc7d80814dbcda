#include "ChunkingConfig.h"
#include "Config.h"
#include "ErrorCodes.h"
#include "LoggerMacros.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace SeqCDC {

    namespace {
        const char* COMPONENT = "ChunkingConfig";

        Error configError(const std::string& message) {
            return makeError(Core::ErrorCode::INVALID_CONFIGURATION, message, COMPONENT);
        }
    }

    std::string toString(SeqOpMode mode) {
        switch (mode) {
            case SeqOpMode::Increasing: return "increasing";
            case SeqOpMode::Decreasing: return "decreasing";
        }
        return "unknown";
    }

    Result<SeqOpMode> parseOpMode(const std::string& name) {
        std::string lowered = name;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lowered == "increasing" || lowered == "inc") {
            return SeqOpMode::Increasing;
        }
        if (lowered == "decreasing" || lowered == "dec") {
            return SeqOpMode::Decreasing;
        }
        return makeError(Core::ErrorCode::INVALID_OP_MODE,
                         "op_mode must be 'increasing' or 'decreasing', got '" + name + "'", COMPONENT);
    }

    VoidResult ChunkingConfig::validate(const ChunkingParams& params) {
        if (params.seqThreshold == 0) {
            return configError("seq_threshold must be > 0");
        }
        if (params.minBlockSize == 0) {
            return configError("min_block_size must be > 0");
        }
        if (params.maxBlockSize < params.minBlockSize) {
            return configError("max_block_size must be >= min_block_size");
        }
        if (params.jumpSize == 0) {
            return configError("jump_size must be > 0");
        }
        return Ok();
    }

    Result<ChunkingConfig> ChunkingConfig::create(const ChunkingParams& params) {
        auto valid = validate(params);
        if (!valid) {
            LOG_WARN_COMP("Rejected chunking configuration: " + valid.error().message, COMPONENT);
            return valid.error();
        }
        return ChunkingConfig(params);
    }

    ChunkingConfig ChunkingConfig::defaults() {
        return ChunkingConfig(ChunkingParams{});
    }

    Result<ChunkingConfig> ChunkingConfig::fromConfig(const Config& config) {
        ChunkingParams params;

        struct Field {
            const char* key;
            std::uint64_t* target;
        };
        const Field fields[] = {
            {"seq_threshold", &params.seqThreshold},
            {"jump_trigger", &params.jumpTrigger},
            {"jump_size", &params.jumpSize},
            {"min_block_size", &params.minBlockSize},
            {"avg_block_size", &params.avgBlockSize},
            {"max_block_size", &params.maxBlockSize},
        };

        for (const auto& field : fields) {
            auto value = config.getUint64(field.key, *field.target);
            if (!value) {
                LOG_WARN_COMP(value.error().message, COMPONENT);
                return configError(value.error().message);
            }
            *field.target = value.value();
        }

        if (config.hasKey("op_mode")) {
            auto mode = parseOpMode(config.get("op_mode"));
            if (!mode) {
                LOG_WARN_COMP(mode.error().message, COMPONENT);
                return configError(mode.error().message);
            }
            params.opMode = mode.value();
        }

        return create(params);
    }

    std::string ChunkingConfig::toString() const {
        std::ostringstream oss;
        oss << "mode=" << SeqCDC::toString(params_.opMode)
            << " seq_threshold=" << params_.seqThreshold
            << " jump_trigger=" << params_.jumpTrigger
            << " jump_size=" << params_.jumpSize
            << " min=" << params_.minBlockSize
            << " avg=" << params_.avgBlockSize
            << " max=" << params_.maxBlockSize;
        return oss.str();
    }

}
