#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include <json/json.h>

#include "ChunkValidator.h"
#include "ChunkingConfig.h"
#include "Config.h"
#include "ErrorCodes.h"
#include "FileUtils.h"
#include "Logger.h"
#include "LoggerMacros.h"
#include "SeqChunker.h"
#include "SeqcdcCli.h"
#include "Version.h"

namespace SeqCDC {

namespace {

    void printUsage(std::ostream& out, const std::string& prog) {
        out << "SeqCDC " << Version::toString() << " - sequence-based content-defined chunking" << std::endl;
        out << "\nUsage: " << prog << " [OPTIONS] <file>" << std::endl;
        out << "\nOptions:" << std::endl;
        out << "  --config <PATH>            Load key=value chunking settings" << std::endl;
        out << "  --mode <MODE>              increasing | decreasing (default: increasing)" << std::endl;
        out << "  --seq-threshold <N>        Run length that declares a cut (default: 5)" << std::endl;
        out << "  --jump-trigger <N>         Opposing slopes before skipping ahead (default: 50)" << std::endl;
        out << "  --jump-size <N>            Bytes skipped per jump (default: 256)" << std::endl;
        out << "  --min <N>                  Minimum block size (default: 4096)" << std::endl;
        out << "  --avg <N>                  Average block size hint (default: 8192)" << std::endl;
        out << "  --max <N>                  Maximum block size (default: 16384)" << std::endl;
        out << "  --list                     Print every chunk boundary" << std::endl;
        out << "  --json                     Emit JSON instead of text" << std::endl;
        out << "  --output <PATH>            Reassemble the chunks into PATH" << std::endl;
        out << "  --log-level <LEVEL>        debug | info | warn | error (default: warn)" << std::endl;
        out << "  --log-file <PATH>          Mirror log output to PATH" << std::endl;
        out << "  --help                     Show this help message" << std::endl;
    }

    int fail(const Error& error, bool json, std::ostream& out, std::ostream& err) {
        if (json) {
            out << Core::ErrorInfo::fromError(error).toJson() << std::endl;
        } else {
            err << "Error: " << error.toString() << std::endl;
        }
        return EXIT_RUNTIME_ERROR;
    }

    Json::Value statsToJson(const ChunkingStats& stats) {
        Json::Value node(Json::objectValue);
        node["chunk_count"] = static_cast<Json::UInt64>(stats.chunkCount);
        node["total_size"] = static_cast<Json::UInt64>(stats.totalSize);
        node["avg_chunk_size"] = stats.avgChunkSize;
        node["min_chunk_size"] = static_cast<Json::UInt64>(stats.minChunkSize);
        node["max_chunk_size"] = static_cast<Json::UInt64>(stats.maxChunkSize);
        node["chunk_size_stddev"] = stats.chunkSizeStddev;
        return node;
    }

    Json::Value configToJson(const ChunkingConfig& config) {
        Json::Value node(Json::objectValue);
        node["op_mode"] = toString(config.opMode());
        node["seq_threshold"] = static_cast<Json::UInt64>(config.seqThreshold());
        node["jump_trigger"] = static_cast<Json::UInt64>(config.jumpTrigger());
        node["jump_size"] = static_cast<Json::UInt64>(config.jumpSize());
        node["min_block_size"] = static_cast<Json::UInt64>(config.minBlockSize());
        node["avg_block_size"] = static_cast<Json::UInt64>(config.avgBlockSize());
        node["max_block_size"] = static_cast<Json::UInt64>(config.maxBlockSize());
        return node;
    }

}

int runCli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    const int argc = static_cast<int>(args.size());
    const std::string prog = args.empty() ? "seqcdc" : args[0];

    auto& logger = Logger::instance();
    logger.setLevel(LogLevel::WARN);
    logger.setComponent("CLI");

    // Flag name -> config key; flags are applied after any --config file
    const std::vector<std::pair<std::string, std::string>> keyedFlags = {
        {"--mode", "op_mode"},
        {"--seq-threshold", "seq_threshold"},
        {"--jump-trigger", "jump_trigger"},
        {"--jump-size", "jump_size"},
        {"--min", "min_block_size"},
        {"--avg", "avg_block_size"},
        {"--max", "max_block_size"},
    };

    std::string configPath;
    std::string inputPath;
    std::string outputPath;
    std::string logLevel;
    std::string logFile;
    bool json = false;
    bool list = false;
    std::vector<std::pair<std::string, std::string>> overrides;

    for (int i = 1; i < argc; ++i) {
        const std::string& arg = args[i];
        bool matchedKey = false;

        for (const auto& [flag, key] : keyedFlags) {
            if (arg == flag) {
                if (i + 1 >= argc) {
                    err << "Missing value for " << flag << std::endl;
                    return EXIT_USAGE;
                }
                overrides.emplace_back(key, args[++i]);
                matchedKey = true;
                break;
            }
        }
        if (matchedKey) continue;

        if (arg == "--config" && i + 1 < argc) {
            configPath = args[++i];
        }
        else if (arg == "--output" && i + 1 < argc) {
            outputPath = args[++i];
        }
        else if (arg == "--log-level" && i + 1 < argc) {
            logLevel = args[++i];
        }
        else if (arg == "--log-file" && i + 1 < argc) {
            logFile = args[++i];
        }
        else if (arg == "--json") {
            json = true;
        }
        else if (arg == "--list") {
            list = true;
        }
        else if (arg == "--help") {
            printUsage(out, prog);
            return EXIT_OK;
        }
        else if (!arg.empty() && arg[0] == '-') {
            err << "Unknown or incomplete option: " << arg << std::endl;
            printUsage(out, prog);
            return EXIT_USAGE;
        }
        else if (inputPath.empty()) {
            inputPath = arg;
        }
        else {
            err << "Unexpected argument: " << arg << std::endl;
            return EXIT_USAGE;
        }
    }

    if (inputPath.empty()) {
        printUsage(out, prog);
        return EXIT_USAGE;
    }

    if (!logLevel.empty()) {
        auto level = Logger::parseLevel(logLevel);
        if (!level) {
            err << level.error().message << std::endl;
            return EXIT_USAGE;
        }
        logger.setLevel(level.value());
    }
    if (!logFile.empty()) {
        logger.setLogFile(logFile);
    }

    Config settings;
    if (!configPath.empty()) {
        if (!settings.loadFromFile(configPath)) {
            return fail(makeError(Core::ErrorCode::IO_ERROR,
                                  "Failed to load config file: " + configPath, "CLI"), json, out, err);
        }
        logger.info("Loaded configuration from " + configPath, "CLI");
    }
    for (const auto& [key, value] : overrides) {
        settings.set(key, value);
    }

    auto config = ChunkingConfig::fromConfig(settings);
    if (!config) {
        return fail(config.error(), json, out, err);
    }
    LOG_INFO_COMP_IF("Chunking with " + config.value().toString(), "CLI");

    auto data = FileUtils::readFileBuffered(inputPath);
    if (!data) {
        return fail(data.error(), json, out, err);
    }
    const auto& bytes = data.value();

    SeqChunker chunker(config.value());
    std::vector<Chunk> chunks;
    {
        SCOPED_TIMER_COMP("Chunking " + inputPath, "CLI");
        chunks = chunker.chunkAllVec(bytes);
    }

    auto coverage = ChunkValidator::validateCoverage(bytes.size(), chunks);
    if (!coverage) {
        LOG_CRITICAL_COMP("Chunk sequence failed coverage check: " + coverage.error().message, "CLI");
        return fail(coverage.error(), json, out, err);
    }

    if (!outputPath.empty()) {
        auto written = FileUtils::writeChunksToFile(outputPath, chunks);
        if (!written) {
            return fail(written.error(), json, out, err);
        }
    }

    auto stats = ChunkingStats::fromChunks(chunks, bytes.size());

    if (json) {
        Json::Value root(Json::objectValue);
        root["file"] = inputPath;
        root["technique"] = chunker.techniqueName();
        root["config"] = configToJson(chunker.config());
        root["stats"] = statsToJson(stats);
        if (list) {
            Json::Value entries(Json::arrayValue);
            for (const auto& chunk : chunks) {
                Json::Value entry(Json::objectValue);
                entry["start"] = static_cast<Json::UInt64>(chunk.start);
                entry["len"] = static_cast<Json::UInt64>(chunk.len);
                entries.append(entry);
            }
            root["chunks"] = entries;
        }

        Json::StreamWriterBuilder writer;
        writer["indentation"] = "  ";
        out << Json::writeString(writer, root) << std::endl;
        return EXIT_OK;
    }

    out << "File:      " << inputPath << " (" << bytes.size() << " bytes)" << std::endl;
    out << "Technique: " << chunker.techniqueName() << std::endl;
    out << "Config:    " << chunker.config().toString() << std::endl;
    out << "Stats:     " << stats.toString() << std::endl;
    if (list) {
        for (size_t i = 0; i < chunks.size(); ++i) {
            out << "  #" << i << " " << chunks[i].start << "-" << chunks[i].end()
                << " (" << chunks[i].len << " bytes)" << std::endl;
        }
    }
    if (!outputPath.empty()) {
        out << "Wrote:     " << outputPath << std::endl;
    }
    return EXIT_OK;
}

} // namespace SeqCDC
