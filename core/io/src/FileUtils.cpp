#include "FileUtils.h"
#include "Constants.h"
#include "ErrorCodes.h"
#include "LoggerMacros.h"

#include <filesystem>
#include <fstream>

namespace SeqCDC {

    namespace {
        const char* COMPONENT = "FileUtils";

        Error ioError(const std::string& message) {
            LOG_ERROR_COMP(message, COMPONENT);
            return makeError(Core::ErrorCode::IO_ERROR, message, COMPONENT);
        }

        Error openError(const std::string& path) {
            std::error_code ec;
            if (!std::filesystem::exists(path, ec)) {
                std::string message = "Failed to open file: " + path + " (no such file)";
                LOG_ERROR_COMP(message, COMPONENT);
                return makeError(Core::ErrorCode::FILE_NOT_FOUND, message, COMPONENT);
            }
            return ioError("Failed to open file: " + path);
        }
    }

    Result<std::vector<uint8_t>> FileUtils::readFile(const std::string& path) {
        std::ifstream file(path, std::ios::binary | std::ios::ate);
        if (!file) {
            return openError(path);
        }

        std::streamsize fileSize = file.tellg();
        if (fileSize < 0) {
            return ioError("Failed to read file: " + path);
        }
        file.seekg(0, std::ios::beg);

        std::vector<uint8_t> buffer(static_cast<size_t>(fileSize));
        if (fileSize > 0 && !file.read(reinterpret_cast<char*>(buffer.data()), fileSize)) {
            return ioError("Failed to read file: " + path);
        }

        LOG_DEBUG_COMP_IF("Read " + std::to_string(buffer.size()) + " bytes from " + path, COMPONENT);
        return buffer;
    }

    Result<std::vector<uint8_t>> FileUtils::readFileBuffered(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return openError(path);
        }

        std::vector<uint8_t> data;
        std::vector<char> slice(defaults::READ_BUFFER_SIZE);
        while (file) {
            file.read(slice.data(), static_cast<std::streamsize>(slice.size()));
            std::streamsize bytesRead = file.gcount();
            if (bytesRead <= 0) break;
            data.insert(data.end(), slice.begin(), slice.begin() + bytesRead);
        }

        if (file.bad()) {
            return ioError("Failed to read file: " + path);
        }

        LOG_DEBUG_COMP_IF("Read " + std::to_string(data.size()) + " bytes (buffered) from " + path, COMPONENT);
        return data;
    }

    VoidResult FileUtils::writeFile(const std::string& path, const std::vector<uint8_t>& data) {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file) {
            return ioError("Failed to create file: " + path);
        }

        if (!data.empty() &&
            !file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()))) {
            return ioError("Failed to write file: " + path);
        }

        if (!file.flush()) {
            return ioError("Failed to flush file: " + path);
        }
        return Ok();
    }

    VoidResult FileUtils::writeChunksToFile(const std::string& path, const std::vector<Chunk>& chunks) {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file) {
            return ioError("Failed to create file: " + path);
        }

        for (size_t i = 0; i < chunks.size(); ++i) {
            const auto& chunk = chunks[i];
            if (chunk.empty()) continue;
            if (!file.write(reinterpret_cast<const char*>(chunk.data), static_cast<std::streamsize>(chunk.len))) {
                return ioError("Failed to write chunk " + std::to_string(i) + " to " + path);
            }
        }

        if (!file.flush()) {
            return ioError("Failed to flush file: " + path);
        }

        LOG_DEBUG_COMP_IF("Wrote " + std::to_string(chunks.size()) + " chunks to " + path, COMPONENT);
        return Ok();
    }

}
