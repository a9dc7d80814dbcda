#include "ErrorCodes.h"

#include <json/json.h>

namespace SeqCDC {
namespace Core {

const std::unordered_map<ErrorCode, std::string>& ErrorRegistry::messages() {
    static const std::unordered_map<ErrorCode, std::string> errorMessages = {
        {ErrorCode::INVALID_CONFIGURATION, "Invalid configuration"},
        {ErrorCode::INVALID_OP_MODE, "Unknown sequence operation mode"},

        {ErrorCode::INVALID_INPUT, "Invalid input"},
        {ErrorCode::PROCESSING_ERROR, "Processing error"},

        {ErrorCode::IO_ERROR, "I/O error"},
        {ErrorCode::FILE_NOT_FOUND, "File not found"},

        {ErrorCode::SUCCESS, "Operation successful"}
    };
    return errorMessages;
}

std::string ErrorRegistry::getMessage(ErrorCode code) {
    const auto& registry = messages();
    auto it = registry.find(code);
    if (it != registry.end()) {
        return it->second;
    }
    return "Unknown error";
}

ErrorInfo ErrorRegistry::createError(ErrorCode code, const std::string& details) {
    return ErrorInfo(code, getMessage(code), details);
}

ErrorInfo ErrorInfo::fromError(const Error& error) {
    auto code = static_cast<ErrorCode>(error.code);
    return ErrorInfo(code, ErrorRegistry::getMessage(code), error.message);
}

std::string ErrorInfo::toJson() const {
    Json::Value root(Json::objectValue);
    root["code"] = static_cast<int>(code);
    root["name"] = getErrorCodeString(code);
    root["message"] = message;
    root["details"] = details;

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, root);
}

std::string ErrorInfo::getErrorCodeString(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_CONFIGURATION: return "INVALID_CONFIGURATION";
        case ErrorCode::INVALID_OP_MODE: return "INVALID_OP_MODE";
        case ErrorCode::INVALID_INPUT: return "INVALID_INPUT";
        case ErrorCode::PROCESSING_ERROR: return "PROCESSING_ERROR";
        case ErrorCode::IO_ERROR: return "IO_ERROR";
        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case ErrorCode::SUCCESS: return "SUCCESS";
    }
    return "UNKNOWN";
}

} // namespace Core
} // namespace SeqCDC
