#pragma once

#include <string>
#include <unordered_map>

#include "Result.h"

namespace SeqCDC {
namespace Core {

enum class ErrorCode : int {
    // Configuration Errors (1000-1999)
    INVALID_CONFIGURATION = 1000,
    INVALID_OP_MODE = 1001,

    // Input / Processing Errors (2000-2999)
    INVALID_INPUT = 2000,
    PROCESSING_ERROR = 2001,

    // I/O Errors (3000-3999)
    IO_ERROR = 3000,
    FILE_NOT_FOUND = 3001,

    // Success
    SUCCESS = 0
};

class ErrorInfo {
public:
    ErrorCode code;
    std::string message;
    std::string details;

    ErrorInfo(ErrorCode code, const std::string& message, const std::string& details = "")
        : code(code), message(message), details(details) {}

    /// Convert a Result error into its registry form
    static ErrorInfo fromError(const Error& error);

    std::string toJson() const;
    static std::string getErrorCodeString(ErrorCode code);
};

class ErrorRegistry {
private:
    static const std::unordered_map<ErrorCode, std::string>& messages();

public:
    static std::string getMessage(ErrorCode code);
    static ErrorInfo createError(ErrorCode code, const std::string& details = "");
};

} // namespace Core

/**
 * @brief Build a Result error tagged with a registry code.
 */
inline Error makeError(Core::ErrorCode code, std::string message, std::string component = "") {
    return Error(std::move(message), static_cast<int>(code), std::move(component));
}

} // namespace SeqCDC
