#pragma once

#include <atomic>
#include <string>
#include <mutex>
#include <fstream>
#include <iostream>

#include "Result.h"

namespace SeqCDC {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR,
        CRITICAL
    };

    class Logger {
    public:
        static Logger& instance();

        void setLogFile(const std::string& path);
        void setLevel(LogLevel level);
        void setMaxFileSize(size_t maxSizeMB); // Set max log file size before rotation
        void setComponent(const std::string& component); // Set default component name
        void setConsoleOutput(bool enabled);

        // Level checking for conditional logging (avoid string construction overhead)
        bool isDebugEnabled() const { return currentLevel_ <= LogLevel::DEBUG; }
        bool isInfoEnabled() const { return currentLevel_ <= LogLevel::INFO; }
        LogLevel getLevel() const { return currentLevel_; }

        void log(LogLevel level, const std::string& message, const std::string& component = "");

        // Helper methods
        void debug(const std::string& message, const std::string& component = "");
        void info(const std::string& message, const std::string& component = "");
        void warn(const std::string& message, const std::string& component = "");
        void error(const std::string& message, const std::string& component = "");
        void critical(const std::string& message, const std::string& component = "");

        static std::string levelToString(LogLevel level);
        static Result<LogLevel> parseLevel(const std::string& name);

    private:
        Logger() = default;
        ~Logger();

        std::mutex mutex_;
        std::ofstream logFile_;
        std::string logFilePath_;
        std::atomic<LogLevel> currentLevel_{LogLevel::INFO};
        std::atomic<bool> consoleOutput_{true};
        std::string defaultComponent_ = "SeqCDC";
        size_t maxFileSizeMB_ = 100; // Default 100MB
        size_t currentFileSize_ = 0;

        std::string getCurrentTime();
        void writeEntry(LogLevel level, const std::string& entry);
        void rotateLogFile();
        void checkAndRotate();
        size_t getFileSize();
    };

}
