/**
 * @file LoggerMacros.h
 * @brief Level-gated logging macros
 *
 * The *_IF macros skip message construction entirely when the level is
 * disabled, which matters on the chunking path.
 *
 * Example:
 *   LOG_DEBUG_COMP_IF("Emitted " + std::to_string(n) + " chunks", "ChunkIterator");
 */

#pragma once

#include <chrono>
#include <string>

#include "Logger.h"

namespace SeqCDC {

#define LOG_DEBUG_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::SeqCDC::Logger::instance(); \
        if (logger__.isDebugEnabled()) { \
            logger__.debug(msg, component); \
        } \
    } while(0)

#define LOG_INFO_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::SeqCDC::Logger::instance(); \
        if (logger__.isInfoEnabled()) { \
            logger__.info(msg, component); \
        } \
    } while(0)

#define LOG_WARN_COMP(msg, component) ::SeqCDC::Logger::instance().warn(msg, component)
#define LOG_ERROR_COMP(msg, component) ::SeqCDC::Logger::instance().error(msg, component)
#define LOG_CRITICAL_COMP(msg, component) ::SeqCDC::Logger::instance().critical(msg, component)

// Scoped performance timer (logs elapsed time on destruction)
class ScopedTimer {
public:
    explicit ScopedTimer(const std::string& name, const std::string& component = "Performance")
        : name_(name), component_(component), start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto end = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start_).count();

        auto& logger = Logger::instance();
        if (logger.isDebugEnabled()) {
            logger.debug(name_ + " took " + std::to_string(duration) + "ms", component_);
        }
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    std::string name_;
    std::string component_;
    std::chrono::steady_clock::time_point start_;
};

#define SCOPED_TIMER_COMP(name, component) ::SeqCDC::ScopedTimer timer__(name, component)

} // namespace SeqCDC
