#pragma once

#include <chrono>
#include <cstddef>
#include <utility>

namespace SeqCDC {

    class PerfUtils {
    public:
        using Duration = std::chrono::steady_clock::duration;

        /// Run func once and return its result with the wall time taken
        template<typename F>
        static auto measureTime(F&& func) -> std::pair<decltype(func()), Duration> {
            auto start = std::chrono::steady_clock::now();
            auto result = func();
            auto elapsed = std::chrono::steady_clock::now() - start;
            return {std::move(result), elapsed};
        }

        /// Decimal megabytes (10^6 bytes) per second; 0 for a zero duration
        static double throughputMBps(std::size_t bytes, Duration duration) {
            double seconds = std::chrono::duration<double>(duration).count();
            if (seconds == 0.0) {
                return 0.0;
            }
            return static_cast<double>(bytes) / (seconds * 1000000.0);
        }

        static double throughputBytesPerSec(std::size_t bytes, Duration duration) {
            double seconds = std::chrono::duration<double>(duration).count();
            if (seconds == 0.0) {
                return 0.0;
            }
            return static_cast<double>(bytes) / seconds;
        }
    };

}
