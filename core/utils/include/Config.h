#pragma once

#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <string>
#include <unordered_map>

#include "Result.h"

namespace SeqCDC {

    /**
     * @brief Thread-safe key=value settings store.
     *
     * Files are plain `key=value` lines; blank lines and lines starting
     * with '#' are ignored and whitespace around keys and values is trimmed.
     * Later lines override earlier ones, and loading a file overrides keys
     * already set.
     */
    class Config {
    public:
        Config() = default;

        bool loadFromFile(const std::string& path);

        bool hasKey(const std::string& key) const;

        std::string get(const std::string& key, const std::string& defaultValue = "") const;
        void set(const std::string& key, const std::string& value);

        /**
         * @brief Strict unsigned lookup.
         * @return defaultValue when the key is absent, an error when the
         *         stored value is not a non-negative integer.
         */
        Result<std::uint64_t> getUint64(const std::string& key, std::uint64_t defaultValue) const;

    private:
        std::unordered_map<std::string, std::string> settings_;
        mutable std::mutex mutex_;

        static std::string trim(const std::string& value);
        void parse(std::istream& in);
    };

}
