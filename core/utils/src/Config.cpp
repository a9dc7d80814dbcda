#include "Config.h"
#include "ErrorCodes.h"

#include <charconv>
#include <fstream>
#include <utility>
#include <vector>

namespace SeqCDC {

    bool Config::loadFromFile(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            return false;
        }
        parse(file);
        return true;
    }

    void Config::parse(std::istream& in) {
        std::vector<std::pair<std::string, std::string>> entries;
        std::string line;
        while (std::getline(in, line)) {
            auto trimmed = trim(line);
            if (trimmed.empty() || trimmed[0] == '#') continue;

            size_t delimiterPos = trimmed.find('=');
            if (delimiterPos == std::string::npos) continue;

            std::string key = trim(trimmed.substr(0, delimiterPos));
            if (key.empty()) continue;
            entries.emplace_back(std::move(key), trim(trimmed.substr(delimiterPos + 1)));
        }

        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [key, value] : entries) {
            settings_[key] = std::move(value);
        }
    }

    bool Config::hasKey(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return settings_.count(key) > 0;
    }

    std::string Config::get(const std::string& key, const std::string& defaultValue) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = settings_.find(key);
        return it != settings_.end() ? it->second : defaultValue;
    }

    void Config::set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_[key] = value;
    }

    Result<std::uint64_t> Config::getUint64(const std::string& key, std::uint64_t defaultValue) const {
        if (!hasKey(key)) {
            return defaultValue;
        }

        const std::string val = get(key);
        std::uint64_t parsed = 0;
        const char* last = val.data() + val.size();
        auto [ptr, ec] = std::from_chars(val.data(), last, parsed);
        if (val.empty() || ec != std::errc() || ptr != last) {
            return makeError(Core::ErrorCode::INVALID_CONFIGURATION,
                             key + " must be a non-negative integer, got '" + val + "'", "Config");
        }
        return parsed;
    }

    std::string Config::trim(const std::string& value) {
        auto start = value.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) return "";
        auto end = value.find_last_not_of(" \t\r\n");
        return value.substr(start, end - start + 1);
    }

}
