#pragma once

#include <string>

namespace SeqCDC {
    struct Version {
        static constexpr int MAJOR = 0;
        static constexpr int MINOR = 3;
        static constexpr int PATCH = 1;
        static constexpr const char* STRING = "0.3.1";

        static std::string toString() {
            return std::string(STRING);
        }
    };
}
