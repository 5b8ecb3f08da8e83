#pragma once

#include <cstddef>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace proverd::utils {

inline std::string Join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << items[i];
    }
    return oss.str();
}

// Lower-case hex string of `length` characters from a per-thread engine
// seeded by std::random_device.
inline std::string RandomHex(std::size_t length) {
    static const char kDigits[] = "0123456789abcdef";
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 15);
    std::string out;
    out.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        out.push_back(kDigits[dist(engine)]);
    }
    return out;
}

}  // namespace proverd::utils
