/**
 * @file IdGenerator.cpp
 * @brief Implementation of IdGenerator.
 */

#include "infrastructure/IdGenerator.hpp"

#include <mutex>
#include <random>

namespace dealflow::infrastructure {

std::string IdGenerator::Generate(const std::string& prefix) {
    static const char hex[] = "0123456789abcdef";
    static std::mt19937_64 engine{std::random_device{}()};
    static std::mutex engineMutex;

    std::string s = prefix;
    s.reserve(prefix.size() + 32);

    std::lock_guard<std::mutex> lock(engineMutex);
    std::uniform_int_distribution<int> dist(0, 15);
    for (int i = 0; i < 32; ++i) {
        s += hex[dist(engine)];
    }
    return s;
}

} // namespace dealflow::infrastructure
