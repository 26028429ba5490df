/**
 * @file IdGenerator.hpp
 * @brief Opaque identifiers for decisions, plans and conflicts.
 */

#pragma once

#include <string>

namespace dealflow::infrastructure {

class IdGenerator {
public:
    /** @brief Returns a random 32-character hex id with the given prefix ("dec-", "coord-"). */
    static std::string Generate(const std::string& prefix = "");
};

} // namespace dealflow::infrastructure
