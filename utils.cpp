/**
 * @file utils.cpp
 * @brief Implementation of utility functions
 */

#include "utils.h"

namespace Greeting {

std::string concat(const std::string& a, const std::string& b) {
    std::string result;
    result.reserve(a.size() + b.size());
    result.append(a).append(b);
    return result;
}

} // namespace Greeting
