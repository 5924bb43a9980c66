/**
 * @file utils.h
 * @brief Utility functions
 */

#ifndef UTILS_H
#define UTILS_H

#include <string>

namespace Greeting {

/**
 * @brief String concatenation utility
 * @param a First string
 * @param b Second string
 * @return Concatenated result
 */
std::string concat(const std::string& a, const std::string& b);

} // namespace Greeting

#endif // UTILS_H
