/**
 * @file greeting.h
 * @brief Greeting formatter
 */

#ifndef GREETING_H
#define GREETING_H

#include <string>

namespace Greeting {

/// Text placed before the name.
extern const char* const kGreetingPrefix;

/// Text placed after the name.
extern const char* const kGreetingSuffix;

/**
 * @brief Formats a greeting for a name
 * @param name Name to greet, substituted verbatim (may be empty)
 * @return "Hello, " followed by name followed by "!"
 */
std::string greet(const std::string& name);

} // namespace Greeting

#endif // GREETING_H
