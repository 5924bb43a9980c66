/**
 * @file greeting.cpp
 * @brief Implementation of the greeting formatter
 */

#include "greeting.h"
#include "utils.h"

namespace Greeting {

const char* const kGreetingPrefix = "Hello, ";
const char* const kGreetingSuffix = "!";

std::string greet(const std::string& name) {
    return concat(concat(kGreetingPrefix, name), kGreetingSuffix);
}

} // namespace Greeting
