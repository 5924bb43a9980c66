/**
 * @file app.h
 * @brief Core application functionality
 */

#ifndef APP_H
#define APP_H

#include <ostream>
#include <string>
#include <vector>

namespace Greeting {

/**
 * @brief Compiled-in application configuration
 */
struct AppConfig {
    /// Names to greet, in output order.
    std::vector<std::string> names;
};

/**
 * @brief Default configuration: Alice, Bob, Charlie
 */
AppConfig defaultConfig();

/**
 * @brief Application initialization
 * @param config Configuration for this run
 * @return Success status
 */
bool initializeApp(const AppConfig& config);

/**
 * @brief Writes one greeting line per name, in order
 * @param out Destination stream
 * @param names Names to greet; an empty list writes nothing
 * @return False if the stream failed while writing
 */
bool greetAll(std::ostream& out, const std::vector<std::string>& names);

/**
 * @brief Application shutdown
 * @return Success status
 */
bool shutdownApp();

/**
 * @brief Runs the whole program against a configuration
 * @param config Configuration for this run
 * @param out Destination for the greeting lines
 * @return Process exit status
 */
int runApp(const AppConfig& config, std::ostream& out);

} // namespace Greeting

#endif // APP_H
