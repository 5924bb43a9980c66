/**
 * @file main.cpp
 * @brief Main application entry point
 */

#include "core/app.h"
#include <iostream>

/**
 * @brief Main function - entry point of the application
 * @return Exit code
 */
int main() {
    return Greeting::runApp(Greeting::defaultConfig(), std::cout);
}
