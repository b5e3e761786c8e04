#pragma once

#include <string>

/**
 * @brief Print a fatal message to stderr and exit with EXIT_FAILURE.
 */
[[noreturn]] void die(const std::string& message);

/**
 * @brief Log a message along with errno details (perror style).
 */
void logErrno(const std::string& message);

/**
 * @brief Report a non-fatal runtime anomaly on stderr.
 */
void logWarning(const std::string& message);
