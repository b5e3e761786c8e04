#pragma once

#include <string>
#include <vector>

/** @brief Strip leading/trailing whitespace (spaces, tabs, CR, LF). */
std::string trimLine(const std::string& s);

/** @brief Split string by delimiter into trimmed parts. */
std::vector<std::string> split(const std::string& line, char delim);

/** @brief Strict integer parse of the whole string. */
bool toInt(const std::string& s, int& out);

/** @brief Strict unsigned parse of the whole string. */
bool toUnsigned(const std::string& s, unsigned int& out);

/** @brief Strict floating-point parse of the whole string. */
bool toDouble(const std::string& s, double& out);
