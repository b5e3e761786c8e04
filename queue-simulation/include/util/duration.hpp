#pragma once

#include <string>

/**
 * @brief Parse a duration given as plain seconds ("90", "1.5") or as
 *        space-separated unit parts ("1m 30s", "2h", "250ms").
 * @param text input text.
 * @param seconds parsed value in seconds.
 * @param err error message on failure.
 * @return true on success, false otherwise.
 */
bool parseDuration(const std::string& text, double& seconds, std::string& err);

/** @brief Compact human form, e.g. "0s", "1m 30s", "2h 5ms". */
std::string formatDuration(double seconds);

/**
 * @brief Right-aligned 30-column form for table output, zero padded after
 *        the leading unit ("1h 02min 03s 004ms"); "INVALID" for negatives.
 */
std::string formatDurationFixedWidth(double seconds);
