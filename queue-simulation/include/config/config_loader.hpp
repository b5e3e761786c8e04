#pragma once

#include <string>

#include "model/config.hpp"

/** @brief Prefix of environment overrides, e.g. QUEUESIM_RANDOM_NUMWINDOWS. */
extern const char* const kEnvOverridePrefix;

/**
 * @brief Apply one "key = value" setting to the configuration.
 * @return false with err set for unknown keys or invalid values.
 */
bool applyConfigValue(const std::string& key, const std::string& value, Config& cfg, std::string& err);

/**
 * @brief Parse configuration text (key = value lines, '#' comments).
 * @return false with err set on the first invalid line.
 */
bool parseConfigText(const std::string& text, Config& cfg, std::string& err);

/**
 * @brief Apply QUEUESIM_<SECTION>_<KEY> environment overrides for scalar keys.
 */
bool applyEnvironmentOverrides(Config& cfg, std::string& err);

/**
 * @brief Check that the configuration describes at least one valid run and
 *        sort fixed customers by arrival time.
 */
bool validateConfig(Config& cfg, std::string& err);

/**
 * @brief Load key/value pairs from a config file, apply environment
 *        overrides, validate and normalize.
 * @param path path to config file.
 * @param cfg destination structure to fill (starts from defaults).
 * @param err error message on failure.
 * @return true if parsed and validated, false otherwise.
 */
bool loadConfigFile(const std::string& path, Config& cfg, std::string& err);
