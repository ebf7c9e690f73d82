#pragma once

#include <string>
#include <string_view>
#include "boatcount/config.hpp"

namespace boatcount {

/**
 * @brief Load an AppConfig from a TOML file
 *
 * Each section ([detection], [tracker], [counter], [scheduler], [daylight],
 * [capture], [sinks], [logging], [replay]) overrides the defaults key by key.
 * Missing sections and keys keep their defaults. The result is validated.
 *
 * @throws ConfigError on a parse error, a wrong-typed key or an invalid value
 */
AppConfig loadConfig(const std::string& path);

/**
 * @brief Same as loadConfig() for TOML text already in memory
 */
AppConfig parseConfig(std::string_view text);

} // namespace boatcount
