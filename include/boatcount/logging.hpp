#pragma once

#include "boatcount/config.hpp"

namespace boatcount {

/**
 * @brief Install the default spdlog logger: colored stdout plus a rotating file
 *
 * Creates the log directory when missing. An unknown level name throws ConfigError.
 *
 * @throws spdlog::spdlog_ex if the log file cannot be opened
 */
void setupLogging(const LoggingConfig& config);

} // namespace boatcount
