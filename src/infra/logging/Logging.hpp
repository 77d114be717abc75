#pragma once

#include "config.hpp"

namespace termroute {

/**
 * @brief Installs the process-wide "termroute" logger: colored console sink
 * plus a rotating file sink, both at the configured level.
 * Safe to call more than once; the previous logger is replaced.
 */
void SetupLogging(const LoggingConfig& config);

}  // namespace termroute
