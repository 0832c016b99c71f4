// DexPilot - Logging Setup

#pragma once

#include <dexpilot/config.hpp>

namespace dexpilot {

// Installs the default "dexpilot" spdlog logger: colored stdout plus an
// optional rotating file. Throws ConfigError for an unknown level.
void init_logging(const LoggingConfig& config);

}  // namespace dexpilot
