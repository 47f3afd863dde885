#pragma once

#include "fieldsync/core/config.hpp"

namespace fieldsync {

/**
 * @brief Install the process-wide spdlog logger
 *
 * Resolution order for level and pattern: FIELDSYNC_LOG_LEVEL /
 * FIELDSYNC_LOG_PATTERN environment variables, then the config, then the
 * built-in defaults. When LoggingConfig::file is set a rotating file sink is
 * added next to the console sink.
 */
void init_logging(const LoggingConfig& config);

void shutdown_logging();

} // namespace fieldsync
