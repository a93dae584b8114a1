#pragma once

#include "taildrive/core/result.hpp"

#include <string>

namespace taildrive {

/**
 * @brief Install the process-wide spdlog logger
 *
 * Logs go to a colour console sink with the pattern "[%H:%M:%S] [%^%l%$] %v".
 * When `log_file` is non-empty a rotating file sink (5 MiB, 3 files) is
 * added beside it. `level` is one of trace, debug, info, warn, error,
 * critical, off.
 */
Result<void> init_logging(const std::string& level, const std::string& log_file = "");

} // namespace taildrive
