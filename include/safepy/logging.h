#pragma once

#include "api_export.h"
#include <string>

namespace safepy {

// Configure the default spdlog logger.
// level: trace|debug|info|warn|error|critical|off (unknown names fall back to info)
// log_file: when non-empty, log to the console and append to this file
SAFEPY_API bool InitLogging(const std::string& level, const std::string& log_file = "");

} // namespace safepy
