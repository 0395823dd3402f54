#pragma once

#include <spdlog/spdlog.h>

namespace rex {

// log to stderr at console_log_level.
// all library code logs through the default spdlog logger.
void init_log(spdlog::level::level_enum console_log_level);

} // namespace rex
