#ifndef NEIGHBORGRID_EXAMPLES_LOG_SETUP_HPP
#define NEIGHBORGRID_EXAMPLES_LOG_SETUP_HPP

#include <spdlog/spdlog.h>

//console logger shared by the demos; NEIGHBORGRID_LOG_LEVEL (e.g. "debug") overrides level
void configure_logging(spdlog::level::level_enum level = spdlog::level::info);

#endif
