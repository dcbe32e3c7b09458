#include "log_setup.hpp"
#include <cstdlib>
#include <cstring>

void configure_logging(spdlog::level::level_enum level) {
    if (const char *env = std::getenv("NEIGHBORGRID_LOG_LEVEL")) {
        //from_str() answers "off" for names it doesn't know
        auto parsed = spdlog::level::from_str(env);
        if (parsed != spdlog::level::off || std::strcmp(env, "off") == 0)
            level = parsed;
    }

    spdlog::set_level(level);
    spdlog::flush_on(spdlog::level::warn);
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
}
