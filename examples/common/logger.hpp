#pragma once

#include <string>

#include "lcr/log/logger.hpp"


namespace reckon::examples {

    // Unknown names fall back to info (the CLI validator rejects them first)
    inline void set_log_level(const std::string& log_level, bool color = false) {
        using namespace lcr::log;
        Level level = Level::Info;
        if (!parse_level(log_level, level)) {
            level = Level::Info;
        }
        Logger::instance().set_level(level);
        Logger::instance().enable_color(color);
    }

} // namespace reckon::examples
