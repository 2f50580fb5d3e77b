#pragma once
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include "../config/Config.hpp"
#include "../core/Errors.hpp"

namespace Log
{
    inline void init(const LogConfig& cfg)
    {
        auto level = spdlog::level::from_str(cfg.level);
        if (level == spdlog::level::off && cfg.level != "off")
        {
            throw InvalidArgument("unknown log level '" + cfg.level + "'");
        }

        // File logger becomes the default so every component's spdlog:: call lands there
        auto file_logger = spdlog::basic_logger_mt("flashgram", cfg.file);
        spdlog::set_default_logger(file_logger);

        // Set global log pattern ONCE
        spdlog::set_pattern("[%d:%m:%Y:%H:%M:%S.%e] [%l] %v");

        spdlog::set_level(level);
        spdlog::flush_on(spdlog::level::info);
    }
}
