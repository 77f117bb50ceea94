#pragma once
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace Log
{
    inline void applyDefaults()
    {
        // Set global log pattern ONCE
        spdlog::set_pattern("[%d:%m:%Y:%H:%M:%S.%e] [%l] %v");

        // Level and flushing setup
        spdlog::set_level(spdlog::level::debug);
        spdlog::flush_on(spdlog::level::info);
    }

    inline void init(const std::string& path = "flashcore.log")
    {
        auto file_logger = spdlog::get("file_logger");
        if (!file_logger)
            file_logger = spdlog::basic_logger_mt("file_logger", path);

        // Make file logger the default
        spdlog::set_default_logger(file_logger);
        applyDefaults();
    }

    // Console logger for tests and --verbose runs
    inline void initConsole(spdlog::level::level_enum level = spdlog::level::warn)
    {
        auto console = spdlog::get("console");
        if (!console)
            console = spdlog::stderr_color_mt("console");

        spdlog::set_default_logger(console);
        applyDefaults();
        spdlog::set_level(level);
    }
}
