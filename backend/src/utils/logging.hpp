#pragma once
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/cfg/env.h>

namespace Log
{
    inline void init(const std::string& path = "trustgate.log")
    {
        // Create file logger
        auto file_logger = spdlog::basic_logger_mt("file_logger", path);

        // Make file logger the default
        spdlog::set_default_logger(file_logger);

        // Set global log pattern ONCE
        spdlog::set_pattern("[%d:%m:%Y:%H:%M:%S.%e] [%l] %v");

        // Level and flushing setup; SPDLOG_LEVEL=warn etc. overrides the default
        spdlog::set_level(spdlog::level::debug);
        spdlog::cfg::load_env_levels();
        spdlog::flush_on(spdlog::level::info);
    }

    // Masks SSNs, card numbers, bearer tokens and long opaque tokens, then
    // caps the length. Anything user-supplied goes through this before logging.
    std::string redact(const std::string& text);
}
