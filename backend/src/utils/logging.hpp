#pragma once
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace Log
{
    struct LogOptions
    {
        spdlog::level::level_enum level = spdlog::level::info;
        std::string file;   // empty = stderr only
    };

    // Accepts trace|debug|info|warn|error|off.
    inline bool parseLevel(const std::string& text, spdlog::level::level_enum& out)
    {
        static const char* names[] = {"trace", "debug", "info", "warn", "error", "off"};
        static const spdlog::level::level_enum levels[] = {
            spdlog::level::trace, spdlog::level::debug, spdlog::level::info,
            spdlog::level::warn, spdlog::level::err, spdlog::level::off};

        for (int i = 0; i < 6; ++i) {
            if (text == names[i]) {
                out = levels[i];
                return true;
            }
        }
        return false;
    }

    inline void init(const LogOptions& options = LogOptions())
    {
        // stdout is reserved for the report
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (!options.file.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.file));
        }

        auto logger = std::make_shared<spdlog::logger>("waypoint", sinks.begin(), sinks.end());
        spdlog::set_default_logger(logger);

        // Set global log pattern ONCE
        spdlog::set_pattern("[%d:%m:%Y:%H:%M:%S.%e] [%l] %v");

        spdlog::set_level(options.level);
        spdlog::flush_on(spdlog::level::warn);
    }
}
