/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */

#ifndef SPDLOG_FMT_EXTERNAL
#   define SPDLOG_FMT_EXTERNAL 1
#endif
#include <cstdlib>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <thor/logger.hpp>

namespace thor_sdk::logger {
    bool &tracing_enabled()
    {
        static bool enabled = std::getenv("THOR_DEBUG") != nullptr;
        return enabled;
    }

    static spdlog::logger create()
    {
        std::vector<spdlog::sink_ptr> sinks {};
        // THOR_LOG_NO_CONSOLE silences stderr, THOR_LOG adds a file sink with every message
        if (!std::getenv("THOR_LOG_NO_CONSOLE")) {
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_level(tracing_enabled() ? spdlog::level::trace : spdlog::level::info);
            console_sink->set_pattern("[%^%l%$] %v");
            sinks.emplace_back(std::move(console_sink));
        }
        if (const char *path = std::getenv("THOR_LOG"); path) {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path);
            file_sink->set_level(spdlog::level::trace);
            file_sink->set_pattern("[%Y-%m-%d %T %z] [%P:%t] [%n] [%l] %v");
            sinks.emplace_back(std::move(file_sink));
        }
        spdlog::logger l { "thor", sinks.begin(), sinks.end() };
        l.set_level(tracing_enabled() ? spdlog::level::trace : spdlog::level::debug);
        l.flush_on(spdlog::level::warn);
        return l;
    }

    static spdlog::logger &get()
    {
        static spdlog::logger l = create();
        return l;
    }

    static spdlog::level::level_enum to_spdlog(const level lev)
    {
        switch (lev) {
            case level::trace: return spdlog::level::trace;
            case level::debug: return spdlog::level::debug;
            case level::info: return spdlog::level::info;
            case level::warn: return spdlog::level::warn;
            case level::error: return spdlog::level::err;
            default: throw thor_sdk::error(fmt::format("unsupported log level: {}", static_cast<int>(lev)));
        }
    }

    void log(const level lev, const std::string &msg)
    {
        get().log(to_spdlog(lev), msg);
    }
}
