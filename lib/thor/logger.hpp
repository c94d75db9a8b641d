/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THOR_SDK_LOGGER_HPP
#define THOR_SDK_LOGGER_HPP

#include <string>
#include <thor/common/error.hpp>
#include <thor/common/format.hpp>

namespace thor_sdk::logger {
    enum class level {
        trace, debug, info, warn, error
    };

    // THOR_DEBUG enables trace messages on the console
    extern bool &tracing_enabled();
    extern void log(level lev, const std::string &msg);

    template<typename... Args>
    void trace(fmt::format_string<Args...> f, Args&&... a)
    {
        if (tracing_enabled())
            log(level::trace, fmt::format(f, std::forward<Args>(a)...));
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> f, Args&&... a)
    {
        log(level::debug, fmt::format(f, std::forward<Args>(a)...));
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> f, Args&&... a)
    {
        log(level::info, fmt::format(f, std::forward<Args>(a)...));
    }

    template<typename... Args>
    void warn(fmt::format_string<Args...> f, Args&&... a)
    {
        log(level::warn, fmt::format(f, std::forward<Args>(a)...));
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> f, Args&&... a)
    {
        log(level::error, fmt::format(f, std::forward<Args>(a)...));
    }
}

#endif // !THOR_SDK_LOGGER_HPP
