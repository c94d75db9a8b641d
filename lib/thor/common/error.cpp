/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <cerrno>
#include <cstring>
#include <boost/interprocess/streams/bufferstream.hpp>
#include <boost/stacktrace.hpp>
#include "error.hpp"
#include "format.hpp"
#include <thor/logger.hpp>

namespace thor_sdk {
    base_error::base_error(const std::string_view msg):
        _msg { msg }
    {
        // skip the frames of safe_dump_to, this constructor and the derived one
        boost::stacktrace::safe_dump_to(3, _trace.data(), _trace.size());
    }

    const char *base_error::what() const noexcept
    {
        if (logger::tracing_enabled()) {
            thread_local std::array<char, 0x2000> buf {};
            boost::interprocess::obufferstream os { buf.data(), buf.size() - 1 };
            os << boost::stacktrace::stacktrace::from_dump(_trace.data(), _trace.size());
            buf[os.buffer().second] = 0;
            logger::trace("{} raised at:\n{}", _msg, buf.data());
        }
        return _msg.c_str();
    }

    error::error(const std::string_view msg)
        : base_error { msg }
    {
    }

    error::error(const std::string_view msg, const std::exception &ex)
        : error { fmt::format("{} caused by {}: {}", msg, typeid(ex).name(), ex.what()) }
    {
    }

    error_sys::error_sys(const std::string_view msg)
        : error { fmt::format("{} errno: {} strerror: {}", msg, errno, std::strerror(errno)) }
    {
    }
}
