/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THOR_SDK_ERROR_HPP
#define THOR_SDK_ERROR_HPP

#include <string>
#include <thor/common/error.hpp>
#include <thor/common/format.hpp>

namespace thor_sdk {
    // An error attributed to a named location inside an encoded or encodable record,
    // such as transaction.clauses[0].to
    struct path_error: error {
        path_error(const std::string_view path, const std::string_view msg):
            error { fmt::format("{}: {}", path, msg) }, _path { path }
        {
        }

        const std::string &path() const noexcept
        {
            return _path;
        }
    private:
        std::string _path;
    };

    // wrong byte length, out-of-range numeric or malformed hex
    struct field_error: path_error {
        using path_error::path_error;
    };

    // malformed RLP, unexpected structure or field count
    struct decode_error: path_error {
        using path_error::path_error;
    };

    struct signature_error: error {
        using error::error;
    };

    struct clause_error: error {
        using error::error;
    };
}

#endif // !THOR_SDK_ERROR_HPP
