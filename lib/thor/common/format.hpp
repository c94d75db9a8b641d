/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THOR_SDK_COMMON_FORMAT_HPP
#define THOR_SDK_COMMON_FORMAT_HPP

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#ifndef _MSC_VER
#   pragma GCC diagnostic push
#   pragma GCC diagnostic ignored "-Wpragmas"
#   ifndef __clang__
#       pragma GCC diagnostic ignored "-Wdangling-reference"
#       pragma GCC diagnostic ignored "-Warray-bounds"
#       pragma GCC diagnostic ignored "-Wstringop-overflow"
#   endif
#endif
#include <fmt/core.h>
#include <fmt/format.h>
#ifndef _MSC_VER
#   pragma GCC diagnostic pop
#endif

#include "error.hpp"

namespace thor_sdk {
    using fmt::format;
}

namespace fmt {
    // lowercase hex without a prefix, the base of every byte-container formatter
    template<>
    struct formatter<std::span<const uint8_t>>: formatter<int> {
        template<typename FormatContext>
        auto format(const std::span<const uint8_t> &data, FormatContext &ctx) const -> decltype(ctx.out()) {
            static constexpr std::string_view digits { "0123456789abcdef" };
            auto out_it = ctx.out();
            for (const uint8_t v: data) {
                *out_it++ = digits[v >> 4];
                *out_it++ = digits[v & 0xF];
            }
            return out_it;
        }
    };

    template<typename T, typename A>
    struct formatter<std::vector<T, A>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            auto out_it = fmt::format_to(ctx.out(), "[");
            bool first = true;
            for (const auto &item: v) {
                out_it = fmt::format_to(out_it, first ? "{}" : ", {}", item);
                first = false;
            }
            return fmt::format_to(out_it, "]");
        }
    };

    template<typename T>
    struct formatter<std::optional<T>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            if (v)
                return fmt::format_to(ctx.out(), "{}", *v);
            return fmt::format_to(ctx.out(), "none");
        }
    };
}

#endif // !THOR_SDK_COMMON_FORMAT_HPP
