/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THOR_SDK_NARROW_CAST_HPP
#define THOR_SDK_NARROW_CAST_HPP

#include <concepts>
#include <limits>
#include <typeinfo>
#include <utility>
#include <thor/big_int.hpp>

namespace thor_sdk {
    template<std::integral TO, std::integral FROM>
    constexpr TO narrow_cast(const FROM from)
    {
        if (!std::in_range<TO>(from)) [[unlikely]]
            throw error(fmt::format("can't convert {} {} to {}: the value is {}", typeid(FROM).name(), from, typeid(TO).name(),
                std::cmp_less(from, 0) ? "too small" : "too big"));
        return static_cast<TO>(from);
    }

    // Fields decoded from RLP and JSON arrive as unbounded integers
    template<std::integral TO>
    TO narrow_cast(const cpp_int &from)
    {
        if (from < std::numeric_limits<TO>::min() || from > std::numeric_limits<TO>::max()) [[unlikely]]
            throw error(fmt::format("can't convert {} to {}: the value is out of range", from.str(), typeid(TO).name()));
        return static_cast<TO>(from);
    }
}

#endif // !THOR_SDK_NARROW_CAST_HPP
