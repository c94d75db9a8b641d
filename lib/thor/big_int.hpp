/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THOR_SDK_BIG_INT_HPP
#define THOR_SDK_BIG_INT_HPP

#include <sstream>
#include <boost/multiprecision/cpp_int.hpp>
#include <thor/common/bytes.hpp>

namespace thor_sdk {
    using boost::multiprecision::cpp_int;

    // 256-bit integers are the widest numeric fields in the wire format
    static constexpr size_t big_int_max_size = 32;

    inline cpp_int big_int_from_bytes(const buffer data)
    {
        if (data.size() > big_int_max_size)
            throw error(fmt::format("big ints larger than {} bytes are not supported but got: {}", big_int_max_size, data.size()));
        cpp_int val {};
        for (const uint8_t b: data) {
            val <<= 8;
            val |= b;
        }
        return val;
    }

    // minimal big-endian representation: zero is the empty byte string
    inline uint8_vector big_int_to_bytes(const cpp_int &val)
    {
        if (val < 0)
            throw error(fmt::format("negative values cannot be encoded as unsigned integers: {}", val.str()));
        uint8_vector res {};
        boost::multiprecision::export_bits(val, std::back_inserter(res), 8);
        if (res.size() == 1 && res[0] == 0)
            res.clear();
        return res;
    }

    // accepts decimal text or 0x-prefixed hex text
    inline cpp_int big_int_from_string(const std::string_view text)
    {
        if (text.empty())
            throw error("an empty string is not a valid integer");
        if (has_hex_prefix(text)) {
            const auto digits = text.substr(2);
            if (digits.empty())
                throw error(fmt::format("hex integer has no digits: '{}'", text));
            cpp_int val {};
            for (const char c: digits) {
                val <<= 4;
                val |= uint_from_hex(c);
            }
            return val;
        }
        cpp_int val {};
        for (const char c: text) {
            if (c < '0' || c > '9')
                throw error(fmt::format("unexpected character '{}' in a decimal integer: '{}'", c, text));
            val *= 10;
            val += c - '0';
        }
        return val;
    }
}

namespace fmt {
    template<typename T>
    struct formatter<boost::multiprecision::number<T>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            std::ostringstream ss {};
            ss << v;
            return fmt::format_to(ctx.out(), "{}", ss.str());
        }
    };
}

#endif // !THOR_SDK_BIG_INT_HPP
