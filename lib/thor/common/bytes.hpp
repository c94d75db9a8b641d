/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THOR_SDK_COMMON_BYTES_HPP
#define THOR_SDK_COMMON_BYTES_HPP

#include <algorithm>
#include <cctype>
#include <compare>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "error.hpp"
#include "format.hpp"

namespace thor_sdk {
    struct buffer: std::span<const uint8_t> {
        buffer() =default;
        buffer(const buffer &) =default;

        template <typename T, size_t SZ>
        buffer(const std::span<T, SZ> bytes):
            buffer { reinterpret_cast<const uint8_t *>(bytes.data()), bytes.size() * sizeof(T) }
        {
        }

        buffer(const uint8_t *data, const size_t sz):
            std::span<const uint8_t> { data, sz }
        {
        }

        buffer(const std::string_view s):
            buffer { reinterpret_cast<const uint8_t *>(s.data()), s.size() }
        {
        }

        buffer(const std::string &s):
            buffer { reinterpret_cast<const uint8_t *>(s.data()), s.size() }
        {
        }

        buffer &operator=(const buffer &o) =default;

        operator std::string_view() const noexcept
        {
            return { reinterpret_cast<const char *>(data()), size() };
        }

        std::strong_ordering operator<=>(const buffer &o) const noexcept
        {
            return std::lexicographical_compare_three_way(begin(), end(), o.begin(), o.end());
        }

        bool operator==(const buffer &o) const noexcept
        {
            return size() == o.size() && std::equal(begin(), end(), o.begin());
        }

        buffer subbuf(const size_t offset, const size_t sz) const
        {
            if (offset > size() || sz > size() - offset) [[unlikely]]
                throw error(fmt::format("a slice at {} of {} bytes does not fit into a buffer of {} bytes", offset, sz, size()));
            return buffer { data() + offset, sz };
        }

        buffer subbuf(const size_t offset) const
        {
            if (offset > size()) [[unlikely]]
                throw error(fmt::format("offset {} is past the end of a buffer of {} bytes", offset, size()));
            return buffer { data() + offset, size() - offset };
        }
    };

    inline uint8_t uint_from_hex(const char k)
    {
        if (k >= '0' && k <= '9')
            return k - '0';
        if (k >= 'a' && k <= 'f')
            return k - 'a' + 10;
        if (k >= 'A' && k <= 'F')
            return k - 'A' + 10;
        throw error(fmt::format("unexpected character in a hex number: '{}'", k));
    }

    inline bool has_hex_prefix(const std::string_view hex) noexcept
    {
        return hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X');
    }

    inline std::string_view strip_hex_prefix(const std::string_view hex) noexcept
    {
        return has_hex_prefix(hex) ? hex.substr(2) : hex;
    }

    // true only for 0x-prefixed text with an even number of hex digits
    inline bool is_hex_0x(const std::string_view hex) noexcept
    {
        if (!has_hex_prefix(hex) || hex.size() % 2 != 0)
            return false;
        return std::all_of(hex.begin() + 2, hex.end(), [](const char c) {
            return std::isxdigit(static_cast<unsigned char>(c)) != 0;
        });
    }

    inline void init_from_hex(std::span<uint8_t> out, const std::string_view hex)
    {
        if (hex.size() != out.size() * 2)
            throw error(fmt::format("hex string must have {} characters but got {}: {}", out.size() * 2, hex.size(), hex));
        for (size_t i = 0; i < out.size(); ++i)
            out[i] = uint_from_hex(hex[i * 2]) << 4 | uint_from_hex(hex[i * 2 + 1]);
    }

    struct uint8_vector: std::vector<uint8_t> {
        static uint8_vector from_hex(const std::string_view hex)
        {
            if (hex.size() % 2 != 0)
                throw error(fmt::format("hex string must have an even number of characters but got {}", hex.size()));
            uint8_vector data(hex.size() / 2);
            init_from_hex(data, hex);
            return data;
        }

        uint8_vector() =default;

        uint8_vector(const std::initializer_list<uint8_t> bytes):
            std::vector<uint8_t>(bytes)
        {
        }

        uint8_vector(const size_t sz):
            std::vector<uint8_t>(sz)
        {
        }

        uint8_vector(const size_t sz, const uint8_t fill):
            std::vector<uint8_t>(sz, fill)
        {
        }

        uint8_vector(const buffer bytes):
            std::vector<uint8_t>(bytes.begin(), bytes.end())
        {
        }

        operator buffer() const noexcept
        {
            return { data(), size() };
        }

        std::string_view str() const noexcept
        {
            return { reinterpret_cast<const char *>(data()), size() };
        }

        std::strong_ordering operator<=>(const uint8_vector &o) const noexcept
        {
            return static_cast<buffer>(*this) <=> static_cast<buffer>(o);
        }

        bool operator==(const uint8_vector &o) const noexcept
        {
            return static_cast<buffer>(*this) == static_cast<buffer>(o);
        }

        bool operator==(const buffer &o) const noexcept
        {
            return static_cast<buffer>(*this) == o;
        }
    };

    inline uint8_vector &operator<<(uint8_vector &v, const uint8_t b)
    {
        v.emplace_back(b);
        return v;
    }

    inline uint8_vector &operator<<(uint8_vector &v, const buffer buf)
    {
        v.insert(v.end(), buf.begin(), buf.end());
        return v;
    }

    // accepts text with or without the 0x prefix
    inline uint8_vector bytes_from_hex(const std::string_view hex)
    {
        return uint8_vector::from_hex(strip_hex_prefix(hex));
    }

    inline std::string to_hex_0x(const buffer bytes)
    {
        return fmt::format("0x{}", static_cast<std::span<const uint8_t>>(bytes));
    }
}

namespace fmt {
    template<>
    struct formatter<thor_sdk::buffer>: formatter<std::span<const uint8_t>> {
    };

    template<>
    struct formatter<thor_sdk::uint8_vector>: formatter<std::span<const uint8_t>> {
        template<typename FormatContext>
        auto format(const thor_sdk::uint8_vector &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return formatter<std::span<const uint8_t>>::format(std::span<const uint8_t> { v.data(), v.size() }, ctx);
        }
    };
}

#endif // !THOR_SDK_COMMON_BYTES_HPP
