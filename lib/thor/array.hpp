/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THOR_SDK_ARRAY_HPP
#define THOR_SDK_ARRAY_HPP

#include <array>
#include <cstring>
#include <span>
#include <thor/common/error.hpp>
#include <thor/common/format.hpp>
#include <thor/common/bytes.hpp>

namespace thor_sdk {
    template<size_t SZ>
    struct byte_array: std::array<uint8_t, SZ> {
        using base_type = std::array<uint8_t, SZ>;

        static byte_array<SZ> from_hex(const std::string_view hex)
        {
            byte_array<SZ> data;
            init_from_hex(data, strip_hex_prefix(hex));
            return data;
        }

        byte_array(): base_type {}
        {
        }

        byte_array(const std::initializer_list<uint8_t> s)
        {
            _copy_from(buffer { std::data(s), s.size() });
        }

        byte_array(const buffer s)
        {
            _copy_from(s);
        }

        byte_array &operator=(const buffer s)
        {
            _copy_from(s);
            return *this;
        }

        operator buffer() const noexcept
        {
            return { base_type::data(), SZ };
        }

        std::span<const uint8_t> span() const noexcept
        {
            return { base_type::data(), SZ };
        }
    private:
        void _copy_from(const buffer s)
        {
            if (s.size() != SZ) [[unlikely]]
                throw error(fmt::format("expected {} bytes but got {}", SZ, s.size()));
            std::copy(s.begin(), s.end(), base_type::begin());
        }
    };

    extern void secure_clear(std::span<uint8_t> store);

    template<size_t SZ>
    struct secure_byte_array: byte_array<SZ>
    {
        using byte_array<SZ>::byte_array;

        static secure_byte_array<SZ> from_hex(const std::string_view hex)
        {
            secure_byte_array<SZ> data;
            init_from_hex(data, strip_hex_prefix(hex));
            return data;
        }

        secure_byte_array() =default;
        secure_byte_array(const secure_byte_array<SZ> &) =default;
        secure_byte_array &operator=(const secure_byte_array<SZ> &) =default;

        ~secure_byte_array()
        {
            secure_clear(std::span<uint8_t> { this->data(), SZ });
        }
    };
}

namespace fmt {
    template<size_t SZ>
    struct formatter<thor_sdk::byte_array<SZ>>: formatter<std::span<const uint8_t>> {
        template<typename FormatContext>
        auto format(const thor_sdk::byte_array<SZ> &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return formatter<std::span<const uint8_t>>::format(v.span(), ctx);
        }
    };
}

#endif // !THOR_SDK_ARRAY_HPP
