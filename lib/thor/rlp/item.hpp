/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THOR_SDK_RLP_ITEM_HPP
#define THOR_SDK_RLP_ITEM_HPP

#include <variant>
#include <vector>
#include <thor/common/bytes.hpp>
#include <thor/error.hpp>

namespace thor_sdk::rlp {
    struct item;
    using item_list = std::vector<item>;

    // A node of the RLP tree: either a byte string or a list of nodes.
    struct item {
        using value_type = std::variant<uint8_vector, item_list>;

        item(): _val { uint8_vector {} }
        {
        }

        explicit item(uint8_vector &&bytes): _val { std::move(bytes) }
        {
        }

        explicit item(const buffer bytes): _val { uint8_vector(bytes) }
        {
        }

        item(item_list &&items): _val { std::move(items) }
        {
        }

        static item make_list(item_list &&items={})
        {
            return item { std::move(items) };
        }

        bool is_list() const noexcept
        {
            return std::holds_alternative<item_list>(_val);
        }

        const uint8_vector &bytes(const std::string_view path="rlp") const
        {
            if (const auto *b = std::get_if<uint8_vector>(&_val); b)
                return *b;
            throw decode_error(path, "expected a byte string but got a list");
        }

        const item_list &list(const std::string_view path="rlp") const
        {
            if (const auto *l = std::get_if<item_list>(&_val); l)
                return *l;
            throw decode_error(path, "expected a list but got a byte string");
        }

        const value_type &value() const noexcept
        {
            return _val;
        }

        bool operator==(const item &o) const
        {
            return _val == o._val;
        }
    private:
        value_type _val;
    };

    struct encoder {
        encoder &bytes(buffer data);
        encoder &list(const item_list &items);
        encoder &add(const item &it);

        [[nodiscard]] const uint8_vector &rlp() const
        {
            return _buf;
        }

        [[nodiscard]] uint8_vector &rlp()
        {
            return _buf;
        }
    private:
        uint8_vector _buf {};

        void _encode_header(uint8_t short_base, uint8_t long_base, size_t payload_size);
    };

    extern uint8_vector encode(const item &it);
    // Strict decoding: the input must contain exactly one canonically encoded item.
    extern item decode(buffer data, std::string_view path="rlp");
}

namespace fmt {
    template<>
    struct formatter<thor_sdk::rlp::item>: formatter<int> {
        template<typename FormatContext>
        auto format(const thor_sdk::rlp::item &it, FormatContext &ctx) const -> decltype(ctx.out()) {
            if (!it.is_list())
                return fmt::format_to(ctx.out(), "0x{}", it.bytes());
            auto out_it = fmt::format_to(ctx.out(), "[");
            const auto &items = it.list();
            for (auto i = items.begin(); i != items.end(); ++i)
                out_it = fmt::format_to(out_it, "{}{}", *i, std::next(i) == items.end() ? "" : ", ");
            return fmt::format_to(out_it, "]");
        }
    };
}

#endif // !THOR_SDK_RLP_ITEM_HPP
