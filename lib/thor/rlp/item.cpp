/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <thor/rlp/item.hpp>

namespace thor_sdk::rlp {
    static constexpr uint8_t short_string_base = 0x80;
    static constexpr uint8_t long_string_base = 0xB7;
    static constexpr uint8_t short_list_base = 0xC0;
    static constexpr uint8_t long_list_base = 0xF7;
    static constexpr size_t short_max_size = 55;
    static constexpr size_t max_depth = 64;

    void encoder::_encode_header(const uint8_t short_base, const uint8_t long_base, const size_t payload_size)
    {
        if (payload_size <= short_max_size) {
            _buf << static_cast<uint8_t>(short_base + payload_size);
            return;
        }
        uint8_t len_be[sizeof(size_t)];
        size_t len_size = 0;
        for (size_t sz = payload_size; sz; sz >>= 8)
            len_be[sizeof(len_be) - 1 - len_size++] = static_cast<uint8_t>(sz & 0xFF);
        _buf << static_cast<uint8_t>(long_base + len_size);
        _buf << buffer { len_be + sizeof(len_be) - len_size, len_size };
    }

    encoder &encoder::bytes(const buffer data)
    {
        if (data.size() != 1 || data[0] >= short_string_base)
            _encode_header(short_string_base, long_string_base, data.size());
        _buf << data;
        return *this;
    }

    encoder &encoder::list(const item_list &items)
    {
        encoder payload {};
        for (const auto &it: items)
            payload.add(it);
        _encode_header(short_list_base, long_list_base, payload.rlp().size());
        _buf << payload.rlp();
        return *this;
    }

    encoder &encoder::add(const item &it)
    {
        if (it.is_list())
            return list(it.list());
        return bytes(it.bytes());
    }

    uint8_vector encode(const item &it)
    {
        encoder enc {};
        enc.add(it);
        return std::move(enc.rlp());
    }

    namespace {
        struct decoder {
            decoder(const buffer data, const std::string_view path): _data { data }, _path { path }
            {
            }

            item read(const size_t depth=0)
            {
                if (depth > max_depth)
                    throw decode_error(_path, fmt::format("nesting is deeper than {} levels", max_depth));
                const uint8_t prefix = _next_byte();
                if (prefix < short_string_base)
                    return item { buffer { &_data[_pos - 1], 1 } };
                if (prefix < short_list_base) {
                    const auto sz = _read_size(prefix, short_string_base, long_string_base);
                    const auto payload = _take(sz);
                    if (sz == 1 && payload[0] < short_string_base)
                        throw decode_error(_path, fmt::format("non-canonical encoding of a single byte 0x{:02x} at offset {}", payload[0], _pos - 2));
                    return item { payload };
                }
                const auto sz = _read_size(prefix, short_list_base, long_list_base);
                const auto payload = _take(sz);
                decoder nested { payload, _path };
                item_list items {};
                while (!nested.done())
                    items.emplace_back(nested.read(depth + 1));
                return item::make_list(std::move(items));
            }

            bool done() const noexcept
            {
                return _pos >= _data.size();
            }

            size_t pos() const noexcept
            {
                return _pos;
            }
        private:
            const buffer _data;
            const std::string_view _path;
            size_t _pos = 0;

            uint8_t _next_byte()
            {
                if (_pos >= _data.size())
                    throw decode_error(_path, fmt::format("unexpected end of data at offset {}", _pos));
                return _data[_pos++];
            }

            buffer _take(const size_t sz)
            {
                if (sz > _data.size() - _pos)
                    throw decode_error(_path, fmt::format("an item of {} bytes at offset {} runs over the end of the data of {} bytes", sz, _pos, _data.size()));
                const buffer res = _data.subbuf(_pos, sz);
                _pos += sz;
                return res;
            }

            size_t _read_size(const uint8_t prefix, const uint8_t short_base, const uint8_t long_base)
            {
                if (prefix <= long_base)
                    return prefix - short_base;
                const size_t len_size = prefix - long_base;
                if (len_size > sizeof(uint32_t))
                    throw decode_error(_path, fmt::format("the length of length {} at offset {} is not supported", len_size, _pos - 1));
                const auto len_be = _take(len_size);
                if (len_be[0] == 0)
                    throw decode_error(_path, fmt::format("non-canonical length with leading zeros at offset {}", _pos - len_size));
                size_t sz = 0;
                for (const auto b: len_be)
                    sz = (sz << 8) | b;
                if (sz <= short_max_size)
                    throw decode_error(_path, fmt::format("non-canonical long-form length {} at offset {}", sz, _pos - len_size - 1));
                return sz;
            }
        };
    }

    item decode(const buffer data, const std::string_view path)
    {
        decoder dec { data, path };
        auto res = dec.read();
        if (!dec.done())
            throw decode_error(path, fmt::format("{} trailing bytes after the end of the encoded item", data.size() - dec.pos()));
        return res;
    }
}
