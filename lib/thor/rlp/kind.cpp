/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <algorithm>
#include <thor/rlp/kind.hpp>

namespace thor_sdk::rlp {
    namespace {
        std::string field_path(const std::string_view path, const std::string_view name)
        {
            if (path.empty())
                return std::string { name };
            return fmt::format("{}.{}", path, name);
        }

        std::string element_path(const std::string_view path, const size_t idx)
        {
            return fmt::format("{}[{}]", path, idx);
        }

        cpp_int to_integer(const value &v, const std::string_view path)
        {
            if (v.is<cpp_int>()) {
                const auto &i = v.integer(path);
                if (i < 0)
                    throw field_error(path, fmt::format("negative value {} cannot be encoded", i.str()));
                return i;
            }
            if (v.is<std::string>()) {
                try {
                    return big_int_from_string(v.as<std::string>(path));
                } catch (const field_error &) {
                    throw;
                } catch (const error &ex) {
                    throw field_error(path, ex.what());
                }
            }
            throw field_error(path, fmt::format("expected an integer but got {}", v.type_name()));
        }

        // binary input is taken as is, text input must be 0x-prefixed hex
        uint8_vector to_blob(const value &v, const std::string_view path)
        {
            if (v.is<uint8_vector>())
                return v.bytes(path);
            if (v.is<std::string>()) {
                const auto &text = v.as<std::string>(path);
                if (!is_hex_0x(text))
                    throw field_error(path, fmt::format("expected 0x-prefixed hex with an even number of digits but got '{}'", text));
                return bytes_from_hex(text);
            }
            throw field_error(path, fmt::format("expected a byte string or hex text but got {}", v.type_name()));
        }

        uint8_vector to_fixed_blob(const value &v, const size_t bytes, const std::string_view path)
        {
            auto data = to_blob(v, path);
            if (data.size() != bytes)
                throw field_error(path, fmt::format("expected {} bytes, got {}", bytes, data.size()));
            return data;
        }

        bool is_empty_optional(const value &v)
        {
            if (v.is_null())
                return true;
            if (v.is<uint8_vector>())
                return v.bytes("").empty();
            if (v.is<std::string>()) {
                const auto &text = v.as<std::string>("");
                return text.empty() || text == "0x";
            }
            return false;
        }

        struct kind_encoder {
            const value &v;
            const std::string_view path;

            item operator()(const numeric_kind &k) const
            {
                auto bytes = big_int_to_bytes(to_integer(v, path));
                if (bytes.size() > k.max_bytes)
                    throw field_error(path, fmt::format("numeric value exceeds max_bytes ({}): {} bytes", k.max_bytes, bytes.size()));
                return item { std::move(bytes) };
            }

            item operator()(const buffer_kind &) const
            {
                if (!v.is<uint8_vector>())
                    throw field_error(path, fmt::format("expected a byte string but got {}", v.type_name()));
                return item { static_cast<buffer>(v.bytes(path)) };
            }

            item operator()(const hex_blob_kind &) const
            {
                return item { to_blob(v, path) };
            }

            item operator()(const fixed_hex_blob_kind &k) const
            {
                return item { to_fixed_blob(v, k.bytes, path) };
            }

            item operator()(const optional_fixed_hex_blob_kind &k) const
            {
                if (is_empty_optional(v))
                    return item {};
                return item { to_fixed_blob(v, k.bytes, path) };
            }

            item operator()(const compact_fixed_hex_blob_kind &k) const
            {
                const auto data = to_fixed_blob(v, k.bytes, path);
                size_t offset = 0;
                // an all-zero value keeps its last byte
                while (offset + 1 < data.size() && data[offset] == 0)
                    ++offset;
                return item { buffer { data.data() + offset, data.size() - offset } };
            }

            item operator()(const array_kind &k) const
            {
                const auto &elems = v.list(path);
                item_list items {};
                items.reserve(elems.size());
                for (size_t i = 0; i < elems.size(); ++i)
                    items.emplace_back(k.item_kind->encode(elems[i], element_path(path, i)));
                return item::make_list(std::move(items));
            }

            item operator()(const struct_kind &k) const
            {
                const auto &fields = v.map(path);
                item_list items {};
                items.reserve(k.fields.size());
                for (const auto &f: k.fields) {
                    const auto f_path = field_path(path, f.name);
                    const auto *f_val = fields.find(f.name);
                    if (!f_val)
                        throw field_error(f_path, "the field is missing");
                    items.emplace_back(f.type.encode(*f_val, f_path));
                }
                return item::make_list(std::move(items));
            }
        };

        struct kind_decoder {
            const item &it;
            const std::string_view path;

            value operator()(const numeric_kind &k) const
            {
                const auto &bytes = it.bytes(path);
                if (bytes.size() > k.max_bytes)
                    throw decode_error(path, fmt::format("numeric value exceeds max_bytes ({}): {} bytes", k.max_bytes, bytes.size()));
                if (!bytes.empty() && bytes[0] == 0)
                    throw decode_error(path, "non-canonical numeric value with leading zero bytes");
                return value { big_int_from_bytes(bytes) };
            }

            value operator()(const buffer_kind &) const
            {
                return value { static_cast<buffer>(it.bytes(path)) };
            }

            value operator()(const hex_blob_kind &) const
            {
                return value { static_cast<buffer>(it.bytes(path)) };
            }

            value operator()(const fixed_hex_blob_kind &k) const
            {
                const auto &bytes = it.bytes(path);
                if (bytes.size() != k.bytes)
                    throw decode_error(path, fmt::format("expected {} bytes, got {}", k.bytes, bytes.size()));
                return value { static_cast<buffer>(bytes) };
            }

            value operator()(const optional_fixed_hex_blob_kind &k) const
            {
                const auto &bytes = it.bytes(path);
                if (bytes.empty())
                    return value {};
                if (bytes.size() != k.bytes)
                    throw decode_error(path, fmt::format("expected {} bytes or none, got {}", k.bytes, bytes.size()));
                return value { static_cast<buffer>(bytes) };
            }

            value operator()(const compact_fixed_hex_blob_kind &k) const
            {
                const auto &bytes = it.bytes(path);
                if (bytes.size() > k.bytes)
                    throw decode_error(path, fmt::format("expected at most {} bytes, got {}", k.bytes, bytes.size()));
                if (bytes.size() > 1 && bytes[0] == 0)
                    throw decode_error(path, "non-canonical compact value with leading zero bytes");
                uint8_vector padded(k.bytes);
                std::copy(bytes.begin(), bytes.end(), padded.begin() + static_cast<ptrdiff_t>(k.bytes - bytes.size()));
                return value { std::move(padded) };
            }

            value operator()(const array_kind &k) const
            {
                const auto &items = it.list(path);
                value_list elems {};
                elems.reserve(items.size());
                for (size_t i = 0; i < items.size(); ++i)
                    elems.emplace_back(k.item_kind->decode(items[i], element_path(path, i)));
                return value { std::move(elems) };
            }

            value operator()(const struct_kind &k) const
            {
                const auto &items = it.list(path);
                if (items.size() != k.fields.size())
                    throw decode_error(path, fmt::format("structure field count mismatch: expected {}, got {}", k.fields.size(), items.size()));
                value_map fields {};
                fields.reserve(k.fields.size());
                for (size_t i = 0; i < items.size(); ++i) {
                    const auto &f = k.fields[i];
                    fields.emplace_back(f.name, f.type.decode(items[i], field_path(path, f.name)));
                }
                return value { std::move(fields) };
            }
        };
    }

    item kind::encode(const value &v, const std::string_view path) const
    {
        return std::visit(kind_encoder { v, path }, _val);
    }

    value kind::decode(const item &it, const std::string_view path) const
    {
        return std::visit(kind_decoder { it, path }, _val);
    }
}
