/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THOR_SDK_RLP_KIND_HPP
#define THOR_SDK_RLP_KIND_HPP

#include <memory>
#include <string>
#include <variant>
#include <vector>
#include <thor/rlp/item.hpp>
#include <thor/rlp/value.hpp>

namespace thor_sdk::rlp {
    struct kind;
    struct profile;

    // non-negative integer stored as a minimal big-endian string, zero is empty
    struct numeric_kind {
        size_t max_bytes;
    };

    // binary data passed through unchanged
    struct buffer_kind {
    };

    // binary data of any length; text must be 0x-prefixed hex
    struct hex_blob_kind {
    };

    struct fixed_hex_blob_kind {
        size_t bytes;
    };

    // like fixed_hex_blob_kind but null and empty values encode as the empty string
    struct optional_fixed_hex_blob_kind {
        size_t bytes;
    };

    // fixed-size in memory, leading zero bytes are stripped on the wire
    struct compact_fixed_hex_blob_kind {
        size_t bytes;
    };

    struct array_kind {
        std::shared_ptr<const kind> item_kind;
    };

    // fields are matched by position only
    struct struct_kind {
        std::vector<profile> fields;
    };

    struct kind {
        using value_type = std::variant<numeric_kind, buffer_kind, hex_blob_kind, fixed_hex_blob_kind,
            optional_fixed_hex_blob_kind, compact_fixed_hex_blob_kind, array_kind, struct_kind>;

        kind(value_type &&val): _val { std::move(val) }
        {
        }

        const value_type &variant() const noexcept
        {
            return _val;
        }

        [[nodiscard]] item encode(const value &v, std::string_view path) const;
        [[nodiscard]] value decode(const item &it, std::string_view path) const;
    private:
        value_type _val;
    };

    struct profile {
        std::string name;
        kind type;
    };

    inline kind numeric(const size_t max_bytes)
    {
        return kind { numeric_kind { max_bytes } };
    }

    inline kind raw_buffer()
    {
        return kind { buffer_kind {} };
    }

    inline kind hex_blob()
    {
        return kind { hex_blob_kind {} };
    }

    inline kind fixed_hex_blob(const size_t bytes)
    {
        return kind { fixed_hex_blob_kind { bytes } };
    }

    inline kind optional_fixed_hex_blob(const size_t bytes)
    {
        return kind { optional_fixed_hex_blob_kind { bytes } };
    }

    inline kind compact_fixed_hex_blob(const size_t bytes)
    {
        return kind { compact_fixed_hex_blob_kind { bytes } };
    }

    inline kind array_of(kind &&item_kind)
    {
        return kind { array_kind { std::make_shared<const kind>(std::move(item_kind)) } };
    }

    inline kind struct_of(std::vector<profile> &&fields)
    {
        return kind { struct_kind { std::move(fields) } };
    }
}

#endif // !THOR_SDK_RLP_KIND_HPP
