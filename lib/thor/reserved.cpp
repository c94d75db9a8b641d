/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <thor/narrow-cast.hpp>
#include <thor/reserved.hpp>

namespace thor_sdk {
    rlp::value reserved::to_value() const
    {
        rlp::value_list elems {};
        if (!empty()) {
            elems.emplace_back(big_int_to_bytes(features));
            for (const auto &u: unused)
                elems.emplace_back(static_cast<buffer>(u));
        }
        return rlp::value { std::move(elems) };
    }

    reserved reserved::from_value(const rlp::value &v, const std::string_view path)
    {
        const auto &elems = v.list(path);
        reserved res {};
        if (elems.empty())
            return res;
        const auto features_path = fmt::format("{}[0]", path);
        const auto &f_bytes = elems[0].bytes(features_path);
        if (f_bytes.size() > features_max_bytes)
            throw decode_error(features_path, fmt::format("numeric value exceeds max_bytes ({}): {} bytes", features_max_bytes, f_bytes.size()));
        if (!f_bytes.empty() && f_bytes[0] == 0)
            throw decode_error(features_path, "non-canonical numeric value with leading zero bytes");
        res.features = narrow_cast<uint32_t>(big_int_from_bytes(f_bytes));
        for (size_t i = 1; i < elems.size(); ++i)
            res.unused.emplace_back(elems[i].bytes(fmt::format("{}[{}]", path, i)));
        if (!res.unused.empty() && res.unused.back().empty())
            throw decode_error(path, "reserved fields are not trimmed: the last unused entry is empty");
        if (res.empty())
            throw decode_error(path, "an empty reserved field must be encoded as the empty list");
        return res;
    }

    rlp::kind reserved_kind()
    {
        return rlp::array_of(rlp::raw_buffer());
    }
}
