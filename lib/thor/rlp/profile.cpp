/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <thor/logger.hpp>
#include <thor/rlp/profile.hpp>

namespace thor_sdk::rlp {
    uint8_vector encode_object(const value &obj, const profile &p)
    {
        const auto tree = p.type.encode(obj, p.name);
        auto res = encode(tree);
        logger::trace("encoded {} as {} bytes", p.name, res.size());
        return res;
    }

    value decode_object(const buffer data, const profile &p)
    {
        return decode_object(decode(data, p.name), p);
    }

    value decode_object(const item &tree, const profile &p)
    {
        return p.type.decode(tree, p.name);
    }
}
