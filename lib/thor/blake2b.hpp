/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THOR_SDK_BLAKE2B_HPP
#define THOR_SDK_BLAKE2B_HPP

#include <initializer_list>
#include <thor/array.hpp>
#include <thor/common/bytes.hpp>

namespace thor_sdk {
    using blake2b_256_hash = byte_array<32>;

    extern void blake2b_sodium(std::span<uint8_t> out, std::initializer_list<buffer> parts);

    inline blake2b_256_hash blake2b_256(const buffer in)
    {
        blake2b_256_hash out;
        blake2b_sodium(out, { in });
        return out;
    }

    // the hash of the concatenation of the parts
    inline blake2b_256_hash blake2b_256(const buffer first, const buffer second)
    {
        blake2b_256_hash out;
        blake2b_sodium(out, { first, second });
        return out;
    }
}

#endif // !THOR_SDK_BLAKE2B_HPP
