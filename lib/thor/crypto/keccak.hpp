/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THOR_SDK_CRYPTO_KECCAK_HPP
#define THOR_SDK_CRYPTO_KECCAK_HPP

#include <thor/array.hpp>
#include <thor/common/bytes.hpp>

namespace thor_sdk::crypto::keccak
{
    using hash_256 = byte_array<32>;

    extern void digest(std::span<uint8_t> out, const buffer &in);

    inline hash_256 digest(const buffer &in)
    {
        hash_256 out;
        digest(out, in);
        return out;
    }
}

#endif // !THOR_SDK_CRYPTO_KECCAK_HPP
