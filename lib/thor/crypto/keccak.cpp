/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <hash-library/keccak.h>
#include <thor/crypto/keccak.hpp>

namespace thor_sdk::crypto::keccak {
    void digest(const std::span<uint8_t> out, const buffer &in)
    {
        if (out.size() != sizeof(hash_256))
            throw error(fmt::format("keccak-256 output must have {} bytes but got {}", sizeof(hash_256), out.size()));
        Keccak hasher { Keccak::Keccak256 };
        hasher.add(in.data(), in.size());
        init_from_hex(out, hasher.getHash());
    }
}
