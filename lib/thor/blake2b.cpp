/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */

extern "C" {
#   include <sodium.h>
}
#include <thor/blake2b.hpp>
#include <thor/crypto/random.hpp>

namespace thor_sdk {
    void blake2b_sodium(const std::span<uint8_t> out, const std::initializer_list<buffer> parts)
    {
        crypto::ensure_sodium_initialized();
        crypto_generichash_state state;
        if (crypto_generichash_init(&state, nullptr, 0, out.size()) != 0)
            throw error(fmt::format("libsodium error: can't initialize a {}-byte blake2b hash", out.size()));
        for (const auto &part: parts) {
            if (crypto_generichash_update(&state, part.data(), part.size()) != 0)
                throw error("libsodium error: can't update a blake2b hash");
        }
        if (crypto_generichash_final(&state, out.data(), out.size()) != 0)
            throw error("libsodium error: can't finalize a blake2b hash");
    }
}
