/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */

extern "C" {
#   include <sodium.h>
}
#include <thor/crypto/random.hpp>

namespace thor_sdk::crypto {
    struct sodium_initializer {
        sodium_initializer() {
            if (sodium_init() == -1)
                throw error("failed to initialize libsodium");
        }
    };

    void ensure_sodium_initialized()
    {
        // initialized on the first call only
        static sodium_initializer init {};
    }

    void random_bytes(const std::span<uint8_t> out)
    {
        ensure_sodium_initialized();
        randombytes_buf(out.data(), out.size());
    }
}
